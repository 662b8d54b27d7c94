#include <gtest/gtest.h>

#include <cctv/discovery/ws_discovery.h>

namespace cctv {
namespace discovery {
namespace test {

namespace {

QByteArray probeMatches(const QByteArray& matches)
{
    return
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<SOAP-ENV:Envelope xmlns:SOAP-ENV=\"http://www.w3.org/2003/05/soap-envelope\" "
            "xmlns:wsa=\"http://schemas.xmlsoap.org/ws/2004/08/addressing\" "
            "xmlns:d=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\">"
        "<SOAP-ENV:Header>"
        "<wsa:MessageID>uuid:7f1c8e2a-0000-4000-8000-000000000001</wsa:MessageID>"
        "</SOAP-ENV:Header>"
        "<SOAP-ENV:Body><d:ProbeMatches>" + matches + "</d:ProbeMatches></SOAP-ENV:Body>"
        "</SOAP-ENV:Envelope>";
}

} // namespace

TEST(WsDiscovery, probe_message_asks_for_video_transmitters)
{
    const QByteArray message =
        WsDiscoveryProbe::makeProbeMessage("0a1b2c3d-0000-4000-8000-000000000000");

    ASSERT_TRUE(message.contains(
        "<a:MessageID>uuid:0a1b2c3d-0000-4000-8000-000000000000</a:MessageID>"));
    ASSERT_TRUE(message.contains("dn:NetworkVideoTransmitter"));
    ASSERT_TRUE(message.contains("http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe"));
}

TEST(WsDiscovery, probe_match_is_parsed)
{
    const auto matches = WsDiscoveryProbe::parseProbeMatches(probeMatches(
        "<d:ProbeMatch>"
        "<wsa:EndpointReference>"
        "<wsa:Address>urn:uuid:a1b2c3d4-0000-4000-8000-4419b6123456</wsa:Address>"
        "</wsa:EndpointReference>"
        "<d:Types>dn:NetworkVideoTransmitter</d:Types>"
        "<d:Scopes>onvif://www.onvif.org/type/video_encoder "
            "onvif://www.onvif.org/name/HIKVISION\n"
            "onvif://www.onvif.org/hardware/DS-2CD2043G0-I</d:Scopes>"
        "<d:XAddrs>http://192.168.1.64/onvif/device_service "
            "http://[fe80::4619:b6ff:fe12:3456]/onvif/device_service</d:XAddrs>"
        "<d:MetadataVersion>10</d:MetadataVersion>"
        "</d:ProbeMatch>"));

    ASSERT_EQ(1U, matches.size());
    ASSERT_EQ("192.168.1.64", matches[0].address);
    ASSERT_EQ("http://192.168.1.64/onvif/device_service", matches[0].serviceUrl);
    ASSERT_EQ("urn:uuid:a1b2c3d4-0000-4000-8000-4419b6123456", matches[0].endpointReference);
    ASSERT_EQ(3, matches[0].scopes.size());
    ASSERT_EQ("onvif://www.onvif.org/name/HIKVISION", matches[0].scopes[1]);
}

TEST(WsDiscovery, non_http_addresses_are_skipped)
{
    const auto matches = WsDiscoveryProbe::parseProbeMatches(probeMatches(
        "<d:ProbeMatch>"
        "<d:XAddrs>soap.udp://10.0.0.7:3702 https://10.0.0.7:8443/onvif/device_service</d:XAddrs>"
        "</d:ProbeMatch>"
        "<d:ProbeMatch>"
        "<d:XAddrs>soap.udp://10.0.0.8:3702</d:XAddrs>"
        "</d:ProbeMatch>"));

    ASSERT_EQ(1U, matches.size());
    ASSERT_EQ("10.0.0.7", matches[0].address);
    ASSERT_EQ("https://10.0.0.7:8443/onvif/device_service", matches[0].serviceUrl);
}

TEST(WsDiscovery, garbage_yields_no_matches)
{
    ASSERT_TRUE(WsDiscoveryProbe::parseProbeMatches("not xml at all").empty());
    ASSERT_TRUE(WsDiscoveryProbe::parseProbeMatches(probeMatches("")).empty());
}

} // namespace test
} // namespace discovery
} // namespace cctv
