#include <gtest/gtest.h>

#include <cctv/discovery/onvif_messages.h>

namespace cctv {
namespace discovery {
namespace onvif {
namespace test {

namespace {

QByteArray response(const QByteArray& body)
{
    return
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<SOAP-ENV:Envelope xmlns:SOAP-ENV=\"http://www.w3.org/2003/05/soap-envelope\" "
            "xmlns:tds=\"http://www.onvif.org/ver10/device/wsdl\" "
            "xmlns:trt=\"http://www.onvif.org/ver10/media/wsdl\" "
            "xmlns:tt=\"http://www.onvif.org/ver10/schema\" "
            "xmlns:ter=\"http://www.onvif.org/ver10/error\">"
        "<SOAP-ENV:Body>" + body + "</SOAP-ENV:Body>"
        "</SOAP-ENV:Envelope>";
}

} // namespace

TEST(OnvifRequests, envelope_carries_security_header)
{
    const QByteArray envelope = makeEnvelope(getDeviceInformationRequest(), "<Security/>");

    ASSERT_TRUE(envelope.contains("<s:Header><Security/></s:Header>"));
    ASSERT_TRUE(envelope.contains("GetDeviceInformation"));
    ASSERT_FALSE(makeEnvelope(getProfilesRequest()).contains("Header"));
}

TEST(OnvifRequests, stream_uri_request_escapes_token)
{
    const QByteArray request = getStreamUriRequest("a<b&c");

    ASSERT_TRUE(request.contains("<ProfileToken>a&lt;b&amp;c</ProfileToken>"));
    ASSERT_TRUE(request.contains("RTP-Unicast"));
    ASSERT_TRUE(request.contains("<Protocol>RTSP</Protocol>"));
}

TEST(OnvifResponses, device_information)
{
    const auto information = parseDeviceInformation(response(
        "<tds:GetDeviceInformationResponse>"
        "<tds:Manufacturer>HIKVISION</tds:Manufacturer>"
        "<tds:Model> DS-2CD2043G0-I </tds:Model>"
        "<tds:FirmwareVersion>V5.5.0 build 170725</tds:FirmwareVersion>"
        "<tds:SerialNumber>DS-2CD2043G0-I20170101AAWR123456789</tds:SerialNumber>"
        "<tds:HardwareId>88</tds:HardwareId>"
        "</tds:GetDeviceInformationResponse>"));

    ASSERT_TRUE(static_cast<bool>(information));
    ASSERT_EQ("HIKVISION", information->manufacturer);
    ASSERT_EQ("DS-2CD2043G0-I", information->model);
    ASSERT_EQ("V5.5.0 build 170725", information->firmwareVersion);
    ASSERT_EQ("DS-2CD2043G0-I20170101AAWR123456789", information->serialNumber);
    ASSERT_EQ("88", information->hardwareId);
}

TEST(OnvifResponses, device_information_requires_response_element)
{
    ASSERT_FALSE(static_cast<bool>(parseDeviceInformation(response(
        "<tds:GetSystemDateAndTimeResponse/>"))));
    ASSERT_FALSE(static_cast<bool>(parseDeviceInformation("<html><body>Login</body>")));
}

TEST(OnvifResponses, system_date_and_time_uses_utc)
{
    const auto dateTime = parseSystemDateAndTime(response(
        "<tds:GetSystemDateAndTimeResponse><tds:SystemDateAndTime>"
        "<tt:DateTimeType>NTP</tt:DateTimeType>"
        "<tt:UTCDateTime>"
        "<tt:Time><tt:Hour>10</tt:Hour><tt:Minute>30</tt:Minute><tt:Second>5</tt:Second></tt:Time>"
        "<tt:Date><tt:Year>2024</tt:Year><tt:Month>1</tt:Month><tt:Day>15</tt:Day></tt:Date>"
        "</tt:UTCDateTime>"
        "<tt:LocalDateTime>"
        "<tt:Time><tt:Hour>16</tt:Hour><tt:Minute>0</tt:Minute><tt:Second>5</tt:Second></tt:Time>"
        "<tt:Date><tt:Year>2024</tt:Year><tt:Month>1</tt:Month><tt:Day>15</tt:Day></tt:Date>"
        "</tt:LocalDateTime>"
        "</tds:SystemDateAndTime></tds:GetSystemDateAndTimeResponse>"));

    ASSERT_TRUE(static_cast<bool>(dateTime));
    ASSERT_EQ(QDateTime(QDate(2024, 1, 15), QTime(10, 30, 5), Qt::UTC), *dateTime);
}

TEST(OnvifResponses, system_date_and_time_without_utc_is_rejected)
{
    ASSERT_FALSE(static_cast<bool>(parseSystemDateAndTime(response(
        "<tds:GetSystemDateAndTimeResponse><tds:SystemDateAndTime>"
        "<tt:LocalDateTime><tt:Date><tt:Year>2024</tt:Year></tt:Date></tt:LocalDateTime>"
        "</tds:SystemDateAndTime></tds:GetSystemDateAndTimeResponse>"))));
}

TEST(OnvifResponses, media_service_url)
{
    const auto url = parseMediaServiceUrl(response(
        "<tds:GetCapabilitiesResponse><tds:Capabilities>"
        "<tt:Device><tt:XAddr>http://10.0.0.5/onvif/device_service</tt:XAddr></tt:Device>"
        "<tt:Media><tt:XAddr>http://10.0.0.5/onvif/Media</tt:XAddr></tt:Media>"
        "</tds:Capabilities></tds:GetCapabilitiesResponse>"));

    ASSERT_EQ("http://10.0.0.5/onvif/Media", url.get_value_or(QString()));
}

TEST(OnvifResponses, video_source_tokens)
{
    const QStringList tokens = parseVideoSourceTokens(response(
        "<trt:GetVideoSourcesResponse>"
        "<trt:VideoSources token=\"VideoSource_1\"><tt:Framerate>25</tt:Framerate>"
        "</trt:VideoSources>"
        "<trt:VideoSources token=\"VideoSource_2\"/>"
        "</trt:GetVideoSourcesResponse>"));

    ASSERT_EQ(QStringList({"VideoSource_1", "VideoSource_2"}), tokens);
}

TEST(OnvifResponses, profiles)
{
    const auto profiles = parseProfiles(response(
        "<trt:GetProfilesResponse>"
        "<trt:Profiles token=\"Profile_1\" fixed=\"true\">"
            "<tt:Name>mainStream</tt:Name>"
            "<tt:VideoSourceConfiguration token=\"VideoSourceToken\">"
                "<tt:Name>VideoSourceConfig</tt:Name>"
                "<tt:SourceToken>VideoSource_1</tt:SourceToken>"
            "</tt:VideoSourceConfiguration>"
            "<tt:AudioEncoderConfiguration token=\"AudioEncoderToken\">"
                "<tt:Encoding>G711</tt:Encoding>"
            "</tt:AudioEncoderConfiguration>"
            "<tt:VideoEncoderConfiguration token=\"VideoEncoderToken_1\">"
                "<tt:Name>VideoEncoder_1</tt:Name>"
                "<tt:Encoding>H264</tt:Encoding>"
                "<tt:Resolution><tt:Width>1920</tt:Width><tt:Height>1080</tt:Height>"
                "</tt:Resolution>"
                "<tt:RateControl><tt:FrameRateLimit>25</tt:FrameRateLimit>"
                "<tt:EncodingInterval>1</tt:EncodingInterval>"
                "<tt:BitrateLimit>4096</tt:BitrateLimit></tt:RateControl>"
                "<tt:H264><tt:GovLength>50</tt:GovLength>"
                "<tt:H264Profile>Main</tt:H264Profile></tt:H264>"
            "</tt:VideoEncoderConfiguration>"
        "</trt:Profiles>"
        "<trt:Profiles token=\"Profile_2\">"
            "<tt:Name>subStream</tt:Name>"
            "<tt:VideoEncoderConfiguration>"
                "<tt:Encoding>H264</tt:Encoding>"
                "<tt:Resolution><tt:Width>640</tt:Width><tt:Height>360</tt:Height>"
                "</tt:Resolution>"
                "<tt:RateControl><tt:FrameRateLimit>0</tt:FrameRateLimit>"
                "<tt:BitrateLimit>0</tt:BitrateLimit></tt:RateControl>"
            "</tt:VideoEncoderConfiguration>"
        "</trt:Profiles>"
        "<trt:Profiles token=\"Profile_3\"><tt:Name>audioOnly</tt:Name></trt:Profiles>"
        "</trt:GetProfilesResponse>"));

    ASSERT_EQ(3U, profiles.size());

    const MediaProfile& main = profiles[0];
    ASSERT_EQ("Profile_1", main.token);
    ASSERT_EQ("mainStream", main.name);
    ASSERT_EQ("VideoSource_1", main.videoSourceToken);
    ASSERT_EQ("H264", main.encoding);
    ASSERT_EQ(1920, main.width);
    ASSERT_EQ(1080, main.height);
    ASSERT_EQ(25.0, main.frameRate.get_value_or(0));
    ASSERT_EQ(4096, main.bitrateKbps.get_value_or(0));
    ASSERT_EQ("Main", main.h264Profile);

    const MediaProfile& sub = profiles[1];
    ASSERT_EQ("subStream", sub.name);
    ASSERT_EQ(360, sub.height);
    ASSERT_FALSE(static_cast<bool>(sub.frameRate));
    ASSERT_FALSE(static_cast<bool>(sub.bitrateKbps));

    ASSERT_FALSE(profiles[2].hasVideo());
}

TEST(OnvifResponses, stream_uri)
{
    const auto uri = parseStreamUri(response(
        "<trt:GetStreamUriResponse><trt:MediaUri>"
        "<tt:Uri>rtsp://10.0.0.5:554/Streaming/Channels/101?transportmode=unicast</tt:Uri>"
        "<tt:InvalidAfterConnect>false</tt:InvalidAfterConnect>"
        "</trt:MediaUri></trt:GetStreamUriResponse>"));

    ASSERT_EQ(
        "rtsp://10.0.0.5:554/Streaming/Channels/101?transportmode=unicast",
        uri.get_value_or(QString()));
    ASSERT_FALSE(static_cast<bool>(parseStreamUri(response("<trt:GetStreamUriResponse/>"))));
}

TEST(OnvifResponses, not_authorized_fault)
{
    const QByteArray fault = response(
        "<SOAP-ENV:Fault>"
        "<SOAP-ENV:Code><SOAP-ENV:Value>SOAP-ENV:Sender</SOAP-ENV:Value>"
        "<SOAP-ENV:Subcode><SOAP-ENV:Value>ter:NotAuthorized</SOAP-ENV:Value></SOAP-ENV:Subcode>"
        "</SOAP-ENV:Code>"
        "<SOAP-ENV:Reason><SOAP-ENV:Text xml:lang=\"en\">Sender not Authorized</SOAP-ENV:Text>"
        "</SOAP-ENV:Reason>"
        "</SOAP-ENV:Fault>");

    ASSERT_EQ(
        "SOAP-ENV:Sender; ter:NotAuthorized; Sender not Authorized",
        parseFault(fault).get_value_or(QString()));
    ASSERT_TRUE(isNotAuthorizedFault(fault));
}

TEST(OnvifResponses, other_fault_is_not_authorization_failure)
{
    const QByteArray fault = response(
        "<SOAP-ENV:Fault>"
        "<SOAP-ENV:Code><SOAP-ENV:Value>SOAP-ENV:Receiver</SOAP-ENV:Value></SOAP-ENV:Code>"
        "<SOAP-ENV:Reason><SOAP-ENV:Text>Action not supported</SOAP-ENV:Text></SOAP-ENV:Reason>"
        "</SOAP-ENV:Fault>");

    ASSERT_TRUE(static_cast<bool>(parseFault(fault)));
    ASSERT_FALSE(isNotAuthorizedFault(fault));
    ASSERT_FALSE(static_cast<bool>(parseFault(response("<tds:GetDeviceInformationResponse/>"))));
}

} // namespace test
} // namespace onvif
} // namespace discovery
} // namespace cctv
