#include <gtest/gtest.h>

#include <cctv/discovery/device_discovery_pipeline.h>

#include "test_support/fake_camera_network.h"

namespace cctv {
namespace discovery {
namespace test {

using namespace network;

namespace {

static const QString kAddress = "10.0.0.5";

} // namespace

class DeviceDiscoveryPipeline:
    public ::testing::Test
{
protected:
    void givenCamera(FakeCamera camera)
    {
        m_network.addCamera(kAddress, std::move(camera));
    }

    void givenCredentials(std::vector<auth::Credential> credentials)
    {
        m_credentials = std::move(credentials);
    }

    void givenScanIsCancelled()
    {
        m_interrupted = true;
    }

    void whenRunPipeline()
    {
        discovery::DeviceDiscoveryPipeline pipeline(
            &m_network,
            &m_network,
            &m_network,
            m_settings,
            m_ouiDatabase,
            m_credentials,
            &m_pathCache,
            [this]() { return m_interrupted; });
        pipeline.run(&m_device);
    }

    void thenStatusIs(DeviceStatus status)
    {
        ASSERT_TRUE(m_device.status() == status)
            << toString(m_device.status()).toStdString() << ": "
            << m_device.errorMessage().get_value_or(QString()).toStdString();
    }

    void thenErrorIs(const QString& message)
    {
        ASSERT_EQ(message, m_device.errorMessage().get_value_or(QString()));
    }

    void thenStreamNamesAre(const QStringList& expected)
    {
        QStringList names;
        for (const auto& stream: m_device.streams)
            names.append(stream.streamName);
        ASSERT_EQ(expected, names);
    }

    const RtspStream& stream(std::size_t index) const { return m_device.streams.at(index); }

    FakeCameraNetwork m_network;
    ScanSettings m_settings;
    Device m_device{kAddress};

private:
    OuiDatabase m_ouiDatabase;
    RtspPathCache m_pathCache;
    std::vector<auth::Credential> m_credentials{{"admin", "wrong"}, {"admin", "12345"}};
    bool m_interrupted = false;
};

TEST_F(DeviceDiscoveryPipeline, onvif_camera_is_described_completely)
{
    givenCamera(makeOnvifCamera());

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_FALSE(static_cast<bool>(m_device.errorMessage()));
    ASSERT_TRUE(m_device.authMethod == auth::AuthMethod::basic);
    ASSERT_EQ(
        auth::Credential("admin", "12345"),
        m_device.credential.get_value_or(auth::Credential()));
    ASSERT_FALSE(m_device.authFailed);
    ASSERT_TRUE(static_cast<bool>(m_device.onvifServiceUrl));

    ASSERT_EQ("44:19:B6:12:34:56", m_device.hardwareAddress.get_value_or(QString()));
    ASSERT_EQ("HIKVISION", m_device.manufacturer);
    ASSERT_EQ("DS-2CD2043G0-I", m_device.model);
    ASSERT_EQ("HIKVISION DS-2CD2043G0-I", m_device.name);
    ASSERT_EQ("V5.5.0 build 170725", m_device.firmwareVersion);
    ASSERT_EQ("IP Camera", m_device.type);
    ASSERT_FALSE(m_device.isNvr);

    ASSERT_TRUE(static_cast<bool>(m_device.clockOffsetSeconds));
    ASSERT_NEAR(120, *m_device.clockOffsetSeconds, 10);

    thenStreamNamesAre({"mainStream", "subStream"});
    ASSERT_EQ(QString("rtsp://%1:554/Streaming/Channels/101").arg(kAddress), stream(0).url);
    ASSERT_EQ("H.264", stream(0).codec);
    ASSERT_EQ("1920x1080", stream(0).resolution);
    ASSERT_EQ("VideoSource_1", stream(0).videoSourceName);
    ASSERT_EQ("Media Presentation", stream(0).sdpSessionName.get_value_or(QString()));
    ASSERT_TRUE(stream(0).compliant);
    ASSERT_EQ("640x360", stream(1).resolution);
    ASSERT_TRUE(stream(1).compliant);
}

TEST_F(DeviceDiscoveryPipeline, several_video_sources_mark_nvr)
{
    FakeCamera camera = makeOnvifCamera();
    camera.videoSources = QStringList{"VideoSource_1", "VideoSource_2"};
    givenCamera(camera);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_TRUE(m_device.isNvr);
    ASSERT_EQ("NVR/DVR", m_device.type);
}

TEST_F(DeviceDiscoveryPipeline, rtsp_only_camera_streams_are_guessed)
{
    givenCamera(makeRtspCamera());

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_EQ("Hikvision", m_device.manufacturer);
    ASSERT_FALSE(static_cast<bool>(m_device.onvifServiceUrl));
    ASSERT_TRUE(m_device.authMethod == auth::AuthMethod::basic);
    ASSERT_EQ(
        auth::Credential("admin", "12345"),
        m_device.credential.get_value_or(auth::Credential()));

    thenStreamNamesAre({"Main", "Sub"});
    ASSERT_EQ(QString("rtsp://%1:554/Streaming/Channels/102").arg(kAddress), stream(1).url);
    ASSERT_EQ("Main", stream(0).profile);
    ASSERT_EQ(4096, stream(0).bitrateKbps.get_value_or(0));
    ASSERT_TRUE(stream(0).compliant);
    ASSERT_TRUE(stream(1).compliant);
}

TEST_F(DeviceDiscoveryPipeline, nvr_channels_are_iterated)
{
    FakeCamera camera = makeRtspCamera();
    camera.openPorts.insert(8000);
    camera.rtspStreams["/Streaming/Channels/201"] = sdp::kMainStream;
    camera.rtspStreams["/Streaming/Channels/202"] = sdp::kSubStream;
    givenCamera(camera);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_TRUE(m_device.isNvr);
    ASSERT_EQ("NVR/DVR", m_device.type);
    ASSERT_EQ(std::set<int>{8000}, m_device.specialPorts);
    thenStreamNamesAre({"CH1 Main", "CH1 Sub", "CH2 Main", "CH2 Sub"});
    ASSERT_EQ("Channel 2", stream(2).channelName);
}

TEST_F(DeviceDiscoveryPipeline, unsupported_stream_is_reported_not_failed)
{
    FakeCamera camera = makeRtspCamera();
    camera.rtspStreams = {{"/Streaming/Channels/101", sdp::kMjpegStream}};
    givenCamera(camera);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_EQ(1U, m_device.streams.size());
    ASSERT_EQ("MJPEG", stream(0).codec);
    ASSERT_FALSE(stream(0).compliant);
    ASSERT_EQ("Codec MJPEG not accepted", stream(0).complianceIssues.get_value_or(QString()));
}

TEST_F(DeviceDiscoveryPipeline, device_without_open_ports_is_not_contacted)
{
    FakeCamera camera;
    camera.hardwareAddress = QString("44:19:B6:00:00:01");
    givenCamera(camera);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::error);
    thenErrorIs("No management, streaming or vendor ports open");
    ASSERT_EQ(0, m_network.requestCount());
    ASSERT_TRUE(m_device.onvifPorts.empty());
    ASSERT_TRUE(m_device.rtspPorts.empty());
    ASSERT_FALSE(static_cast<bool>(m_device.hardwareAddress));
}

TEST_F(DeviceDiscoveryPipeline, device_rejecting_every_scheme_ends_in_auth_failure)
{
    FakeCamera camera = makeOnvifCamera();
    camera.offerDigestChallenge = true;
    givenCamera(camera);
    givenCredentials({{"admin", "wrong"}, {"root", "pass"}});

    whenRunPipeline();

    thenStatusIs(DeviceStatus::authFailed);
    thenErrorIs("Digest authentication rejected (401 Unauthorized)");
    ASSERT_TRUE(m_device.authFailed);
    ASSERT_FALSE(static_cast<bool>(m_device.credential));
    ASSERT_TRUE(m_device.streams.empty());
    ASSERT_EQ(std::set<int>{80}, m_device.onvifPorts);
    ASSERT_EQ(
        (std::set<QString>{"Basic", "Digest", "WS-Security"}),
        m_network.authenticationSchemes());
}

TEST_F(DeviceDiscoveryPipeline, web_server_without_streaming_port_is_unknown_device_type)
{
    FakeCamera router;
    router.openPorts = {80};
    router.requiresAuthentication = false;
    givenCamera(router);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::authFailed);
    thenErrorIs("Unknown device type");
    ASSERT_FALSE(m_device.authFailed);
    ASSERT_FALSE(static_cast<bool>(m_device.credential));
    ASSERT_TRUE(m_device.streams.empty());
}

TEST_F(DeviceDiscoveryPipeline, announced_onvif_service_rejecting_credentials_is_auth_failure)
{
    FakeCamera camera = makeOnvifCamera();
    camera.openPorts = {80};
    givenCamera(camera);
    givenCredentials({{"admin", "wrong"}});
    m_device.onvifServiceUrl = QString("http://%1:80/onvif/device_service").arg(kAddress);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::authFailed);
    ASSERT_TRUE(m_device.authFailed);
    ASSERT_NE(QString("Unknown device type"), m_device.errorMessage().get_value_or(QString()));
}

TEST_F(DeviceDiscoveryPipeline, open_camera_needs_no_credentials)
{
    FakeCamera camera = makeRtspCamera();
    camera.requiresAuthentication = false;
    givenCamera(camera);
    givenCredentials({});

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_TRUE(m_device.authMethod == auth::AuthMethod::none);
    ASSERT_FALSE(static_cast<bool>(m_device.credential));
    ASSERT_EQ(2U, m_device.streams.size());
}

TEST_F(DeviceDiscoveryPipeline, silent_services_are_an_error)
{
    FakeCamera camera = makeOnvifCamera();
    camera.responding = false;
    givenCamera(camera);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::error);
    thenErrorIs("Service did not respond");
    ASSERT_FALSE(m_device.authFailed);
}

TEST_F(DeviceDiscoveryPipeline, vendor_port_only_device_is_an_error)
{
    FakeCamera camera;
    camera.openPorts = {37777};
    givenCamera(camera);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::error);
    thenErrorIs("Service did not respond");
    ASSERT_TRUE(m_device.isNvr);
}

TEST_F(DeviceDiscoveryPipeline, cancelled_scan_does_not_start)
{
    givenCamera(makeOnvifCamera());
    givenScanIsCancelled();

    whenRunPipeline();

    thenStatusIs(DeviceStatus::error);
    thenErrorIs("Scan cancelled");
    ASSERT_EQ(0, m_network.requestCount());
}

TEST_F(DeviceDiscoveryPipeline, without_mac_only_generic_paths_are_tried)
{
    m_settings.macResolution = false;
    givenCamera(makeRtspCamera());

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_FALSE(static_cast<bool>(m_device.hardwareAddress));
    ASSERT_TRUE(m_device.manufacturer.isEmpty());
    ASSERT_TRUE(m_device.streams.empty());
}

TEST_F(DeviceDiscoveryPipeline, discovered_service_url_is_tried_first)
{
    givenCamera(makeOnvifCamera());
    m_device.onvifServiceUrl = QString("http://%1:80/onvif/device_service").arg(kAddress);

    whenRunPipeline();

    thenStatusIs(DeviceStatus::completed);
    ASSERT_EQ(
        QString("http://%1:80/onvif/device_service").arg(kAddress),
        m_network.requestedUrls(kAddress).first());
}

} // namespace test
} // namespace discovery
} // namespace cctv
