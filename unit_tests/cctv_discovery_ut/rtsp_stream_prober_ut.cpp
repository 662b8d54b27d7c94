#include <gtest/gtest.h>

#include <cctv/discovery/rtsp_stream_prober.h>

#include "test_support/fake_camera_network.h"

namespace cctv {
namespace discovery {
namespace test {

TEST(NvrChannelPattern, placeholders_are_resolved)
{
    ASSERT_EQ("/Streaming/Channels/301", NvrChannelPattern::resolve(
        "/Streaming/Channels/{channel*100+1}", 3));
    ASSERT_EQ("/Streaming/Channels/302", NvrChannelPattern::resolve(
        "/Streaming/Channels/{channel*100+2}", 3));
    ASSERT_EQ("/cam/realmonitor?channel=12&subtype=0", NvrChannelPattern::resolve(
        "/cam/realmonitor?channel={channel}&subtype=0", 12));
    ASSERT_EQ("/ch05/0", NvrChannelPattern::resolve("/ch{channel01}/0", 5));
    ASSERT_EQ("/media/video104", NvrChannelPattern::resolve("/media/video{channel+100}", 4));
}

TEST(RtspStreamProberPaths, vendor_specific_nvr_patterns)
{
    ASSERT_EQ(
        "/Streaming/Channels/201",
        discovery::RtspStreamProber::nvrPattern("Hikvision").mainPath(2));
    ASSERT_EQ(
        "/cam/realmonitor?channel=2&subtype=1",
        discovery::RtspStreamProber::nvrPattern("CP Plus").subPath(2));
    ASSERT_EQ("/media/video102", discovery::RtspStreamProber::nvrPattern("UNV").subPath(2));
    ASSERT_EQ("/ch02/0", discovery::RtspStreamProber::nvrPattern("Unknown Vendor").mainPath(2));
    ASSERT_EQ("/ch02/1", discovery::RtspStreamProber::nvrPattern("").subPath(2));
}

TEST(RtspStreamProberPaths, manufacturer_paths)
{
    ASSERT_EQ(
        "/Streaming/Channels/101",
        discovery::RtspStreamProber::manufacturerPaths("Hikvision").first());
    ASSERT_EQ(
        "/cam/realmonitor?channel=1&subtype=0",
        discovery::RtspStreamProber::manufacturerPaths("Zhejiang Dahua Technology").first());
    ASSERT_EQ(
        "/axis-media/media.amp",
        discovery::RtspStreamProber::manufacturerPaths("AXIS").first());
    ASSERT_TRUE(discovery::RtspStreamProber::manufacturerPaths("Unknown").isEmpty());
    ASSERT_TRUE(discovery::RtspStreamProber::manufacturerPaths("").isEmpty());
}

TEST(RtspStreamProberPaths, substream_is_guessed_from_main_path)
{
    const auto guess =
        [](const QString& path) { return discovery::RtspStreamProber::guessSubstreamPath(path); };

    ASSERT_EQ("/Streaming/Channels/102", guess("/Streaming/Channels/101").get_value_or(""));
    ASSERT_EQ(
        "/cam/realmonitor?channel=1&subtype=1",
        guess("/cam/realmonitor?channel=1&subtype=0").get_value_or(""));
    ASSERT_EQ("/h264/ch1/sub/av_stream", guess("/h264/ch1/main/av_stream").get_value_or(""));
    ASSERT_EQ("/live/ch00_1", guess("/live/ch00_0").get_value_or(""));
    ASSERT_EQ("/live/1", guess("/live").get_value_or(""));
    ASSERT_FALSE(static_cast<bool>(guess("/axis-media/media.amp")));
}

TEST(RtspStreamProberPaths, url)
{
    ASSERT_EQ(
        "rtsp://10.0.0.5:554/Streaming/Channels/101",
        discovery::RtspStreamProber::makeUrl("10.0.0.5", 554, "/Streaming/Channels/101"));
}

TEST(RtspPathCache, paths_are_remembered_per_prefix)
{
    RtspPathCache cache;
    cache.remember("44:19:B6", "/Streaming/Channels/101");
    cache.remember("44:19:B6", "/Streaming/Channels/101");
    cache.remember("44:19:B6", "/Streaming/Channels/102");

    ASSERT_EQ(
        (QStringList{"/Streaming/Channels/101", "/Streaming/Channels/102"}),
        cache.paths("44:19:B6"));
    ASSERT_TRUE(cache.paths("3C:EF:8C").isEmpty());
}

//-------------------------------------------------------------------------------------------------

class RtspStreamProber:
    public ::testing::Test
{
protected:
    RtspStreamProber():
        m_prober(&m_network, m_settings, {{"admin", "wrong"}, {"admin", "12345"}}, &m_pathCache)
    {
        m_device.rtspPorts = {554};
    }

    void givenCamera(FakeCamera camera)
    {
        m_network.addCamera(m_device.address, std::move(camera));
    }

    QStringList streamNames(const std::vector<RtspStream>& streams) const
    {
        QStringList names;
        for (const auto& stream: streams)
            names.append(stream.streamName);
        return names;
    }

    FakeCameraNetwork m_network;
    ScanSettings m_settings;
    RtspPathCache m_pathCache;
    discovery::RtspStreamProber m_prober;
    Device m_device{"10.0.0.9"};
};

TEST_F(RtspStreamProber, describe_reports_sdp_details)
{
    givenCamera(makeRtspCamera());

    const auto stream = m_prober.describe("rtsp://10.0.0.9:554/Streaming/Channels/101");

    ASSERT_TRUE(static_cast<bool>(stream));
    ASSERT_EQ("H.264", stream->codec);
    ASSERT_EQ("1920x1080", stream->resolution);
    ASSERT_EQ(25.0, stream->frameRate.get_value_or(0));
    ASSERT_EQ(
        auth::Credential("admin", "12345"),
        m_prober.acceptedCredential().get_value_or(auth::Credential()));
}

TEST_F(RtspStreamProber, describe_of_missing_path_finds_nothing)
{
    givenCamera(makeRtspCamera());

    ASSERT_FALSE(static_cast<bool>(m_prober.describe("rtsp://10.0.0.9:554/nothing")));
}

TEST_F(RtspStreamProber, configured_paths_are_tried_before_generic_ones)
{
    FakeCamera camera = makeRtspCamera();
    camera.rtspStreams = {{"/custom/main", sdp::kMainStream}, {"/custom/sub", sdp::kSubStream}};
    givenCamera(camera);
    m_settings.customRtspPaths = {{"/custom/main", "/custom/sub"}};

    const auto streams = m_prober.discoverStreams(m_device);

    ASSERT_EQ((QStringList{"Main", "Sub"}), streamNames(streams));
    ASSERT_EQ("rtsp://10.0.0.9:554/custom/sub", streams[1].url);
}

TEST_F(RtspStreamProber, working_paths_are_shared_by_mac_prefix)
{
    FakeCamera camera = makeRtspCamera();
    camera.rtspStreams = {{"/stream1", sdp::kMainStream}, {"/stream2", sdp::kSubStream}};
    givenCamera(camera);
    m_device.hardwareAddress = QString("02:11:22:33:44:55");

    const auto streams = m_prober.discoverStreams(m_device);

    ASSERT_EQ((QStringList{"Main", "Sub"}), streamNames(streams));
    ASSERT_EQ((QStringList{"/stream1", "/stream2"}), m_pathCache.paths("02:11:22"));
}

TEST_F(RtspStreamProber, alias_of_main_stream_is_not_a_second_main)
{
    FakeCamera camera = makeRtspCamera();
    camera.rtspStreams = {
        {"/live", sdp::kMainStream},
        {"/live/0", sdp::kMainStream},
        {"/stream2", sdp::kSubStream}};
    givenCamera(camera);

    const auto streams = m_prober.discoverStreams(m_device);

    ASSERT_EQ((QStringList{"Main", "Sub"}), streamNames(streams));
    ASSERT_EQ("rtsp://10.0.0.9:554/live", streams[0].url);
    ASSERT_EQ("rtsp://10.0.0.9:554/stream2", streams[1].url);
}

TEST_F(RtspStreamProber, only_main_stream_is_reported_once)
{
    FakeCamera camera = makeRtspCamera();
    camera.rtspStreams = {{"/live", sdp::kMainStream}, {"/live/0", sdp::kMainStream}};
    givenCamera(camera);

    ASSERT_EQ((QStringList{"Main"}), streamNames(m_prober.discoverStreams(m_device)));
}

TEST_F(RtspStreamProber, nvr_iteration_stops_after_consecutive_misses)
{
    FakeCamera camera = makeRtspCamera();
    camera.rtspStreams = {
        {"/ch01/0", sdp::kMainStream},
        {"/ch03/0", sdp::kMainStream},
        {"/ch03/1", sdp::kSubStream},
        {"/ch09/0", sdp::kMainStream}};
    givenCamera(camera);
    m_settings.nvrConsecutiveFailures = 3;

    const auto streams = m_prober.iterateNvrChannels(m_device);

    ASSERT_EQ((QStringList{"CH1 Main", "CH3 Main", "CH3 Sub"}), streamNames(streams));
    ASSERT_EQ("Channel 3", streams[2].channelName);
}

TEST_F(RtspStreamProber, device_without_rtsp_ports_has_no_streams)
{
    givenCamera(makeRtspCamera());
    m_device.rtspPorts.clear();

    ASSERT_TRUE(m_prober.discoverStreams(m_device).empty());
    ASSERT_TRUE(m_prober.iterateNvrChannels(m_device).empty());
    ASSERT_EQ(0, m_network.requestCount());
}

} // namespace test
} // namespace discovery
} // namespace cctv
