#include <gtest/gtest.h>

#include <cctv/discovery/stream_compliance_analyzer.h>

namespace cctv {
namespace discovery {
namespace test {

class StreamComplianceAnalyzer:
    public ::testing::Test
{
protected:
    void givenMainStream(QString codec, QString resolution, int bitrateKbps, QString profile)
    {
        givenStream("Main", codec, resolution, bitrateKbps, profile);
    }

    void givenSubStream(QString codec, QString resolution, int bitrateKbps, QString profile)
    {
        givenStream("Sub", codec, resolution, bitrateKbps, profile);
    }

    void whenAnalyze()
    {
        m_analyzer.analyze(&m_stream);
    }

    void thenStreamIsCompliant()
    {
        ASSERT_TRUE(m_stream.compliant);
        ASSERT_FALSE(static_cast<bool>(m_stream.complianceIssues));
    }

    void thenIssuesAre(const QString& expected)
    {
        ASSERT_FALSE(m_stream.compliant);
        ASSERT_EQ(expected, m_stream.complianceIssues.get_value_or(QString()));
    }

    RtspStream m_stream;
    discovery::StreamComplianceAnalyzer m_analyzer;

private:
    void givenStream(
        QString name, QString codec, QString resolution, int bitrateKbps, QString profile)
    {
        m_stream.streamName = name;
        m_stream.codec = codec;
        m_stream.resolution = resolution;
        if (bitrateKbps > 0)
            m_stream.bitrateKbps = bitrateKbps;
        m_stream.profile = profile;
    }
};

TEST_F(StreamComplianceAnalyzer, main_profile_h264_is_compliant)
{
    givenMainStream("H.264", "1920x1080", 4096, "Main");
    whenAnalyze();
    thenStreamIsCompliant();
}

TEST_F(StreamComplianceAnalyzer, unknown_fields_are_reported)
{
    givenMainStream("", "", 0, "");
    whenAnalyze();
    thenIssuesAre("Codec unknown, Resolution unknown");
}

TEST_F(StreamComplianceAnalyzer, high_profile_is_flagged)
{
    givenMainStream("H.264", "2560x1440", 8192, "High");
    whenAnalyze();
    thenIssuesAre("High profile (requires transcoding for browser HLS)");
}

TEST_F(StreamComplianceAnalyzer, high_profile_flag_can_be_disabled)
{
    CompliancePolicy policy;
    policy.flagHighProfile = false;
    m_analyzer = discovery::StreamComplianceAnalyzer(policy);

    givenMainStream("H.264", "2560x1440", 8192, "High");
    whenAnalyze();
    thenStreamIsCompliant();
}

TEST_F(StreamComplianceAnalyzer, all_main_stream_issues_are_reported_in_order)
{
    givenMainStream("MJPEG", "1920*1080", 32, "High 4:2:2");
    whenAnalyze();
    thenIssuesAre(
        "Codec MJPEG not accepted, "
        "Resolution 1920*1080 malformed, "
        "Bitrate 32 kbps outside 64-16384 kbps, "
        "Profile High 4:2:2 not recognized, "
        "High profile (requires transcoding for browser HLS)");
}

TEST_F(StreamComplianceAnalyzer, sub_stream_limits)
{
    givenSubStream("H.265", "1280x720", 1024, "Main");
    whenAnalyze();
    thenIssuesAre(
        "Resolution not in 360p-480p range, "
        "Codec is not H.264, "
        "Bitrate >= 512kbps");
}

TEST_F(StreamComplianceAnalyzer, typical_sub_stream_is_compliant)
{
    givenSubStream("H.264", "640x360", 256, "Baseline");
    whenAnalyze();
    thenStreamIsCompliant();
}

TEST_F(StreamComplianceAnalyzer, sub_stream_bitrate_limit_is_exclusive)
{
    givenSubStream("H.264", "704x480", 512, "Main");
    whenAnalyze();
    thenIssuesAre("Bitrate >= 512kbps");
}

TEST_F(StreamComplianceAnalyzer, analysis_replaces_previous_result)
{
    givenMainStream("H.264", "", 0, "Main");
    whenAnalyze();
    thenIssuesAre("Resolution unknown");

    m_stream.resolution = "1280x720";
    whenAnalyze();
    thenStreamIsCompliant();
}

TEST(StreamComplianceAnalyzerHelpers, resolution_parsing)
{
    int width = 0;
    int height = 0;
    ASSERT_TRUE(discovery::StreamComplianceAnalyzer::parseResolution("640X480", &width, &height));
    ASSERT_EQ(640, width);
    ASSERT_EQ(480, height);

    ASSERT_FALSE(discovery::StreamComplianceAnalyzer::parseResolution("0x480", &width, &height));
    ASSERT_FALSE(discovery::StreamComplianceAnalyzer::parseResolution("640x", &width, &height));
    ASSERT_FALSE(discovery::StreamComplianceAnalyzer::parseResolution("640", &width, &height));
}

TEST(StreamComplianceAnalyzerHelpers, high_profile_detection)
{
    ASSERT_TRUE(discovery::StreamComplianceAnalyzer::isHighProfile("High"));
    ASSERT_TRUE(discovery::StreamComplianceAnalyzer::isHighProfile("high 10"));
    ASSERT_FALSE(discovery::StreamComplianceAnalyzer::isHighProfile("Main"));
    ASSERT_FALSE(discovery::StreamComplianceAnalyzer::isHighProfile(""));
}

} // namespace test
} // namespace discovery
} // namespace cctv
