#include <gtest/gtest.h>

#include <cctv/discovery/media/h264_sps.h>
#include <cctv/discovery/media/sdp.h>

namespace cctv {
namespace discovery {
namespace media {
namespace test {

namespace {

static const char* const kHikvisionMainSdp =
    "v=0\r\n"
    "o=- 1109162014219182 0 IN IP4 0.0.0.0\r\n"
    "s=Media Presentation\r\n"
    "c=IN IP4 0.0.0.0\r\n"
    "b=AS:5100\r\n"
    "t=0 0\r\n"
    "m=video 0 RTP/AVP 96\r\n"
    "b=AS:4096\r\n"
    "a=rtpmap:96 H264/90000\r\n"
    "a=fmtp:96 profile-level-id=420029; packetization-mode=1; "
        "sprop-parameter-sets=Z00AKO0A8ARPyoA=,aO48gA==\r\n"
    "a=framerate:25\r\n"
    "m=audio 0 RTP/AVP 8\r\n"
    "b=AS:64\r\n"
    "a=rtpmap:8 PCMA/8000\r\n";

} // namespace

class Sdp:
    public ::testing::Test
{
protected:
    void whenParse(const QByteArray& sdp)
    {
        m_info = parseSdp(sdp);
    }

    void thenParsed()
    {
        ASSERT_TRUE(static_cast<bool>(m_info));
    }

    void thenRejected()
    {
        ASSERT_FALSE(static_cast<bool>(m_info));
    }

    const SdpVideoInfo& info() const { return *m_info; }

private:
    boost::optional<SdpVideoInfo> m_info;
};

TEST_F(Sdp, video_description_is_taken_from_sps)
{
    whenParse(kHikvisionMainSdp);

    thenParsed();
    ASSERT_EQ("H.264", info().codec);
    ASSERT_EQ("Main", info().profile);
    ASSERT_EQ("1920x1080", info().resolution());
    ASSERT_EQ(4096, info().bitrateKbps.get_value_or(0));
    ASSERT_EQ(25.0, info().frameRate.get_value_or(0));
    ASSERT_EQ("Media Presentation", info().sessionName.get_value_or(QString()));
}

TEST_F(Sdp, session_bitrate_is_used_when_video_has_none)
{
    whenParse(
        "v=0\r\n"
        "s=-\r\n"
        "b=AS:768\r\n"
        "m=video 0 RTP/AVP 96\r\n"
        "a=rtpmap:96 H264/90000\r\n"
        "a=fmtp:96 sprop-parameter-sets=Z2QAHqzaAoC/5UA=\r\n");

    thenParsed();
    ASSERT_EQ(768, info().bitrateKbps.get_value_or(0));
    ASSERT_EQ("High", info().profile);
    ASSERT_EQ("640x360", info().resolution());
    ASSERT_FALSE(static_cast<bool>(info().sessionName));
}

TEST_F(Sdp, audio_bitrate_is_not_taken_for_video)
{
    whenParse(
        "v=0\r\n"
        "m=video 0 RTP/AVP 96\r\n"
        "a=rtpmap:96 H264/90000\r\n"
        "m=audio 0 RTP/AVP 0\r\n"
        "b=AS:64\r\n");

    thenParsed();
    ASSERT_FALSE(static_cast<bool>(info().bitrateKbps));
}

TEST_F(Sdp, profile_level_id_is_used_without_sprop)
{
    whenParse(
        "v=0\r\n"
        "m=video 0 RTP/AVP 97\r\n"
        "a=rtpmap:97 H264/90000\r\n"
        "a=fmtp:97 packetization-mode=1;profile-level-id=42e01f\r\n"
        "a=x-dimensions:704,576\r\n");

    thenParsed();
    ASSERT_EQ("Constrained Baseline", info().profile);
    ASSERT_EQ("704x576", info().resolution());
}

TEST_F(Sdp, hevc_profile_comes_from_profile_id)
{
    whenParse(
        "v=0\r\n"
        "m=video 0 RTP/AVP 98\r\n"
        "a=rtpmap:98 H265/90000\r\n"
        "a=fmtp:98 profile-id=1\r\n"
        "a=framesize:98 2560-1440\r\n");

    thenParsed();
    ASSERT_EQ("H.265", info().codec);
    ASSERT_EQ("Main", info().profile);
    ASSERT_EQ("2560x1440", info().resolution());
}

TEST_F(Sdp, attributes_of_other_payload_types_are_ignored)
{
    whenParse(
        "v=0\r\n"
        "m=video 0 RTP/AVP 96\r\n"
        "a=rtpmap:26 JPEG/90000\r\n"
        "a=rtpmap:96 H264/90000\r\n"
        "a=fmtp:26 profile-level-id=640028\r\n");

    thenParsed();
    ASSERT_EQ("H.264", info().codec);
    ASSERT_TRUE(info().profile.isEmpty());
}

TEST_F(Sdp, broken_sps_leaves_stream_description_partial)
{
    whenParse(
        "v=0\r\n"
        "m=video 0 RTP/AVP 96\r\n"
        "a=rtpmap:96 H264/90000\r\n"
        "a=fmtp:96 sprop-parameter-sets=Z00A\r\n");

    thenParsed();
    ASSERT_EQ("H.264", info().codec);
    ASSERT_TRUE(info().resolution().isEmpty());
}

TEST_F(Sdp, document_without_version_is_rejected)
{
    whenParse("m=video 0 RTP/AVP 96\r\na=rtpmap:96 H264/90000\r\n");
    thenRejected();
}

TEST_F(Sdp, document_without_video_is_rejected)
{
    whenParse("v=0\r\nm=audio 0 RTP/AVP 0\r\n");
    thenRejected();
}

TEST(SdpCodec, encoding_names_are_mapped_to_display_names)
{
    ASSERT_EQ("H.264", codecFromEncodingName("h264"));
    ASSERT_EQ("H.265", codecFromEncodingName("HEVC"));
    ASSERT_EQ("MPEG-4", codecFromEncodingName("MP4V-ES"));
    ASSERT_EQ("MJPEG", codecFromEncodingName("JPEG"));
    ASSERT_EQ("VP8", codecFromEncodingName("vp8"));
}

//-------------------------------------------------------------------------------------------------

TEST(H264Sps, main_profile_full_hd)
{
    H264Sps sps;
    sps.decode(QByteArray::fromBase64("Z00AKO0A8ARPyoA="));

    ASSERT_EQ(77, sps.profileIdc);
    ASSERT_EQ(40, sps.levelIdc);
    ASSERT_EQ(1920, sps.width);
    ASSERT_EQ(1080, sps.height);
    ASSERT_EQ("Main", sps.profileName());
    ASSERT_FALSE(static_cast<bool>(sps.frameRate));
}

TEST(H264Sps, baseline_cif)
{
    H264Sps sps;
    sps.decode(QByteArray::fromBase64("Z0IAHu0CwSyA"));

    ASSERT_EQ("Baseline", sps.profileName());
    ASSERT_EQ(352, sps.width);
    ASSERT_EQ(288, sps.height);
}

TEST(H264Sps, truncated_unit_throws)
{
    H264Sps sps;
    ASSERT_THROW(sps.decode(QByteArray::fromHex("674d0028")), BitStreamException);
}

TEST(H264Sps, oversized_picture_is_rejected)
{
    H264Sps sps;
    // pic_width_in_mbs_minus1 = 0x7fffffff.
    ASSERT_THROW(
        sps.decode(QByteArray::fromHex("6742001ef40000030001000003000012c8")),
        BitStreamException);
}

TEST(H264Sps, cropping_larger_than_picture_is_rejected)
{
    H264Sps sps;
    sps.decode(QByteArray::fromHex("6742001ef40b04b2"));
    ASSERT_EQ(352, sps.width);
    ASSERT_EQ(288, sps.height);

    // Same picture with frame_crop_bottom_offset = 200.
    ASSERT_THROW(sps.decode(QByteArray::fromHex("6742001ef40b04bf019280")), BitStreamException);
}

TEST(H264Sps, profile_names)
{
    ASSERT_EQ("Baseline", h264ProfileName(66));
    ASSERT_EQ("Constrained Baseline", h264ProfileName(66, 0x40));
    ASSERT_EQ("High", h264ProfileName(100));
    ASSERT_TRUE(h264ProfileName(7).isEmpty());
    ASSERT_EQ("Main 10", hevcProfileName(2));
    ASSERT_TRUE(hevcProfileName(9).isEmpty());
}

} // namespace test
} // namespace media
} // namespace discovery
} // namespace cctv
