#include "h264_sps.h"

#include "bit_stream_reader.h"

namespace cctv {
namespace discovery {
namespace media {

namespace {

static const int kNalTypeMask = 0x1f;
static const int kSpsNalType = 7;
static const int kConstraintSet1Flag = 0x40;
static const int kExtendedSarIdc = 255;

/** 8192 macroblocks are 131072 pixels, far above any H.264 level limit. */
static const quint32 kMaxSizeInMbs = 8192;
static const quint32 kMaxChromaFormatIdc = 3;

bool hasChromaInfo(int profileIdc)
{
    switch (profileIdc)
    {
        case 100: case 110: case 122: case 244: case 44:
        case 83: case 86: case 118: case 128: case 138: case 139: case 134: case 135:
            return true;
        default:
            return false;
    }
}

void skipScalingList(BitStreamReader* reader, int size)
{
    int lastScale = 8;
    int nextScale = 8;
    for (int i = 0; i < size; ++i)
    {
        if (nextScale != 0)
        {
            const int deltaScale = reader->getSignedGolomb();
            nextScale = (lastScale + deltaScale + 256) % 256;
        }
        lastScale = nextScale == 0 ? lastScale : nextScale;
    }
}

boost::optional<double> readVuiFrameRate(BitStreamReader* reader)
{
    if (reader->getBit()) //< aspect_ratio_info_present_flag
    {
        if (static_cast<int>(reader->getBits(8)) == kExtendedSarIdc)
            reader->skipBits(32);
    }

    if (reader->getBit()) //< overscan_info_present_flag
        reader->skipBits(1);

    if (reader->getBit()) //< video_signal_type_present_flag
    {
        reader->skipBits(4);
        if (reader->getBit()) //< colour_description_present_flag
            reader->skipBits(24);
    }

    if (reader->getBit()) //< chroma_loc_info_present_flag
    {
        reader->getGolomb();
        reader->getGolomb();
    }

    if (!reader->getBit()) //< timing_info_present_flag
        return boost::none;

    const quint32 numUnitsInTick = reader->getBits(32);
    const quint32 timeScale = reader->getBits(32);
    if (numUnitsInTick == 0 || timeScale == 0)
        return boost::none;

    return static_cast<double>(timeScale) / (2.0 * numUnitsInTick);
}

int getBoundedGolomb(BitStreamReader* reader, quint32 maxValue)
{
    const quint32 value = reader->getGolomb();
    if (value > maxValue)
        throw BitStreamException("SPS value out of range");
    return static_cast<int>(value);
}

} // namespace

void H264Sps::decode(const QByteArray& nalUnit)
{
    if (nalUnit.isEmpty() || (nalUnit[0] & kNalTypeMask) != kSpsNalType)
        throw BitStreamException();

    BitStreamReader reader(BitStreamReader::toRbsp(nalUnit.mid(1)));
    profileIdc = static_cast<int>(reader.getBits(8));
    constraintFlags = static_cast<int>(reader.getBits(8));
    levelIdc = static_cast<int>(reader.getBits(8));
    reader.getGolomb(); //< seq_parameter_set_id

    int chromaFormatIdc = 1;
    bool separateColourPlane = false;
    if (hasChromaInfo(profileIdc))
    {
        chromaFormatIdc = getBoundedGolomb(&reader, kMaxChromaFormatIdc);
        if (chromaFormatIdc == 3)
            separateColourPlane = reader.getBit();
        reader.getGolomb(); //< bit_depth_luma_minus8
        reader.getGolomb(); //< bit_depth_chroma_minus8
        reader.skipBits(1); //< qpprime_y_zero_transform_bypass_flag
        if (reader.getBit()) //< seq_scaling_matrix_present_flag
        {
            const int listCount = chromaFormatIdc != 3 ? 8 : 12;
            for (int i = 0; i < listCount; ++i)
            {
                if (reader.getBit())
                    skipScalingList(&reader, i < 6 ? 16 : 64);
            }
        }
    }

    reader.getGolomb(); //< log2_max_frame_num_minus4
    const quint32 picOrderCntType = reader.getGolomb();
    if (picOrderCntType == 0)
    {
        reader.getGolomb(); //< log2_max_pic_order_cnt_lsb_minus4
    }
    else if (picOrderCntType == 1)
    {
        reader.skipBits(1); //< delta_pic_order_always_zero_flag
        reader.getSignedGolomb(); //< offset_for_non_ref_pic
        reader.getSignedGolomb(); //< offset_for_top_to_bottom_field
        const quint32 cycleLength = reader.getGolomb();
        for (quint32 i = 0; i < cycleLength; ++i)
            reader.getSignedGolomb();
    }

    reader.getGolomb(); //< max_num_ref_frames
    reader.skipBits(1); //< gaps_in_frame_num_value_allowed_flag
    const int widthInMbs = getBoundedGolomb(&reader, kMaxSizeInMbs - 1) + 1;
    const int heightInMapUnits = getBoundedGolomb(&reader, kMaxSizeInMbs - 1) + 1;
    const int frameMbsOnly = reader.getBit() ? 1 : 0;
    if (!frameMbsOnly)
        reader.skipBits(1); //< mb_adaptive_frame_field_flag
    reader.skipBits(1); //< direct_8x8_inference_flag

    int cropLeft = 0;
    int cropRight = 0;
    int cropTop = 0;
    int cropBottom = 0;
    if (reader.getBit()) //< frame_cropping_flag
    {
        const quint32 maxCrop = kMaxSizeInMbs * 16;
        cropLeft = getBoundedGolomb(&reader, maxCrop);
        cropRight = getBoundedGolomb(&reader, maxCrop);
        cropTop = getBoundedGolomb(&reader, maxCrop);
        cropBottom = getBoundedGolomb(&reader, maxCrop);
    }

    const int chromaArrayType = separateColourPlane ? 0 : chromaFormatIdc;
    int cropUnitX = 1;
    int cropUnitY = 2 - frameMbsOnly;
    if (chromaArrayType != 0)
    {
        const int subWidthC = chromaFormatIdc == 3 ? 1 : 2;
        const int subHeightC = chromaFormatIdc == 1 ? 2 : 1;
        cropUnitX = subWidthC;
        cropUnitY = subHeightC * (2 - frameMbsOnly);
    }

    width = widthInMbs * 16 - cropUnitX * (cropLeft + cropRight);
    height = (2 - frameMbsOnly) * heightInMapUnits * 16 - cropUnitY * (cropTop + cropBottom);
    if (width <= 0 || height <= 0)
        throw BitStreamException("SPS cropping exceeds picture size");

    frameRate = boost::none;
    if (reader.bitsLeft() > 0 && reader.getBit()) //< vui_parameters_present_flag
        frameRate = readVuiFrameRate(&reader);
}

QString H264Sps::profileName() const
{
    return h264ProfileName(profileIdc, constraintFlags);
}

QString h264ProfileName(int profileIdc, int constraintFlags)
{
    switch (profileIdc)
    {
        case 66:
            return (constraintFlags & kConstraintSet1Flag)
                ? QStringLiteral("Constrained Baseline")
                : QStringLiteral("Baseline");
        case 77: return QStringLiteral("Main");
        case 88: return QStringLiteral("Extended");
        case 100: return QStringLiteral("High");
        case 110: return QStringLiteral("High 10");
        case 122: return QStringLiteral("High 4:2:2");
        case 244: return QStringLiteral("High 4:4:4");
        case 44: return QStringLiteral("CAVLC 4:4:4");
        case 83: return QStringLiteral("Scalable Baseline");
        case 86: return QStringLiteral("Scalable High");
        case 118: return QStringLiteral("Multiview High");
        case 128: return QStringLiteral("Stereo High");
        case 138: return QStringLiteral("Multiview Depth High");
        default: return QString();
    }
}

QString hevcProfileName(int profileId)
{
    switch (profileId)
    {
        case 1: return QStringLiteral("Main");
        case 2: return QStringLiteral("Main 10");
        case 3: return QStringLiteral("Main Still Picture");
        case 4: return QStringLiteral("Rext");
        default: return QString();
    }
}

} // namespace media
} // namespace discovery
} // namespace cctv
