#include "sdp.h"

#include <QtCore/QList>

#include <cctv/utils/log/log.h>

#include "bit_stream_reader.h"
#include "h264_sps.h"

namespace cctv {
namespace discovery {
namespace media {

namespace {

static const char kH264NalPrefix[4] = {0x00, 0x00, 0x00, 0x01};
static const char kH264NalShortPrefix[3] = {0x00, 0x00, 0x01};

QByteArray stripStartCodes(QByteArray nal)
{
    const QByteArray startCode(kH264NalPrefix, sizeof(kH264NalPrefix));
    const QByteArray startCodeShort(kH264NalShortPrefix, sizeof(kH264NalShortPrefix));

    // Some cameras put extra start codes into sprop-parameter-sets.
    if (nal.endsWith(startCode))
        nal.chop(startCode.size());
    else if (nal.endsWith(startCodeShort))
        nal.chop(startCodeShort.size());

    if (nal.startsWith(startCode))
        nal.remove(0, startCode.size());
    else if (nal.startsWith(startCodeShort))
        nal.remove(0, startCodeShort.size());
    return nal;
}

void applySpropParameterSets(const QByteArray& value, SdpVideoInfo* info)
{
    for (const QByteArray& encodedNal: value.split(','))
    {
        const QByteArray nal = stripStartCodes(QByteArray::fromBase64(encodedNal.trimmed()));
        if (nal.isEmpty() || (nal[0] & 0x1f) != 7)
            continue;

        H264Sps sps;
        try
        {
            sps.decode(nal);
        }
        catch (const BitStreamException& e)
        {
            CCTV_DEBUG("sdp", lm("Can't deserialize SPS unit. %1").arg(e.what()));
            continue;
        }

        info->profile = sps.profileName();
        info->width = sps.width;
        info->height = sps.height;
        if (sps.frameRate && !info->frameRate)
            info->frameRate = sps.frameRate;
        return;
    }
}

void applyFmtp(const QByteArray& parameters, SdpVideoInfo* info)
{
    QByteArray profileLevelId;
    for (const QByteArray& parameter: parameters.split(';'))
    {
        const QByteArray trimmed = parameter.trimmed();
        const int equalsPos = trimmed.indexOf('=');
        if (equalsPos == -1)
            continue;

        const QByteArray name = trimmed.left(equalsPos).trimmed().toLower();
        const QByteArray value = trimmed.mid(equalsPos + 1).trimmed();
        if (name == "sprop-parameter-sets")
            applySpropParameterSets(value, info);
        else if (name == "profile-level-id")
            profileLevelId = value;
        else if (name == "profile-id" && info->profile.isEmpty())
            info->profile = hevcProfileName(value.toInt());
    }

    if (info->profile.isEmpty() && profileLevelId.size() >= 4)
    {
        bool ok = false;
        const int profileIdc = profileLevelId.left(2).toInt(&ok, 16);
        const int constraintFlags = profileLevelId.mid(2, 2).toInt(nullptr, 16);
        if (ok)
            info->profile = h264ProfileName(profileIdc, constraintFlags);
    }
}

bool parseDimensions(const QByteArray& text, char separator, int* width, int* height)
{
    const QList<QByteArray> parts = text.trimmed().split(separator);
    if (parts.size() != 2)
        return false;

    bool widthOk = false;
    bool heightOk = false;
    const int parsedWidth = parts[0].trimmed().toInt(&widthOk);
    const int parsedHeight = parts[1].trimmed().toInt(&heightOk);
    if (!widthOk || !heightOk || parsedWidth <= 0 || parsedHeight <= 0)
        return false;

    *width = parsedWidth;
    *height = parsedHeight;
    return true;
}

} // namespace

QString SdpVideoInfo::resolution() const
{
    if (width <= 0 || height <= 0)
        return QString();
    return QString("%1x%2").arg(width).arg(height);
}

QString codecFromEncodingName(const QByteArray& encodingName)
{
    const QByteArray upper = encodingName.trimmed().toUpper();
    if (upper == "H264")
        return QStringLiteral("H.264");
    if (upper == "H265" || upper == "HEVC")
        return QStringLiteral("H.265");
    if (upper == "MP4V-ES" || upper == "MPEG4" || upper == "MP4V")
        return QStringLiteral("MPEG-4");
    if (upper == "JPEG" || upper == "MJPEG")
        return QStringLiteral("MJPEG");
    return QString::fromLatin1(upper);
}

boost::optional<SdpVideoInfo> parseSdp(const QByteArray& sdp)
{
    bool hasVersion = false;
    bool hasVideo = false;
    bool inVideoSection = false;
    QByteArray videoPayloadType;
    QByteArray fmtpParameters;
    boost::optional<int> sessionBitrate;
    boost::optional<int> videoBitrate;
    int framesizeWidth = 0;
    int framesizeHeight = 0;
    SdpVideoInfo info;

    for (const QByteArray& rawLine: sdp.split('\n'))
    {
        const QByteArray line = rawLine.trimmed();
        if (line.startsWith("v="))
        {
            hasVersion = true;
        }
        else if (line.startsWith("s="))
        {
            const QString name = QString::fromUtf8(line.mid(2)).trimmed();
            if (!name.isEmpty() && name != "-")
                info.sessionName = name;
        }
        else if (line.startsWith("m="))
        {
            inVideoSection = line.startsWith("m=video") && !hasVideo;
            if (inVideoSection)
            {
                hasVideo = true;
                const QList<QByteArray> fields = line.split(' ');
                if (fields.size() >= 4)
                    videoPayloadType = fields[3];
            }
        }
        else if (line.startsWith("b=AS:"))
        {
            bool ok = false;
            const int value = line.mid(5).trimmed().toInt(&ok);
            if (ok && value > 0)
            {
                if (inVideoSection)
                    videoBitrate = value;
                else if (!hasVideo)
                    sessionBitrate = value;
            }
        }
        else if (inVideoSection && line.startsWith("a=rtpmap:"))
        {
            const int spacePos = line.indexOf(' ');
            if (spacePos == -1)
                continue;
            const QByteArray payloadType = line.mid(9, spacePos - 9).trimmed();
            if (!videoPayloadType.isEmpty() && payloadType != videoPayloadType)
                continue;
            info.codec = codecFromEncodingName(line.mid(spacePos + 1).split('/').first());
        }
        else if (inVideoSection && line.startsWith("a=fmtp:"))
        {
            const int spacePos = line.indexOf(' ');
            if (spacePos == -1)
                continue;
            const QByteArray payloadType = line.mid(7, spacePos - 7).trimmed();
            if (!videoPayloadType.isEmpty() && payloadType != videoPayloadType)
                continue;
            fmtpParameters = line.mid(spacePos + 1);
        }
        else if (inVideoSection && line.startsWith("a=framerate:"))
        {
            bool ok = false;
            const double value = line.mid(12).trimmed().toDouble(&ok);
            if (ok && value > 0)
                info.frameRate = value;
        }
        else if (inVideoSection && line.startsWith("a=framesize:"))
        {
            const QByteArray value = line.mid(12).trimmed();
            const int spacePos = value.indexOf(' ');
            if (spacePos != -1)
                parseDimensions(value.mid(spacePos + 1), '-', &framesizeWidth, &framesizeHeight);
        }
        else if (inVideoSection && line.startsWith("a=x-dimensions:"))
        {
            parseDimensions(line.mid(15), ',', &framesizeWidth, &framesizeHeight);
        }
    }

    if (!hasVersion || !hasVideo)
        return boost::none;

    if (!fmtpParameters.isEmpty())
        applyFmtp(fmtpParameters, &info);

    if ((info.width <= 0 || info.height <= 0) && framesizeWidth > 0)
    {
        info.width = framesizeWidth;
        info.height = framesizeHeight;
    }

    info.bitrateKbps = videoBitrate ? videoBitrate : sessionBitrate;
    return info;
}

} // namespace media
} // namespace discovery
} // namespace cctv
