#include "rtsp_stream_prober.h"

#include <algorithm>

#include <QtCore/QMutexLocker>

#include <cctv/network/mac_address.h>
#include <cctv/utils/log/log.h>

#include "media/sdp.h"
#include "rtsp_describe_target.h"

namespace cctv {
namespace discovery {

using namespace network;

namespace {

struct ManufacturerPaths
{
    const char* key;
    QStringList paths;
};

const std::vector<ManufacturerPaths>& manufacturerPathTable()
{
    static const std::vector<ManufacturerPaths> kTable{
        {"HIKVISION", {
            "/Streaming/Channels/101",
            "/Streaming/Channels/102",
            "/h264/ch1/main/av_stream",
            "/h264/ch1/sub/av_stream"}},
        {"DAHUA", {
            "/cam/realmonitor?channel=1&subtype=0",
            "/cam/realmonitor?channel=1&subtype=1",
            "/live/ch00_0",
            "/live/ch00_1"}},
        {"AXIS", {
            "/axis-media/media.amp",
            "/axis-media/media.amp?videocodec=h264",
            "/mpeg4/media.amp"}},
        {"CP_PLUS", {
            "/cam/realmonitor?channel=1&subtype=0",
            "/cam/realmonitor?channel=1&subtype=1"}},
    };
    return kTable;
}

struct NvrPatternEntry
{
    const char* key;
    NvrChannelPattern pattern;
};

const std::vector<NvrPatternEntry>& nvrPatternTable()
{
    static const NvrChannelPattern kHikvision{
        "/Streaming/Channels/{channel*100+1}", "/Streaming/Channels/{channel*100+2}"};
    static const NvrChannelPattern kDahua{
        "/cam/realmonitor?channel={channel}&subtype=0",
        "/cam/realmonitor?channel={channel}&subtype=1"};
    static const NvrChannelPattern kUniview{"/media/video{channel}", "/media/video{channel+100}"};

    static const std::vector<NvrPatternEntry> kTable{
        {"HIKVISION", kHikvision},
        {"HIK", kHikvision},
        {"DAHUA", kDahua},
        {"CP_PLUS", kDahua},
        {"AMCREST", kDahua},
        {"UNIVIEW", kUniview},
        {"UNV", kUniview},
    };
    return kTable;
}

QString normalizeManufacturer(const QString& manufacturer)
{
    return manufacturer.trimmed().toUpper().replace(QLatin1Char(' '), QLatin1Char('_'));
}

bool looksLikeSubStreamPath(const QString& path)
{
    return path.contains(QLatin1String("/102"))
        || path.contains(QLatin1String("subtype=1"))
        || path.contains(QLatin1String("/sub/"))
        || path.contains(QLatin1String("stream2"))
        || path.endsWith(QLatin1String("_1"))
        || path.endsWith(QLatin1String("/1"));
}

void appendUnique(QStringList* list, const QStringList& items)
{
    for (const QString& item: items)
    {
        if (!list->contains(item))
            list->append(item);
    }
}

} // namespace

QString NvrChannelPattern::resolve(QString pattern, int channel)
{
    return pattern
        .replace(QLatin1String("{channel*100+1}"), QString::number(channel * 100 + 1))
        .replace(QLatin1String("{channel*100+2}"), QString::number(channel * 100 + 2))
        .replace(QLatin1String("{channel+100}"), QString::number(channel + 100))
        .replace(QLatin1String("{channel01}"), QString("%1").arg(channel, 2, 10, QLatin1Char('0')))
        .replace(QLatin1String("{channel}"), QString::number(channel));
}

//-------------------------------------------------------------------------------------------------
// RtspPathCache

QStringList RtspPathCache::paths(const QString& macPrefix) const
{
    QMutexLocker lock(&m_mutex);
    return m_paths.value(macPrefix);
}

void RtspPathCache::remember(const QString& macPrefix, const QString& path)
{
    QMutexLocker lock(&m_mutex);
    QStringList& paths = m_paths[macPrefix];
    if (!paths.contains(path))
        paths.append(path);
}

//-------------------------------------------------------------------------------------------------
// RtspStreamProber

RtspStreamProber::RtspStreamProber(
    http::AbstractTransport* transport,
    const ScanSettings& settings,
    std::vector<auth::Credential> credentials,
    RtspPathCache* pathCache,
    std::function<bool()> isInterrupted)
    :
    m_transport(transport),
    m_settings(settings),
    m_credentials(std::move(credentials)),
    m_pathCache(pathCache),
    m_isInterrupted(std::move(isInterrupted))
{
}

boost::optional<RtspStream> RtspStreamProber::describe(const QString& url)
{
    RtspDescribeTarget target(m_transport, QUrl(url));
    const auth::NegotiationResult result = m_negotiator.negotiate(target, m_credentials);
    if (!result.success || !result.response)
        return boost::none;

    if (result.response->statusCode != http::StatusCode::ok)
    {
        CCTV_VERBOSE(this, lm("%1: %2").args(url, result.response->statusCode));
        return boost::none;
    }

    const auto sdp = media::parseSdp(result.response->body);
    if (!sdp)
    {
        CCTV_DEBUG(this, lm("%1: no valid SDP with video").arg(url));
        return boost::none;
    }

    if (result.credential)
    {
        m_acceptedCredential = result.credential;
        const auto it = std::find(m_credentials.begin(), m_credentials.end(), *result.credential);
        if (it != m_credentials.end())
            std::rotate(m_credentials.begin(), it, it + 1);
    }

    RtspStream stream;
    stream.url = url;
    stream.codec = sdp->codec;
    stream.profile = sdp->profile;
    stream.resolution = sdp->resolution();
    stream.bitrateKbps = sdp->bitrateKbps;
    stream.frameRate = sdp->frameRate;
    stream.sdpSessionName = sdp->sessionName;
    CCTV_DEBUG(this, lm("Found stream %1: %2 %3").args(url, stream.codec, stream.resolution));
    return stream;
}

std::vector<RtspStream> RtspStreamProber::discoverStreams(const Device& device)
{
    std::vector<RtspStream> streams;
    if (device.rtspPorts.empty())
    {
        CCTV_DEBUG(this, lm("%1: no RTSP ports, skipping stream discovery").arg(device.address));
        return streams;
    }

    const auto macPrefix = device.hardwareAddress
        ? network::macPrefix(*device.hardwareAddress)
        : boost::none;

    QStringList pathsToTry;
    if (macPrefix && m_pathCache)
        appendUnique(&pathsToTry, m_pathCache->paths(*macPrefix));
    appendUnique(&pathsToTry, manufacturerPaths(device.manufacturer));

    const auto remember =
        [this, &macPrefix](const QString& path)
        {
            if (macPrefix && m_pathCache)
                m_pathCache->remember(*macPrefix, path);
        };

    for (const RtspPathPair& pair: m_settings.customRtspPaths)
    {
        for (const int port: device.rtspPorts)
        {
            if (isInterrupted())
                return streams;

            auto mainStream = describe(makeUrl(device.address, port, pair.mainPath));
            if (!mainStream)
                continue;

            mainStream->streamName = QStringLiteral("Main");
            streams.push_back(*mainStream);
            remember(pair.mainPath);

            if (auto subStream = describe(makeUrl(device.address, port, pair.subPath)))
            {
                subStream->streamName = QStringLiteral("Sub");
                streams.push_back(*subStream);
                remember(pair.subPath);
            }

            if (streams.size() >= 2)
                return streams;
        }
    }

    appendUnique(&pathsToTry, genericPaths());

    for (const QString& path: pathsToTry)
    {
        for (const int port: device.rtspPorts)
        {
            if (isInterrupted())
                return streams;

            const QString streamName = looksLikeSubStreamPath(path)
                ? QStringLiteral("Sub")
                : QStringLiteral("Main");
            // Another path of the same kind is an alias of the stream already found.
            const bool alreadyFound = std::any_of(streams.begin(), streams.end(),
                [&streamName](const RtspStream& found) { return found.streamName == streamName; });
            if (alreadyFound)
                continue;

            auto stream = describe(makeUrl(device.address, port, path));
            if (!stream)
                continue;

            stream->streamName = streamName;
            streams.push_back(*stream);
            remember(path);

            if (streams.size() == 1 && streamName == QStringLiteral("Main"))
            {
                const auto subPath = guessSubstreamPath(path);
                if (subPath && *subPath != path)
                {
                    if (auto subStream = describe(makeUrl(device.address, port, *subPath)))
                    {
                        subStream->streamName = QStringLiteral("Sub");
                        streams.push_back(*subStream);
                        remember(*subPath);
                    }
                }
            }

            if (streams.size() >= 2)
                return streams;
        }
    }

    return streams;
}

std::vector<RtspStream> RtspStreamProber::iterateNvrChannels(const Device& device)
{
    std::vector<RtspStream> streams;
    if (device.rtspPorts.empty())
        return streams;

    const int port = *device.rtspPorts.begin();
    const NvrChannelPattern pattern = nvrPattern(device.manufacturer);
    CCTV_DEBUG(this, lm("%1: iterating NVR channels on port %2 with %3")
        .args(device.address, port, pattern.mainPattern));

    int consecutiveFailures = 0;
    for (int channel = 1; channel <= m_settings.nvrMaxChannels; ++channel)
    {
        if (isInterrupted())
            break;

        const QString channelName = QString("Channel %1").arg(channel);
        auto mainStream = describe(makeUrl(device.address, port, pattern.mainPath(channel)));
        if (!mainStream)
        {
            if (++consecutiveFailures >= m_settings.nvrConsecutiveFailures)
            {
                CCTV_DEBUG(this, lm("%1: stopping NVR iteration after %2 misses at channel %3")
                    .args(device.address, consecutiveFailures, channel));
                break;
            }
            continue;
        }

        consecutiveFailures = 0;
        mainStream->streamName = QString("CH%1 Main").arg(channel);
        mainStream->channelName = channelName;
        streams.push_back(*mainStream);

        if (auto subStream = describe(makeUrl(device.address, port, pattern.subPath(channel))))
        {
            subStream->streamName = QString("CH%1 Sub").arg(channel);
            subStream->channelName = channelName;
            streams.push_back(*subStream);
        }
    }
    return streams;
}

QStringList RtspStreamProber::manufacturerPaths(const QString& manufacturer)
{
    const QString normalized = normalizeManufacturer(manufacturer);
    if (normalized.isEmpty())
        return QStringList();

    for (const auto& entry: manufacturerPathTable())
    {
        if (normalized.contains(QLatin1String(entry.key)))
            return entry.paths;
    }
    return QStringList();
}

QStringList RtspStreamProber::genericPaths()
{
    return QStringList{
        "/live", "/live/0", "/live/1", "/ch0", "/ch01",
        "/stream1", "/stream2", "/video.mjpg", "/h264"};
}

NvrChannelPattern RtspStreamProber::nvrPattern(const QString& manufacturer)
{
    static const NvrChannelPattern kGeneric{"/ch{channel01}/0", "/ch{channel01}/1"};

    const QString normalized = normalizeManufacturer(manufacturer);
    if (normalized.isEmpty())
        return kGeneric;

    for (const auto& entry: nvrPatternTable())
    {
        if (normalized == QLatin1String(entry.key))
            return entry.pattern;
    }
    for (const auto& entry: nvrPatternTable())
    {
        if (normalized.contains(QLatin1String(entry.key)))
            return entry.pattern;
    }
    return kGeneric;
}

boost::optional<QString> RtspStreamProber::guessSubstreamPath(const QString& mainPath)
{
    QString path = mainPath;
    if (path.contains(QLatin1String("/101")))
        return path.replace(QLatin1String("/101"), QLatin1String("/102"));
    if (path.contains(QLatin1String("subtype=0")))
        return path.replace(QLatin1String("subtype=0"), QLatin1String("subtype=1"));
    if (path.contains(QLatin1String("/main/")))
        return path.replace(QLatin1String("/main/"), QLatin1String("/sub/"));
    if (path.contains(QLatin1String("_0")))
        return path.replace(QLatin1String("_0"), QLatin1String("_1"));
    if (path.contains(QLatin1String("/0")))
        return path.replace(QLatin1String("/0"), QLatin1String("/1"));
    if (path == QLatin1String("/live"))
        return QString("/live/1");
    return boost::none;
}

QString RtspStreamProber::makeUrl(const QString& address, int port, const QString& path)
{
    return QString("rtsp://%1:%2%3").arg(address).arg(port).arg(path);
}

bool RtspStreamProber::isInterrupted() const
{
    return m_isInterrupted && m_isInterrupted();
}

} // namespace discovery
} // namespace cctv
