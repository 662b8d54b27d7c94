#pragma once

#include <functional>
#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QStringList>

#include <cctv/network/auth/auth_negotiator.h>
#include <cctv/network/http/transport.h>

#include "device.h"
#include "rtsp_stream.h"
#include "scan_settings.h"

namespace cctv {
namespace discovery {

/**
 * Main and sub path templates of NVR channels. Placeholders: {channel}, {channel01},
 * {channel*100+1}, {channel*100+2}, {channel+100}.
 */
struct NvrChannelPattern
{
    QString mainPattern;
    QString subPattern;

    QString mainPath(int channel) const { return resolve(mainPattern, channel); }
    QString subPath(int channel) const { return resolve(subPattern, channel); }

    static QString resolve(QString pattern, int channel);
};

/**
 * Paths that worked on devices with the same MAC prefix, shared by all devices of a scan.
 */
class RtspPathCache
{
public:
    QStringList paths(const QString& macPrefix) const;
    void remember(const QString& macPrefix, const QString& path);

private:
    mutable QMutex m_mutex;
    QHash<QString, QStringList> m_paths;
};

/**
 * Finds working RTSP URLs of a device by DESCRIBE-ing guessed paths.
 */
class RtspStreamProber
{
public:
    RtspStreamProber(
        network::http::AbstractTransport* transport,
        const ScanSettings& settings,
        std::vector<network::auth::Credential> credentials,
        RtspPathCache* pathCache = nullptr,
        std::function<bool()> isInterrupted = nullptr);

    /**
     * DESCRIBE with authentication fallback. A stream is reported only for a 200 response
     * carrying a valid SDP with a video section.
     */
    boost::optional<RtspStream> describe(const QString& url);

    /**
     * Waterfall: cached paths, manufacturer paths, configured main/sub pairs, generic paths.
     * Stops after a main and a sub stream are found.
     */
    std::vector<RtspStream> discoverStreams(const Device& device);

    /**
     * Channels 1..nvrMaxChannels on the first RTSP port, until nvrConsecutiveFailures main
     * streams in a row are missing.
     */
    std::vector<RtspStream> iterateNvrChannels(const Device& device);

    /**
     * The credential the last successful DESCRIBE was accepted with.
     */
    const boost::optional<network::auth::Credential>& acceptedCredential() const
    {
        return m_acceptedCredential;
    }

    static QStringList manufacturerPaths(const QString& manufacturer);
    static QStringList genericPaths();
    static NvrChannelPattern nvrPattern(const QString& manufacturer);
    static boost::optional<QString> guessSubstreamPath(const QString& mainPath);
    static QString makeUrl(const QString& address, int port, const QString& path);

private:
    bool isInterrupted() const;

private:
    network::http::AbstractTransport* m_transport;
    const ScanSettings& m_settings;
    std::vector<network::auth::Credential> m_credentials;
    RtspPathCache* m_pathCache;
    std::function<bool()> m_isInterrupted;
    network::auth::AuthNegotiator m_negotiator;
    boost::optional<network::auth::Credential> m_acceptedCredential;
};

} // namespace discovery
} // namespace cctv
