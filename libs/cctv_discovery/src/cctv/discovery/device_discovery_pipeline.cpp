#include "device_discovery_pipeline.h"

#include <algorithm>
#include <exception>

#include <QtCore/QDateTime>

#include <cctv/utils/log/log.h>

#include "media/sdp.h"
#include "onvif_client.h"
#include "rtsp_describe_target.h"

namespace cctv {
namespace discovery {

using namespace network;

namespace {

static const QString kNoPortsOpenMessage =
    QStringLiteral("No management, streaming or vendor ports open");
static const QString kNoResponseMessage = QStringLiteral("Service did not respond");
static const QString kCancelledMessage = QStringLiteral("Scan cancelled");
static const QString kAuthFailedMessage =
    QStringLiteral("Authentication failed with all credentials");
static const QString kUnknownDeviceTypeMessage = QStringLiteral("Unknown device type");

void setStatus(Device* device, DeviceStatus status)
{
    const DeviceStatus previous = device->status();
    const bool changed = device->transitionTo(status);
    CCTV_ASSERT(changed, lm("%1: cannot enter %2 from %3").args(
        device->address, toString(status), toString(previous)));
}

RtspStream streamFromProfile(const onvif::MediaProfile& profile, const QString& uri)
{
    RtspStream stream;
    stream.videoSourceName = profile.videoSourceToken;
    stream.streamName = profile.name.isEmpty() ? profile.token : profile.name;
    stream.url = uri;
    stream.codec = media::codecFromEncodingName(profile.encoding.toLatin1());
    if (profile.width > 0 && profile.height > 0)
        stream.resolution = QString("%1x%2").arg(profile.width).arg(profile.height);
    stream.profile = profile.h264Profile;
    stream.bitrateKbps = profile.bitrateKbps;
    stream.frameRate = profile.frameRate;
    return stream;
}

/**
 * SDP values complete what the media profile did not report.
 */
void mergeDescribedStream(RtspStream* stream, const RtspStream& described)
{
    stream->sdpSessionName = described.sdpSessionName;
    if (stream->codec.isEmpty())
        stream->codec = described.codec;
    if (stream->resolution.isEmpty())
        stream->resolution = described.resolution;
    if (stream->profile.isEmpty())
        stream->profile = described.profile;
    if (!stream->bitrateKbps)
        stream->bitrateKbps = described.bitrateKbps;
    if (!stream->frameRate)
        stream->frameRate = described.frameRate;
}

QString displayName(const onvif::DeviceInformation& information)
{
    QStringList parts;
    if (!information.manufacturer.trimmed().isEmpty())
        parts.append(information.manufacturer.trimmed());
    if (!information.model.trimmed().isEmpty())
        parts.append(information.model.trimmed());
    return parts.join(QLatin1Char(' '));
}

} // namespace

DeviceDiscoveryPipeline::DeviceDiscoveryPipeline(
    AbstractPortProbe* portProbe,
    AbstractHardwareAddressResolver* hardwareAddressResolver,
    http::AbstractTransport* transport,
    const ScanSettings& settings,
    const OuiDatabase& ouiDatabase,
    std::vector<auth::Credential> credentials,
    RtspPathCache* pathCache,
    std::function<bool()> isInterrupted)
    :
    m_portProbe(portProbe),
    m_hardwareAddressResolver(hardwareAddressResolver),
    m_transport(transport),
    m_settings(settings),
    m_ouiDatabase(ouiDatabase),
    m_credentials(std::move(credentials)),
    m_pathCache(pathCache),
    m_isInterrupted(std::move(isInterrupted)),
    m_complianceAnalyzer(settings.compliance)
{
}

void DeviceDiscoveryPipeline::run(Device* device)
{
    try
    {
        runSteps(device);
    }
    catch (const std::exception& e)
    {
        CCTV_WARNING(this, lm("%1: discovery aborted. %2").args(device->address, e.what()));
        fail(device, QString::fromLocal8Bit(e.what()));
    }

    if (!isTerminal(device->status()))
        fail(device, QString("Discovery stopped in status %1").arg(toString(device->status())));
}

void DeviceDiscoveryPipeline::runSteps(Device* device)
{
    if (isInterrupted())
    {
        fail(device, kCancelledMessage);
        return;
    }

    setStatus(device, DeviceStatus::scanning);
    if (!scanPorts(device))
        return;

    setStatus(device, DeviceStatus::authenticating);
    const auto service = authenticate(device);
    if (!service)
        return;

    setStatus(device, DeviceStatus::analyzing);
    RtspStreamProber prober(
        m_transport, m_settings, credentialsFor(*device), m_pathCache, m_isInterrupted);

    if (service->kind == ServiceKind::onvif)
        analyzeOnvif(device, *service, &prober);

    if (device->streams.empty() && !isInterrupted())
        analyzeRtsp(device, &prober);

    if (isInterrupted())
    {
        fail(device, kCancelledMessage);
        return;
    }

    for (RtspStream& stream: device->streams)
        m_complianceAnalyzer.analyze(&stream);

    if (device->type.isEmpty())
        device->type = device->isNvr ? QStringLiteral("NVR/DVR") : QStringLiteral("IP Camera");

    CCTV_INFO(this, lm("%1: completed with %2 stream(s), auth %3").args(
        device->address, device->streams.size(), auth::toString(device->authMethod)));
    setStatus(device, DeviceStatus::completed);
}

bool DeviceDiscoveryPipeline::scanPorts(Device* device)
{
    const auto probe =
        [this, device](const std::vector<int>& ports, std::set<int>* openPorts)
        {
            for (const int port: ports)
            {
                if (isInterrupted())
                    return;
                const bool isOpen = m_portProbe->isOpen(
                    device->address, (quint16) port, m_settings.portProbeTimeout);
                if (isOpen)
                    openPorts->insert(port);
            }
        };

    probe(m_settings.onvifPorts, &device->onvifPorts);
    probe(m_settings.rtspPorts, &device->rtspPorts);
    probe(m_settings.specialPorts, &device->specialPorts);

    if (isInterrupted())
    {
        fail(device, kCancelledMessage);
        return false;
    }

    if (!device->hasOpenPorts())
    {
        CCTV_VERBOSE(this, lm("%1: no open ports").arg(device->address));
        fail(device, kNoPortsOpenMessage);
        return false;
    }

    for (const int port: m_settings.nvrPorts)
    {
        if (device->onvifPorts.count(port)
            || device->rtspPorts.count(port)
            || device->specialPorts.count(port))
        {
            CCTV_DEBUG(this, lm("%1: NVR port %2 is open").args(device->address, port));
            device->isNvr = true;
            break;
        }
    }

    resolveManufacturer(device);

    if (isInterrupted())
    {
        fail(device, kCancelledMessage);
        return false;
    }
    return true;
}

void DeviceDiscoveryPipeline::resolveManufacturer(Device* device)
{
    if (m_settings.macResolution && !device->hardwareAddress && m_hardwareAddressResolver)
        device->hardwareAddress = m_hardwareAddressResolver->resolve(device->address);

    if (!device->hardwareAddress || !device->manufacturer.isEmpty())
        return;

    const QString manufacturer = m_ouiDatabase.lookup(*device->hardwareAddress);
    if (manufacturer != OuiDatabase::kUnknownManufacturer)
        device->manufacturer = manufacturer;
    CCTV_DEBUG(this, lm("%1: MAC %2, manufacturer %3").args(
        device->address, *device->hardwareAddress, manufacturer));
}

boost::optional<DeviceDiscoveryPipeline::AuthenticatedService>
    DeviceDiscoveryPipeline::authenticate(Device* device)
{
    bool anyServiceResponded = false;
    QString lastReason;

    const auto tryTarget =
        [&](auth::AbstractAuthTarget& target, ServiceKind kind, const QUrl& url)
            -> boost::optional<AuthenticatedService>
        {
            auth::NegotiationResult result = m_negotiator.negotiate(target, m_credentials);
            if (!result.serviceResponded)
            {
                CCTV_DEBUG(this, lm("%1: %2 did not respond").args(
                    device->address, target.name()));
                return boost::none;
            }

            anyServiceResponded = true;
            if (!result.success)
            {
                CCTV_DEBUG(this, lm("%1: %2 rejected all credentials. %3").args(
                    device->address, target.name(), result.reason));
                if (!result.reason.isEmpty())
                    lastReason = result.reason;
                return boost::none;
            }

            AuthenticatedService service;
            service.kind = kind;
            service.url = url;
            service.negotiation = std::move(result);
            return service;
        };

    boost::optional<AuthenticatedService> service;
    for (const QUrl& url: onvifServiceUrls(*device))
    {
        if (isInterrupted())
            break;

        onvif::OnvifAuthTarget target(m_transport, url);
        service = tryTarget(target, ServiceKind::onvif, url);
        if (service)
            break;
    }

    if (!service && !device->rtspPorts.empty() && !isInterrupted())
    {
        const QUrl url(RtspStreamProber::makeUrl(
            device->address, *device->rtspPorts.begin(), QStringLiteral("/")));
        RtspDescribeTarget target(m_transport, url);
        service = tryTarget(target, ServiceKind::rtsp, url);
    }

    if (isInterrupted())
    {
        fail(device, kCancelledMessage);
        return boost::none;
    }

    if (service)
    {
        device->authMethod = service->negotiation.method;
        device->credential = service->negotiation.credential;
        if (service->kind == ServiceKind::onvif)
            device->onvifServiceUrl = service->url.toString();
        CCTV_INFO(this, lm("%1: authenticated at %2 with %3 as %4").args(
            device->address,
            service->url.toString(QUrl::RemoveUserInfo),
            auth::toString(device->authMethod),
            device->credential ? device->credential->toString() : QString("anonymous")));
        return service;
    }

    if (!anyServiceResponded)
    {
        fail(device, kNoResponseMessage);
        return boost::none;
    }

    // Routers, printers and other web servers: nothing announced ONVIF and nothing streams.
    if (!device->onvifServiceUrl && device->rtspPorts.empty())
    {
        CCTV_INFO(this, lm("%1: not a camera").arg(device->address));
        device->authFailed = false;
        if (!device->transitionTo(DeviceStatus::authFailed, kUnknownDeviceTypeMessage))
            fail(device, kUnknownDeviceTypeMessage);
        return boost::none;
    }

    device->authFailed = true;
    const QString reason = lastReason.isEmpty() ? kAuthFailedMessage : lastReason;
    CCTV_INFO(this, lm("%1: authentication failed. %2").args(device->address, reason));
    if (!device->transitionTo(DeviceStatus::authFailed, reason))
        fail(device, reason);
    return boost::none;
}

std::vector<QUrl> DeviceDiscoveryPipeline::onvifServiceUrls(const Device& device) const
{
    std::vector<QUrl> urls;
    if (device.onvifServiceUrl)
    {
        const QUrl url(*device.onvifServiceUrl);
        if (url.isValid() && !url.host().isEmpty())
            urls.push_back(url);
    }

    for (const int port: device.onvifPorts)
    {
        const QUrl url = onvif::deviceServiceUrl(device.address, port);
        if (std::find(urls.begin(), urls.end(), url) == urls.end())
            urls.push_back(url);
    }
    return urls;
}

void DeviceDiscoveryPipeline::analyzeOnvif(
    Device* device, const AuthenticatedService& service, RtspStreamProber* prober)
{
    onvif::OnvifClient client(
        m_transport,
        service.url,
        auth::AuthSession(service.negotiation.method, service.negotiation.credential));

    boost::optional<onvif::DeviceInformation> information;
    if (service.negotiation.response)
        information = onvif::parseDeviceInformation(service.negotiation.response->body);
    if (!information)
        information = client.getDeviceInformation();

    if (information)
    {
        if (!information->manufacturer.isEmpty())
            device->manufacturer = information->manufacturer;
        device->model = information->model;
        device->serialNumber = information->serialNumber;
        device->firmwareVersion = information->firmwareVersion;
        device->name = displayName(*information);
    }

    if (const auto deviceTime = client.getSystemDateAndTime())
        device->clockOffsetSeconds = QDateTime::currentDateTimeUtc().secsTo(*deviceTime);

    if (isInterrupted())
        return;

    const QUrl mediaUrl = client.getMediaServiceUrl();
    const QStringList videoSources = client.getVideoSources(mediaUrl);
    if (videoSources.size() > 1)
    {
        CCTV_DEBUG(this, lm("%1: %2 video sources, treating as NVR").args(
            device->address, videoSources.size()));
        device->isNvr = true;
    }

    for (const onvif::MediaProfile& profile: client.getProfiles(mediaUrl))
    {
        if (isInterrupted())
            return;

        if (!profile.hasVideo())
            continue;

        const auto uri = client.getStreamUri(mediaUrl, profile.token);
        if (!uri)
        {
            CCTV_DEBUG(this, lm("%1: no stream URI for profile %2").args(
                device->address, profile.token));
            continue;
        }

        RtspStream stream = streamFromProfile(profile, *uri);
        if (const auto described = prober->describe(*uri))
            mergeDescribedStream(&stream, *described);
        device->addStream(std::move(stream));
    }
}

void DeviceDiscoveryPipeline::analyzeRtsp(Device* device, RtspStreamProber* prober)
{
    if (device->rtspPorts.empty())
        return;

    std::vector<RtspStream> streams = device->isNvr
        ? prober->iterateNvrChannels(*device)
        : prober->discoverStreams(*device);

    if (!device->credential && prober->acceptedCredential())
        device->credential = prober->acceptedCredential();

    for (RtspStream& stream: streams)
        device->addStream(std::move(stream));
}

std::vector<auth::Credential> DeviceDiscoveryPipeline::credentialsFor(const Device& device) const
{
    if (!device.credential)
        return m_credentials;

    std::vector<auth::Credential> credentials{*device.credential};
    for (const auth::Credential& credential: m_credentials)
    {
        if (credential != *device.credential)
            credentials.push_back(credential);
    }
    return credentials;
}

void DeviceDiscoveryPipeline::fail(Device* device, const QString& message)
{
    if (isTerminal(device->status()))
        return;

    const DeviceStatus previous = device->status();
    const QString text = message.trimmed().isEmpty() ? QString("Unknown error") : message;
    const bool changed = device->transitionTo(DeviceStatus::error, text);
    CCTV_ASSERT(changed, lm("%1: cannot enter ERROR from %2").args(
        device->address, toString(previous)));
}

bool DeviceDiscoveryPipeline::isInterrupted() const
{
    return m_isInterrupted && m_isInterrupted();
}

} // namespace discovery
} // namespace cctv
