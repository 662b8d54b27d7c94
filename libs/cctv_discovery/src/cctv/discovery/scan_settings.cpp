#include "scan_settings.h"

#include <algorithm>

#include <QtCore/QThread>

namespace cctv {
namespace discovery {

namespace {

static const int kThreadsPerCore = 8;
static const int kMaxConcurrentDevices = 64;

std::vector<int> toPorts(const QVariant& value, const std::vector<int>& defaultValue)
{
    if (!value.isValid())
        return defaultValue;

    std::vector<int> result;
    for (const QString& text: value.toStringList())
    {
        bool ok = false;
        const int port = text.trimmed().toInt(&ok);
        if (ok && port > 0 && port <= 65535)
            result.push_back(port);
    }
    return result;
}

QStringList fromPorts(const std::vector<int>& ports)
{
    QStringList result;
    for (const int port: ports)
        result.append(QString::number(port));
    return result;
}

std::chrono::milliseconds readMs(
    QSettings* settings, const QString& key, std::chrono::milliseconds defaultValue)
{
    bool ok = false;
    const qlonglong value = settings->value(key, qlonglong(defaultValue.count())).toLongLong(&ok);
    return ok && value > 0 ? std::chrono::milliseconds(value) : defaultValue;
}

int readInt(QSettings* settings, const QString& key, int defaultValue)
{
    bool ok = false;
    const int value = settings->value(key, defaultValue).toInt(&ok);
    return ok ? value : defaultValue;
}

QStringList readList(QSettings* settings, const QString& key, const QStringList& defaultValue)
{
    if (!settings->contains(key))
        return defaultValue;

    QStringList result;
    for (const QString& item: settings->value(key).toStringList())
    {
        if (!item.trimmed().isEmpty())
            result.append(item.trimmed());
    }
    return result;
}

} // namespace

void CompliancePolicy::load(QSettings* settings)
{
    settings->beginGroup(QLatin1String("compliance"));
    acceptedCodecs = readList(settings, "codecs", acceptedCodecs);
    minBitrateKbps = readInt(settings, "minBitrateKbps", minBitrateKbps);
    maxBitrateKbps = readInt(settings, "maxBitrateKbps", maxBitrateKbps);
    recognizedProfiles = readList(settings, "profiles", recognizedProfiles);
    flagHighProfile = settings->value("flagHighProfile", flagHighProfile).toBool();
    subStreamMinHeight = readInt(settings, "subStreamMinHeight", subStreamMinHeight);
    subStreamMaxHeight = readInt(settings, "subStreamMaxHeight", subStreamMaxHeight);
    subStreamMaxBitrateKbps =
        readInt(settings, "subStreamMaxBitrateKbps", subStreamMaxBitrateKbps);
    settings->endGroup();
}

void CompliancePolicy::save(QSettings* settings) const
{
    settings->beginGroup(QLatin1String("compliance"));
    settings->setValue("codecs", acceptedCodecs);
    settings->setValue("minBitrateKbps", minBitrateKbps);
    settings->setValue("maxBitrateKbps", maxBitrateKbps);
    settings->setValue("profiles", recognizedProfiles);
    settings->setValue("flagHighProfile", flagHighProfile);
    settings->setValue("subStreamMinHeight", subStreamMinHeight);
    settings->setValue("subStreamMaxHeight", subStreamMaxHeight);
    settings->setValue("subStreamMaxBitrateKbps", subStreamMaxBitrateKbps);
    settings->endGroup();
}

//-------------------------------------------------------------------------------------------------

void ScanSettings::load(QSettings* settings)
{
    settings->beginGroup(QLatin1String("ports"));
    onvifPorts = toPorts(settings->value("onvif"), onvifPorts);
    rtspPorts = toPorts(settings->value("rtsp"), rtspPorts);
    specialPorts = toPorts(settings->value("special"), specialPorts);
    nvrPorts = toPorts(settings->value("nvr"), nvrPorts);
    settings->endGroup();

    settings->beginGroup(QLatin1String("timeouts"));
    portProbeTimeout = readMs(settings, "portProbeMs", portProbeTimeout);
    requestTimeout = readMs(settings, "requestMs", requestTimeout);
    macResolutionTimeout = readMs(settings, "macResolutionMs", macResolutionTimeout);
    wsDiscoveryTimeout = readMs(settings, "wsDiscoveryMs", wsDiscoveryTimeout);
    settings->endGroup();

    settings->beginGroup(QLatin1String("discovery"));
    macResolution = settings->value("macResolution", macResolution).toBool();
    wsDiscovery = settings->value("wsDiscovery", wsDiscovery).toBool();
    maxConcurrentDevices =
        std::max(1, readInt(settings, "maxConcurrentDevices", maxConcurrentDevices));
    settings->endGroup();

    settings->beginGroup(QLatin1String("rtsp"));
    if (settings->contains("customPaths"))
    {
        const QStringList paths = readList(settings, "customPaths", QStringList());
        customRtspPaths.clear();
        for (int i = 0; i + 1 < paths.size(); i += 2)
            customRtspPaths.push_back({paths[i], paths[i + 1]});
    }
    nvrMaxChannels = readInt(settings, "nvrMaxChannels", nvrMaxChannels);
    nvrConsecutiveFailures = readInt(settings, "nvrConsecutiveFailures", nvrConsecutiveFailures);
    settings->endGroup();

    settings->beginGroup(QLatin1String("oui"));
    ouiDatabasePath = settings->value("databasePath", ouiDatabasePath).toString();
    settings->endGroup();

    compliance.load(settings);
}

void ScanSettings::save(QSettings* settings) const
{
    settings->beginGroup(QLatin1String("ports"));
    settings->setValue("onvif", fromPorts(onvifPorts));
    settings->setValue("rtsp", fromPorts(rtspPorts));
    settings->setValue("special", fromPorts(specialPorts));
    settings->setValue("nvr", fromPorts(nvrPorts));
    settings->endGroup();

    settings->beginGroup(QLatin1String("timeouts"));
    settings->setValue("portProbeMs", qlonglong(portProbeTimeout.count()));
    settings->setValue("requestMs", qlonglong(requestTimeout.count()));
    settings->setValue("macResolutionMs", qlonglong(macResolutionTimeout.count()));
    settings->setValue("wsDiscoveryMs", qlonglong(wsDiscoveryTimeout.count()));
    settings->endGroup();

    settings->beginGroup(QLatin1String("discovery"));
    settings->setValue("macResolution", macResolution);
    settings->setValue("wsDiscovery", wsDiscovery);
    settings->setValue("maxConcurrentDevices", maxConcurrentDevices);
    settings->endGroup();

    settings->beginGroup(QLatin1String("rtsp"));
    QStringList paths;
    for (const auto& pair: customRtspPaths)
        paths << pair.mainPath << pair.subPath;
    settings->setValue("customPaths", paths);
    settings->setValue("nvrMaxChannels", nvrMaxChannels);
    settings->setValue("nvrConsecutiveFailures", nvrConsecutiveFailures);
    settings->endGroup();

    settings->beginGroup(QLatin1String("oui"));
    settings->setValue("databasePath", ouiDatabasePath);
    settings->endGroup();

    compliance.save(settings);
}

int ScanSettings::defaultMaxConcurrentDevices()
{
    const int cores = std::max(1, QThread::idealThreadCount());
    return std::min(cores * kThreadsPerCore, kMaxConcurrentDevices);
}

} // namespace discovery
} // namespace cctv
