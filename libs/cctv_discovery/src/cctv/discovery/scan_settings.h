#pragma once

#include <chrono>
#include <vector>

#include <QtCore/QSettings>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace cctv {
namespace discovery {

struct CompliancePolicy
{
    QStringList acceptedCodecs{"H.264", "H.265"};
    int minBitrateKbps = 64;
    int maxBitrateKbps = 16384;
    QStringList recognizedProfiles{
        "Baseline", "Constrained Baseline", "Main", "Extended", "High", "Main 10"};
    bool flagHighProfile = true;
    int subStreamMinHeight = 360;
    int subStreamMaxHeight = 480;
    int subStreamMaxBitrateKbps = 512;

    void load(QSettings* settings);
    void save(QSettings* settings) const;
};

struct RtspPathPair
{
    QString mainPath;
    QString subPath;
};

struct ScanSettings
{
    std::vector<int> onvifPorts{80, 8080, 443, 8443};
    std::vector<int> rtspPorts{554, 8554, 8888};
    std::vector<int> specialPorts{8000, 37777, 34567};
    std::vector<int> nvrPorts{8000, 37777};

    std::chrono::milliseconds portProbeTimeout{2000};
    std::chrono::milliseconds requestTimeout{5000};
    std::chrono::milliseconds macResolutionTimeout{3000};
    std::chrono::milliseconds wsDiscoveryTimeout{3000};

    bool macResolution = true;
    bool wsDiscovery = false;
    int maxConcurrentDevices = defaultMaxConcurrentDevices();

    std::vector<RtspPathPair> customRtspPaths;
    int nvrMaxChannels = 64;
    int nvrConsecutiveFailures = 3;

    QString ouiDatabasePath;

    CompliancePolicy compliance;

    /**
     * Keys missing from settings keep their current values.
     */
    void load(QSettings* settings);
    void save(QSettings* settings) const;

    /**
     * min(8 * cores, 64).
     */
    static int defaultMaxConcurrentDevices();
};

} // namespace discovery
} // namespace cctv
