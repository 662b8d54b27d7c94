#include <gtest/gtest.h>

#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>

#include <cctv/discovery/scan_settings.h>

namespace cctv {
namespace discovery {
namespace test {

class ScanSettings:
    public ::testing::Test
{
protected:
    virtual void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
    }

    QString settingsPath() const { return m_dir.filePath("cctv_scanner.ini"); }

    void givenIni(const QByteArray& content)
    {
        QFile file(settingsPath());
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(content);
    }

    discovery::ScanSettings load() const
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        discovery::ScanSettings result;
        result.load(&settings);
        return result;
    }

private:
    QTemporaryDir m_dir;
};

TEST_F(ScanSettings, defaults)
{
    discovery::ScanSettings settings;

    ASSERT_EQ((std::vector<int>{80, 8080, 443, 8443}), settings.onvifPorts);
    ASSERT_EQ((std::vector<int>{554, 8554, 8888}), settings.rtspPorts);
    ASSERT_EQ((std::vector<int>{8000, 37777, 34567}), settings.specialPorts);
    ASSERT_EQ(2000, settings.portProbeTimeout.count());
    ASSERT_TRUE(settings.macResolution);
    ASSERT_FALSE(settings.wsDiscovery);
    ASSERT_GE(settings.maxConcurrentDevices, 1);
    ASSERT_LE(settings.maxConcurrentDevices, 64);
    ASSERT_EQ(64, settings.compliance.minBitrateKbps);
    ASSERT_TRUE(settings.compliance.flagHighProfile);
}

TEST_F(ScanSettings, missing_keys_keep_defaults)
{
    givenIni(
        "[ports]\n"
        "rtsp=554, 10554\n"
        "[discovery]\n"
        "macResolution=false\n"
        "maxConcurrentDevices=0\n");

    const auto settings = load();

    ASSERT_EQ((std::vector<int>{554, 10554}), settings.rtspPorts);
    ASSERT_EQ((std::vector<int>{80, 8080, 443, 8443}), settings.onvifPorts);
    ASSERT_FALSE(settings.macResolution);
    ASSERT_EQ(1, settings.maxConcurrentDevices);
    ASSERT_EQ(5000, settings.requestTimeout.count());
}

TEST_F(ScanSettings, invalid_values_are_dropped)
{
    givenIni(
        "[ports]\n"
        "onvif=80, http, 70000\n"
        "[timeouts]\n"
        "portProbeMs=-5\n"
        "[rtsp]\n"
        "customPaths=/main, /sub, /odd\n");

    const auto settings = load();

    ASSERT_EQ((std::vector<int>{80}), settings.onvifPorts);
    ASSERT_EQ(2000, settings.portProbeTimeout.count());
    ASSERT_EQ(1U, settings.customRtspPaths.size());
    ASSERT_EQ("/main", settings.customRtspPaths[0].mainPath);
    ASSERT_EQ("/sub", settings.customRtspPaths[0].subPath);
}

TEST_F(ScanSettings, saved_settings_load_back)
{
    discovery::ScanSettings original;
    original.onvifPorts = {8899};
    original.requestTimeout = std::chrono::milliseconds(1500);
    original.wsDiscovery = true;
    original.maxConcurrentDevices = 3;
    original.customRtspPaths = {{"/live/main", "/live/sub"}};
    original.nvrMaxChannels = 16;
    original.ouiDatabasePath = "/usr/share/cctv/oui.csv";
    original.compliance.acceptedCodecs = QStringList{"H.264"};
    original.compliance.flagHighProfile = false;
    original.compliance.subStreamMaxBitrateKbps = 1024;
    {
        QSettings settings(settingsPath(), QSettings::IniFormat);
        original.save(&settings);
    }

    const auto loaded = load();

    ASSERT_EQ(original.onvifPorts, loaded.onvifPorts);
    ASSERT_EQ(1500, loaded.requestTimeout.count());
    ASSERT_TRUE(loaded.wsDiscovery);
    ASSERT_EQ(3, loaded.maxConcurrentDevices);
    ASSERT_EQ(1U, loaded.customRtspPaths.size());
    ASSERT_EQ("/live/sub", loaded.customRtspPaths[0].subPath);
    ASSERT_EQ(16, loaded.nvrMaxChannels);
    ASSERT_EQ("/usr/share/cctv/oui.csv", loaded.ouiDatabasePath);
    ASSERT_EQ(QStringList{"H.264"}, loaded.compliance.acceptedCodecs);
    ASSERT_FALSE(loaded.compliance.flagHighProfile);
    ASSERT_EQ(1024, loaded.compliance.subStreamMaxBitrateKbps);
}

} // namespace test
} // namespace discovery
} // namespace cctv
