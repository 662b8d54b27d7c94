#include <cstdio>
#include <vector>

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QSettings>
#include <QtCore/QTextStream>

#include <cctv/discovery/abstract_scan_observer.h>
#include <cctv/discovery/oui_database.h>
#include <cctv/discovery/scan_session.h>
#include <cctv/discovery/scan_settings.h>
#include <cctv/discovery/ws_discovery.h>
#include <cctv/network/auth/credential.h>
#include <cctv/network/hardware_address_resolver.h>
#include <cctv/network/http/transport.h>
#include <cctv/network/ip_range.h>
#include <cctv/network/port_probe.h>
#include <cctv/network/validation_error.h>
#include <cctv/utils/log/log.h>

using namespace cctv;

namespace {

static const int kSuccessExitCode = 0;
static const int kFailureExitCode = 1;

class ConsoleScanObserver:
    public discovery::AbstractScanObserver
{
public:
    explicit ConsoleScanObserver(bool quiet):
        m_out(stdout),
        m_quiet(quiet)
    {
    }

    virtual void deviceUpdated(const discovery::Device& device) override
    {
        m_lastDevice = QString("%1 %2").arg(device.address, toString(device.status()));
        if (device.errorMessage())
            m_lastDevice += QString(" (%1)").arg(*device.errorMessage());
    }

    virtual void progressChanged(int done, int total) override
    {
        if (m_quiet)
            return;
        m_out << QString("[%1/%2] %3").arg(done).arg(total).arg(m_lastDevice) << endl;
    }

    virtual void scanFinished() override
    {
        if (!m_quiet)
            m_out << "Scan finished" << endl;
    }

private:
    QTextStream m_out;
    const bool m_quiet;
    QString m_lastDevice;
};

QString optionalText(const boost::optional<QString>& value)
{
    return value ? *value : QString();
}

QJsonObject toJson(const discovery::RtspStream& stream)
{
    QJsonObject object;
    object["videoSource"] = stream.videoSourceName;
    object["channel"] = stream.channelName;
    object["name"] = stream.streamName;
    object["url"] = stream.url;
    object["resolution"] = stream.resolution;
    object["codec"] = stream.codec;
    object["profile"] = stream.profile;
    if (stream.bitrateKbps)
        object["bitrateKbps"] = *stream.bitrateKbps;
    if (stream.frameRate)
        object["frameRate"] = *stream.frameRate;
    object["compliant"] = stream.compliant;
    if (stream.complianceIssues)
        object["complianceIssues"] = *stream.complianceIssues;
    if (stream.sdpSessionName)
        object["sdpSessionName"] = *stream.sdpSessionName;
    return object;
}

QJsonObject toJson(const discovery::Device& device)
{
    QJsonObject object;
    object["address"] = device.address;
    object["hardwareAddress"] = optionalText(device.hardwareAddress);
    object["status"] = toString(device.status());
    if (device.errorMessage())
        object["error"] = *device.errorMessage();
    object["name"] = device.name;
    object["type"] = device.type;
    object["manufacturer"] = device.manufacturer;
    object["model"] = device.model;
    object["serialNumber"] = device.serialNumber;
    object["firmwareVersion"] = device.firmwareVersion;
    if (device.clockOffsetSeconds)
        object["clockOffsetSeconds"] = (double) *device.clockOffsetSeconds;
    if (device.credential)
        object["credential"] = device.credential->toString();
    object["onvifServiceUrl"] = optionalText(device.onvifServiceUrl);
    object["authMethod"] = network::auth::toString(device.authMethod);
    object["authFailed"] = device.authFailed;
    object["nvr"] = device.isNvr;

    const auto portsToJson =
        [](const std::set<int>& ports)
        {
            QJsonArray array;
            for (const int port: ports)
                array.append(port);
            return array;
        };
    object["onvifPorts"] = portsToJson(device.onvifPorts);
    object["rtspPorts"] = portsToJson(device.rtspPorts);
    object["specialPorts"] = portsToJson(device.specialPorts);

    QJsonArray streams;
    for (const discovery::RtspStream& stream: device.streams)
        streams.append(toJson(stream));
    object["streams"] = streams;
    return object;
}

void printReport(const std::vector<discovery::Device>& devices, QTextStream* out)
{
    int completed = 0;
    for (const discovery::Device& device: devices)
    {
        if (device.status() == discovery::DeviceStatus::completed)
            ++completed;
        else if (device.status() == discovery::DeviceStatus::error && !device.hasOpenPorts())
            continue; //< Nothing listens there.

        *out << QString("%1 %2").arg(device.address, toString(device.status()));
        if (device.hardwareAddress)
            *out << " mac=" << *device.hardwareAddress;
        if (!device.manufacturer.isEmpty())
            *out << " manufacturer=\"" << device.manufacturer << "\"";
        if (!device.model.isEmpty())
            *out << " model=\"" << device.model << "\"";
        if (device.isNvr)
            *out << " nvr";
        *out << " auth=" << network::auth::toString(device.authMethod);
        if (device.credential)
            *out << " credential=" << device.credential->toString();
        if (device.errorMessage())
            *out << " error=\"" << *device.errorMessage() << "\"";
        *out << endl;

        for (const discovery::RtspStream& stream: device.streams)
        {
            *out << QString("    %1 %2 %3 %4").arg(
                stream.streamName, stream.url, stream.codec, stream.resolution);
            if (!stream.profile.isEmpty())
                *out << " " << stream.profile;
            if (stream.bitrateKbps)
                *out << " " << *stream.bitrateKbps << "kbps";
            if (stream.frameRate)
                *out << " " << *stream.frameRate << "fps";
            *out << (stream.compliant ? " compliant" : " NOT compliant");
            if (stream.complianceIssues)
                *out << ": " << *stream.complianceIssues;
            *out << endl;
        }
    }

    *out << QString("%1 of %2 address(es) completed").arg(completed).arg(devices.size()) << endl;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication application(argc, argv);
    QCoreApplication::setApplicationName("cctv_scanner");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Finds IP cameras and NVRs, their streams and credentials.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(
        "targets", "CIDR blocks (a.b.c.d/n), ranges (a.b.c.d-e.f.g.h) or addresses.", "targets...");

    const QCommandLineOption credentialOption(
        QStringList{"c", "credential"}, "Credential to try, repeatable.", "user:password");
    const QCommandLineOption configOption("config", "Read settings from an INI file.", "ini");
    const QCommandLineOption writeConfigOption(
        "write-config", "Write the effective settings to an INI file and exit.", "ini");
    const QCommandLineOption logLevelOption(
        "log-level", "none, error, warning, info, debug or verbose.", "level", "warning");
    const QCommandLineOption logFileOption("log-file", "Log to a file instead of stderr.", "path");
    const QCommandLineOption maxConcurrencyOption(
        "max-concurrency", "Devices scanned in parallel.", "count");
    const QCommandLineOption wsDiscoveryOption(
        "ws-discovery", "Add devices answering an ONVIF WS-Discovery probe.");
    const QCommandLineOption jsonOption("json", "Print the report as JSON.");
    const QCommandLineOption countOnlyOption(
        "count-only", "Print the number of addresses and exit.");
    parser.addOptions({
        credentialOption, configOption, writeConfigOption, logLevelOption, logFileOption,
        maxConcurrencyOption, wsDiscoveryOption, jsonOption, countOnlyOption});
    parser.process(application);

    QTextStream out(stdout);
    QTextStream err(stderr);

    auto logger = utils::log::Logger::instance();
    logger->setLevel(utils::log::levelFromString(
        parser.value(logLevelOption), utils::log::Level::warning));
    if (parser.isSet(logFileOption) && !logger->setLogFile(parser.value(logFileOption)))
    {
        err << "Cannot open log file " << parser.value(logFileOption) << endl;
        return kFailureExitCode;
    }

    discovery::ScanSettings settings;
    if (parser.isSet(configOption))
    {
        QSettings config(parser.value(configOption), QSettings::IniFormat);
        if (config.status() != QSettings::NoError)
        {
            err << "Cannot read configuration " << parser.value(configOption) << endl;
            return kFailureExitCode;
        }
        settings.load(&config);
    }

    if (parser.isSet(maxConcurrencyOption))
    {
        bool ok = false;
        const int maxConcurrency = parser.value(maxConcurrencyOption).toInt(&ok);
        if (!ok || maxConcurrency <= 0)
        {
            err << "Invalid --max-concurrency value " << parser.value(maxConcurrencyOption) << endl;
            return kFailureExitCode;
        }
        settings.maxConcurrentDevices = maxConcurrency;
    }

    if (parser.isSet(wsDiscoveryOption))
        settings.wsDiscovery = true;

    if (parser.isSet(writeConfigOption))
    {
        QSettings config(parser.value(writeConfigOption), QSettings::IniFormat);
        settings.save(&config);
        config.sync();
        if (config.status() != QSettings::NoError)
        {
            err << "Cannot write configuration " << parser.value(writeConfigOption) << endl;
            return kFailureExitCode;
        }
        out << "Configuration written to " << parser.value(writeConfigOption) << endl;
        return kSuccessExitCode;
    }

    network::RangeExpander expander;
    try
    {
        expander.add(parser.positionalArguments());
    }
    catch (const network::ValidationError& e)
    {
        err << e.what() << endl;
        return kFailureExitCode;
    }

    if (parser.isSet(countOnlyOption))
    {
        out << expander.count() << endl;
        return kSuccessExitCode;
    }

    std::vector<network::auth::Credential> credentials;
    for (const QString& text: parser.values(credentialOption))
    {
        network::auth::Credential credential;
        if (!network::auth::Credential::parse(text, &credential))
        {
            err << "Invalid credential, expected user:password" << endl;
            return kFailureExitCode;
        }
        credentials.push_back(credential);
    }

    std::vector<discovery::WsDiscoveryMatch> wsDiscoveryMatches;
    if (settings.wsDiscovery)
        wsDiscoveryMatches = discovery::WsDiscoveryProbe(settings.wsDiscoveryTimeout).probe();

    if (expander.count() == 0 && wsDiscoveryMatches.empty())
    {
        err << "No targets. Give CIDR blocks, ranges or addresses, or use --ws-discovery." << endl;
        return kFailureExitCode;
    }

    discovery::OuiDatabase ouiDatabase;
    if (!settings.ouiDatabasePath.isEmpty()
        && ouiDatabase.loadCsvFile(settings.ouiDatabasePath) < 0)
    {
        CCTV_WARNING("main", lm("Cannot read OUI database %1, using the built-in table")
            .arg(settings.ouiDatabasePath));
    }

    std::vector<discovery::Device> candidates =
        discovery::ScanSession::makeCandidates(expander, wsDiscoveryMatches);
    const bool json = parser.isSet(jsonOption);
    if (!json)
        out << "Scanning " << candidates.size() << " address(es)" << endl;

    network::TcpPortProbe portProbe;
    network::NeighborTableResolver hardwareAddressResolver(settings.macResolutionTimeout);
    network::http::TcpTransport transport(settings.requestTimeout);

    discovery::ScanSession session(
        settings, credentials, &portProbe, &hardwareAddressResolver, &transport, ouiDatabase);
    ConsoleScanObserver observer(/*quiet*/ json);
    session.setObserver(&observer);

    const std::vector<discovery::Device> devices = session.run(std::move(candidates));

    if (json)
    {
        QJsonArray report;
        for (const discovery::Device& device: devices)
            report.append(toJson(device));
        out << QJsonDocument(report).toJson(QJsonDocument::Indented);
    }
    else
    {
        printReport(devices, &out);
    }

    return kSuccessExitCode;
}
