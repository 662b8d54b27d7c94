#pragma once

#include <functional>
#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QUrl>

#include <cctv/network/auth/auth_negotiator.h>
#include <cctv/network/hardware_address_resolver.h>
#include <cctv/network/http/transport.h>
#include <cctv/network/port_probe.h>

#include "device.h"
#include "oui_database.h"
#include "rtsp_stream_prober.h"
#include "scan_settings.h"
#include "stream_compliance_analyzer.h"

namespace cctv {
namespace discovery {

/**
 * Drives one Device through scanning, authentication and stream analysis. The device always
 * ends in a terminal status. Steps are sequential, the interruption check runs between them.
 */
class DeviceDiscoveryPipeline
{
public:
    DeviceDiscoveryPipeline(
        network::AbstractPortProbe* portProbe,
        network::AbstractHardwareAddressResolver* hardwareAddressResolver,
        network::http::AbstractTransport* transport,
        const ScanSettings& settings,
        const OuiDatabase& ouiDatabase,
        std::vector<network::auth::Credential> credentials,
        RtspPathCache* pathCache = nullptr,
        std::function<bool()> isInterrupted = nullptr);

    void run(Device* device);

private:
    enum class ServiceKind
    {
        onvif,
        rtsp,
    };

    struct AuthenticatedService
    {
        ServiceKind kind = ServiceKind::rtsp;
        QUrl url;
        network::auth::NegotiationResult negotiation;
    };

    void runSteps(Device* device);

    /**
     * @return false if the device was moved to a terminal status.
     */
    bool scanPorts(Device* device);
    void resolveManufacturer(Device* device);

    boost::optional<AuthenticatedService> authenticate(Device* device);
    std::vector<QUrl> onvifServiceUrls(const Device& device) const;

    void analyzeOnvif(
        Device* device, const AuthenticatedService& service, RtspStreamProber* prober);
    void analyzeRtsp(Device* device, RtspStreamProber* prober);

    std::vector<network::auth::Credential> credentialsFor(const Device& device) const;
    void fail(Device* device, const QString& message);
    bool isInterrupted() const;

private:
    network::AbstractPortProbe* m_portProbe;
    network::AbstractHardwareAddressResolver* m_hardwareAddressResolver;
    network::http::AbstractTransport* m_transport;
    const ScanSettings& m_settings;
    const OuiDatabase& m_ouiDatabase;
    std::vector<network::auth::Credential> m_credentials;
    RtspPathCache* m_pathCache;
    std::function<bool()> m_isInterrupted;
    network::auth::AuthNegotiator m_negotiator;
    StreamComplianceAnalyzer m_complianceAnalyzer;
};

} // namespace discovery
} // namespace cctv
