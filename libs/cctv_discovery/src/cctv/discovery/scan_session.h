#pragma once

#include <atomic>
#include <vector>

#include <QtCore/QMutex>
#include <QtCore/QStringList>
#include <QtCore/QThreadPool>

#include <cctv/network/auth/credential.h>
#include <cctv/network/hardware_address_resolver.h>
#include <cctv/network/http/transport.h>
#include <cctv/network/ip_range.h>
#include <cctv/network/port_probe.h>

#include "abstract_scan_observer.h"
#include "device.h"
#include "oui_database.h"
#include "rtsp_stream_prober.h"
#include "scan_settings.h"
#include "ws_discovery.h"

namespace cctv {
namespace discovery {

/**
 * Runs a DeviceDiscoveryPipeline per candidate on a private thread pool bounded by
 * ScanSettings::maxConcurrentDevices. Probe, resolver and transport are shared by all workers
 * and have to be thread-safe.
 */
class ScanSession
{
public:
    ScanSession(
        ScanSettings settings,
        std::vector<network::auth::Credential> credentials,
        network::AbstractPortProbe* portProbe,
        network::AbstractHardwareAddressResolver* hardwareAddressResolver,
        network::http::AbstractTransport* transport,
        OuiDatabase ouiDatabase = OuiDatabase());
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    void setObserver(AbstractScanObserver* observer);

    /**
     * Blocks until every candidate reached a terminal status.
     * @return One record per candidate, in candidate order.
     */
    std::vector<Device> run(std::vector<Device> candidates);

    /**
     * Can be called from any thread. Running steps finish, the rest end as "Scan cancelled".
     */
    void cancel();
    bool isCancelled() const { return m_cancelled; }

    int total() const { return m_total; }
    int done() const { return m_done; }

    const ScanSettings& settings() const { return m_settings; }

    /**
     * Addresses of expander in order, then WS-Discovery addresses not covered by it. Known
     * addresses take the discovered device service URL.
     */
    static std::vector<Device> makeCandidates(
        const network::RangeExpander& expander,
        const std::vector<WsDiscoveryMatch>& wsDiscoveryMatches = {});

private:
    class DeviceScanTask;

    void scanDevice(std::size_t index);

private:
    const ScanSettings m_settings;
    const std::vector<network::auth::Credential> m_credentials;
    network::AbstractPortProbe* m_portProbe;
    network::AbstractHardwareAddressResolver* m_hardwareAddressResolver;
    network::http::AbstractTransport* m_transport;
    const OuiDatabase m_ouiDatabase;

    QThreadPool m_threadPool;
    RtspPathCache m_pathCache;
    std::vector<Device> m_devices;

    mutable QMutex m_mutex;
    AbstractScanObserver* m_observer = nullptr;
    std::atomic<bool> m_cancelled{false};
    std::atomic<int> m_total{0};
    std::atomic<int> m_done{0};
};

} // namespace discovery
} // namespace cctv
