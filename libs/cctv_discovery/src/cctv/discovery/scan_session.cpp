#include "scan_session.h"

#include <algorithm>

#include <QtCore/QMutexLocker>
#include <QtCore/QRunnable>

#include <cctv/utils/log/log.h>

#include "device_discovery_pipeline.h"

namespace cctv {
namespace discovery {

class ScanSession::DeviceScanTask:
    public QRunnable
{
public:
    DeviceScanTask(ScanSession* session, std::size_t index):
        m_session(session),
        m_index(index)
    {
    }

    virtual void run() override
    {
        m_session->scanDevice(m_index);
    }

private:
    ScanSession* m_session;
    const std::size_t m_index;
};

//-------------------------------------------------------------------------------------------------

ScanSession::ScanSession(
    ScanSettings settings,
    std::vector<network::auth::Credential> credentials,
    network::AbstractPortProbe* portProbe,
    network::AbstractHardwareAddressResolver* hardwareAddressResolver,
    network::http::AbstractTransport* transport,
    OuiDatabase ouiDatabase)
    :
    m_settings(std::move(settings)),
    m_credentials(std::move(credentials)),
    m_portProbe(portProbe),
    m_hardwareAddressResolver(hardwareAddressResolver),
    m_transport(transport),
    m_ouiDatabase(std::move(ouiDatabase))
{
    m_threadPool.setMaxThreadCount(std::max(1, m_settings.maxConcurrentDevices));
}

ScanSession::~ScanSession()
{
    m_cancelled = true;
    m_threadPool.waitForDone();
}

void ScanSession::setObserver(AbstractScanObserver* observer)
{
    QMutexLocker lock(&m_mutex);
    m_observer = observer;
}

std::vector<Device> ScanSession::run(std::vector<Device> candidates)
{
    m_devices = std::move(candidates);
    m_total = (int) m_devices.size();
    m_done = 0;

    CCTV_INFO(this, lm("Scanning %1 address(es) with %2 credential(s), %3 worker(s)").args(
        m_total.load(), m_credentials.size(), m_threadPool.maxThreadCount()));

    for (std::size_t i = 0; i < m_devices.size(); ++i)
        m_threadPool.start(new DeviceScanTask(this, i));
    m_threadPool.waitForDone();

    {
        QMutexLocker lock(&m_mutex);
        if (m_observer)
            m_observer->scanFinished();
    }

    CCTV_INFO(this, lm("Scan %1: %2 of %3 device(s) processed").args(
        m_cancelled ? "cancelled" : "finished", m_done.load(), m_total.load()));
    return std::move(m_devices);
}

void ScanSession::cancel()
{
    if (!m_cancelled.exchange(true))
        CCTV_INFO(this, "Cancelling scan");
}

void ScanSession::scanDevice(std::size_t index)
{
    Device& device = m_devices[index];

    DeviceDiscoveryPipeline pipeline(
        m_portProbe,
        m_hardwareAddressResolver,
        m_transport,
        m_settings,
        m_ouiDatabase,
        m_credentials,
        &m_pathCache,
        [this]() { return m_cancelled.load(); });
    pipeline.run(&device);

    const Device snapshot = device;
    QMutexLocker lock(&m_mutex);
    const int done = ++m_done;
    if (m_observer)
    {
        m_observer->deviceUpdated(snapshot);
        m_observer->progressChanged(done, m_total);
    }
}

std::vector<Device> ScanSession::makeCandidates(
    const network::RangeExpander& expander,
    const std::vector<WsDiscoveryMatch>& wsDiscoveryMatches)
{
    std::vector<Device> devices;
    for (const QString& address: expander.expand())
        devices.emplace_back(address);

    for (const WsDiscoveryMatch& match: wsDiscoveryMatches)
    {
        const auto existing = std::find_if(devices.begin(), devices.end(),
            [&match](const Device& device) { return device.address == match.address; });
        if (existing != devices.end())
        {
            existing->onvifServiceUrl = match.serviceUrl;
            continue;
        }

        Device device(match.address);
        device.onvifServiceUrl = match.serviceUrl;
        devices.push_back(std::move(device));
    }
    return devices;
}

} // namespace discovery
} // namespace cctv
