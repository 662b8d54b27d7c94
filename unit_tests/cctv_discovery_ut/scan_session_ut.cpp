#include <gtest/gtest.h>

#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>

#include <cctv/discovery/scan_session.h>

#include "test_support/fake_camera_network.h"

namespace cctv {
namespace discovery {
namespace test {

using namespace network;

/**
 * Records notifications. Optionally cancels the session on the first device update.
 */
class RecordingObserver:
    public AbstractScanObserver
{
public:
    discovery::ScanSession* sessionToCancel = nullptr;

    virtual void deviceUpdated(const Device& device) override
    {
        QMutexLocker lock(&m_mutex);
        m_updatedAddresses.append(device.address);
        if (sessionToCancel)
            sessionToCancel->cancel();
    }

    virtual void progressChanged(int done, int total) override
    {
        QMutexLocker lock(&m_mutex);
        m_progress.push_back({done, total});
    }

    virtual void scanFinished() override
    {
        QMutexLocker lock(&m_mutex);
        ++m_finishedCount;
    }

    QStringList updatedAddresses() const
    {
        QMutexLocker lock(&m_mutex);
        return m_updatedAddresses;
    }

    std::vector<std::pair<int, int>> progress() const
    {
        QMutexLocker lock(&m_mutex);
        return m_progress;
    }

    int finishedCount() const
    {
        QMutexLocker lock(&m_mutex);
        return m_finishedCount;
    }

private:
    mutable QMutex m_mutex;
    QStringList m_updatedAddresses;
    std::vector<std::pair<int, int>> m_progress;
    int m_finishedCount = 0;
};

class ScanSession:
    public ::testing::Test
{
protected:
    ScanSession()
    {
        m_network.addCamera("10.0.0.1", makeOnvifCamera());
        m_network.addCamera("10.0.0.2", makeRtspCamera());
        m_network.addCamera("10.0.0.3", makeRtspCamera());
    }

    void givenSession(int maxConcurrentDevices)
    {
        ScanSettings settings;
        settings.maxConcurrentDevices = maxConcurrentDevices;
        m_session = std::make_unique<discovery::ScanSession>(
            settings,
            std::vector<auth::Credential>{{"admin", "12345"}},
            &m_network,
            &m_network,
            &m_network);
        m_session->setObserver(&m_observer);
    }

    void whenScan(const QString& range)
    {
        RangeExpander expander;
        expander.add(range);
        m_devices = m_session->run(discovery::ScanSession::makeCandidates(expander));
    }

    void thenStatusesAre(const QStringList& expected)
    {
        QStringList statuses;
        for (const auto& device: m_devices)
            statuses.append(toString(device.status()));
        ASSERT_EQ(expected, statuses);
    }

    FakeCameraNetwork m_network;
    RecordingObserver m_observer;
    std::unique_ptr<discovery::ScanSession> m_session;
    std::vector<Device> m_devices;
};

TEST_F(ScanSession, every_candidate_is_reported_in_order)
{
    givenSession(4);

    whenScan("10.0.0.1-10.0.0.5");

    thenStatusesAre({"COMPLETED", "COMPLETED", "COMPLETED", "ERROR", "ERROR"});
    ASSERT_EQ("10.0.0.4", m_devices[3].address);
    ASSERT_EQ(2U, m_devices[1].streams.size());
    ASSERT_EQ(5, m_session->total());
    ASSERT_EQ(5, m_session->done());
    ASSERT_FALSE(m_session->isCancelled());

    ASSERT_EQ(5, m_observer.updatedAddresses().size());
    ASSERT_EQ(5U, m_observer.progress().size());
    ASSERT_EQ(std::make_pair(5, 5), m_observer.progress().back());
    ASSERT_EQ(1, m_observer.finishedCount());
}

TEST_F(ScanSession, cancellation_ends_remaining_devices)
{
    givenSession(1);
    m_observer.sessionToCancel = m_session.get();

    whenScan("10.0.0.1-10.0.0.4");

    thenStatusesAre({"COMPLETED", "ERROR", "ERROR", "ERROR"});
    for (std::size_t i = 1; i < m_devices.size(); ++i)
        ASSERT_EQ("Scan cancelled", m_devices[i].errorMessage().get_value_or(QString()));
    ASSERT_TRUE(m_session->isCancelled());
    ASSERT_EQ(4, m_session->done());
    ASSERT_EQ(1, m_observer.finishedCount());
}

TEST_F(ScanSession, single_worker_scans_sequentially)
{
    givenSession(1);

    whenScan("10.0.0.1-10.0.0.3");

    thenStatusesAre({"COMPLETED", "COMPLETED", "COMPLETED"});
    ASSERT_EQ(
        (QStringList{"10.0.0.1", "10.0.0.2", "10.0.0.3"}),
        m_observer.updatedAddresses());
}

TEST_F(ScanSession, empty_candidate_list)
{
    givenSession(2);

    m_devices = m_session->run({});

    ASSERT_TRUE(m_devices.empty());
    ASSERT_EQ(0, m_session->total());
    ASSERT_EQ(1, m_observer.finishedCount());
}

//-------------------------------------------------------------------------------------------------

TEST(ScanSessionCandidates, ws_discovery_matches_are_merged)
{
    RangeExpander expander;
    expander.add("192.168.1.10-192.168.1.12");

    WsDiscoveryMatch known;
    known.address = "192.168.1.11";
    known.serviceUrl = "http://192.168.1.11:8080/onvif/device_service";

    WsDiscoveryMatch outside;
    outside.address = "192.168.2.50";
    outside.serviceUrl = "http://192.168.2.50/onvif/device_service";

    const auto candidates = discovery::ScanSession::makeCandidates(expander, {known, outside});

    ASSERT_EQ(4U, candidates.size());
    ASSERT_EQ("192.168.1.10", candidates[0].address);
    ASSERT_FALSE(static_cast<bool>(candidates[0].onvifServiceUrl));
    ASSERT_EQ(known.serviceUrl, candidates[1].onvifServiceUrl.get_value_or(QString()));
    ASSERT_EQ("192.168.2.50", candidates[3].address);
    ASSERT_EQ(outside.serviceUrl, candidates[3].onvifServiceUrl.get_value_or(QString()));
    for (const auto& candidate: candidates)
        ASSERT_TRUE(candidate.status() == DeviceStatus::pending);
}

} // namespace test
} // namespace discovery
} // namespace cctv
