#include "test_tcp_server.h"

#include <memory>

#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>

namespace cctv {
namespace network {
namespace test {

namespace {

static const int kWaitMs = 5000;
static const std::chrono::milliseconds kPartInterval(50);
static const std::chrono::seconds kMaxConnectionLifetime(30);

} // namespace

TestTcpServer::TestTcpServer(std::vector<QByteArray> responseParts, Completion completion):
    m_responseParts(std::move(responseParts)),
    m_completion(completion)
{
}

TestTcpServer::~TestTcpServer()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
    }
    m_stopCondition.notify_all();

    if (m_thread.joinable())
        m_thread.join();
}

bool TestTcpServer::start()
{
    std::promise<quint16> listening;
    std::future<quint16> port = listening.get_future();
    m_thread = std::thread([this, &listening]() { serve(&listening); });
    m_port = port.get();
    return m_port != 0;
}

QByteArray TestTcpServer::receivedRequest() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_receivedRequest;
}

void TestTcpServer::serve(std::promise<quint16>* listening)
{
    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, 0))
    {
        listening->set_value(0);
        return;
    }
    listening->set_value(server.serverPort()); //< listening is gone after this point.

    if (!server.waitForNewConnection(kWaitMs))
        return;

    std::unique_ptr<QTcpSocket> connection(server.nextPendingConnection());
    if (!connection)
        return;

    QByteArray request;
    while (!request.contains("\r\n\r\n") && connection->waitForReadyRead(kWaitMs))
        request += connection->readAll();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_receivedRequest = request;
    }

    for (const QByteArray& part: m_responseParts)
    {
        connection->write(part);
        while (connection->bytesToWrite() > 0 && connection->waitForBytesWritten(kWaitMs))
        {
        }
        std::this_thread::sleep_for(kPartInterval);
    }

    if (m_completion == Completion::keepConnectionOpen)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_stopCondition.wait_for(lock, kMaxConnectionLifetime, [this]() { return m_stopped; });
    }

    connection->disconnectFromHost();
    if (connection->state() != QAbstractSocket::UnconnectedState)
        connection->waitForDisconnected(kWaitMs);
}

} // namespace test
} // namespace network
} // namespace cctv
