#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include <QtCore/QByteArray>

namespace cctv {
namespace network {
namespace test {

/**
 * Accepts one connection on 127.0.0.1 and serves it from its own thread: the request head is
 * recorded, then every response part is written with a short pause between parts.
 */
class TestTcpServer
{
public:
    enum class Completion
    {
        closeConnection,
        keepConnectionOpen, //< Until the server is destroyed.
    };

    TestTcpServer(std::vector<QByteArray> responseParts, Completion completion);
    ~TestTcpServer();

    TestTcpServer(const TestTcpServer&) = delete;
    TestTcpServer& operator=(const TestTcpServer&) = delete;

    /**
     * @return false if listening failed.
     */
    bool start();

    quint16 port() const { return m_port; }

    QByteArray receivedRequest() const;

private:
    void serve(std::promise<quint16>* listening);

private:
    const std::vector<QByteArray> m_responseParts;
    const Completion m_completion;
    quint16 m_port = 0;
    std::thread m_thread;

    mutable std::mutex m_mutex;
    std::condition_variable m_stopCondition;
    bool m_stopped = false;
    QByteArray m_receivedRequest;
};

} // namespace test
} // namespace network
} // namespace cctv
