#include <chrono>

#include <gtest/gtest.h>

#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpServer>

#include <cctv/network/port_probe.h>

namespace cctv {
namespace network {
namespace test {

namespace {

static const std::chrono::milliseconds kTimeout(2000);

} // namespace

TEST(TcpPortProbe, listening_port_is_open)
{
    QTcpServer server;
    ASSERT_TRUE(server.listen(QHostAddress::LocalHost, 0));

    TcpPortProbe probe;
    ASSERT_TRUE(probe.isOpen("127.0.0.1", server.serverPort(), kTimeout));
}

TEST(TcpPortProbe, port_without_listener_is_closed)
{
    quint16 port = 0;
    {
        QTcpServer server;
        ASSERT_TRUE(server.listen(QHostAddress::LocalHost, 0));
        port = server.serverPort();
    }

    TcpPortProbe probe;
    ASSERT_FALSE(probe.isOpen("127.0.0.1", port, kTimeout));
}

TEST(TcpPortProbe, host_name_is_not_probed)
{
    TcpPortProbe probe;
    ASSERT_FALSE(probe.isOpen("camera.local", 80, kTimeout));
    ASSERT_FALSE(probe.isOpen("", 80, kTimeout));
}

} // namespace test
} // namespace network
} // namespace cctv
