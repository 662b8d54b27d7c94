#include "port_probe.h"

#include <QtNetwork/QHostAddress>
#include <QtNetwork/QTcpSocket>

#include <cctv/utils/log/log.h>

namespace cctv {
namespace network {

namespace {

class ScopedSocket
{
public:
    ~ScopedSocket() { socket.abort(); }

    QTcpSocket socket;
};

} // namespace

bool TcpPortProbe::isOpen(
    const QString& address,
    quint16 port,
    std::chrono::milliseconds timeout)
{
    const QHostAddress hostAddress(address);
    if (hostAddress.isNull())
    {
        CCTV_DEBUG(this, lm("Not probing %1: not an address").arg(address));
        return false;
    }

    ScopedSocket scopedSocket;
    scopedSocket.socket.connectToHost(hostAddress, port);
    const bool connected = scopedSocket.socket.waitForConnected(static_cast<int>(timeout.count()));

    CCTV_VERBOSE(this, lm("%1:%2 is %3").args(address, port, connected ? "open" : "closed"));
    return connected;
}

} // namespace network
} // namespace cctv
