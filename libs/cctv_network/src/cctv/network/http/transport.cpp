#include "transport.h"

#include <algorithm>
#include <memory>

#include <QtCore/QElapsedTimer>
#include <QtNetwork/QSslSocket>
#include <QtNetwork/QTcpSocket>

#include <cctv/utils/log/log.h>

namespace cctv {
namespace network {
namespace http {

namespace {

static const QByteArray kHeadTerminator = "\r\n\r\n";

class SocketGuard
{
public:
    explicit SocketGuard(std::unique_ptr<QTcpSocket> socket): m_socket(std::move(socket)) {}
    ~SocketGuard() { m_socket->abort(); }

    QTcpSocket* get() const { return m_socket.get(); }
    QTcpSocket* operator->() const { return m_socket.get(); }

private:
    std::unique_ptr<QTcpSocket> m_socket;
};

int remainingMs(const QElapsedTimer& timer, std::chrono::milliseconds timeout)
{
    return static_cast<int>(std::max<qint64>(0, timeout.count() - timer.elapsed()));
}

} // namespace

TcpTransport::TcpTransport(std::chrono::milliseconds timeout):
    m_timeout(timeout)
{
}

int TcpTransport::defaultPort(const QString& scheme)
{
    if (scheme == "https")
        return 443;
    if (scheme == "rtsp")
        return 554;
    return 80;
}

boost::optional<Response> TcpTransport::send(const QUrl& url, const Request& request)
{
    const bool isSecure = url.scheme() == "https";
    const quint16 port = static_cast<quint16>(url.port(defaultPort(url.scheme())));

    QElapsedTimer timer;
    timer.start();

    std::unique_ptr<QTcpSocket> socket;
    if (isSecure)
    {
        auto sslSocket = std::make_unique<QSslSocket>();
        sslSocket->setPeerVerifyMode(QSslSocket::VerifyNone);
        sslSocket->connectToHostEncrypted(url.host(), port);
        socket = std::move(sslSocket);
    }
    else
    {
        socket = std::make_unique<QTcpSocket>();
        socket->connectToHost(url.host(), port);
    }
    SocketGuard guard(std::move(socket));

    if (!guard->waitForConnected(remainingMs(timer, m_timeout)))
    {
        CCTV_DEBUG(this, lm("Could not connect to %1:%2. %3")
            .args(url.host(), port, guard->errorString()));
        return boost::none;
    }

    if (isSecure && !static_cast<QSslSocket*>(guard.get())->waitForEncrypted(
        remainingMs(timer, m_timeout)))
    {
        CCTV_DEBUG(this, lm("TLS handshake with %1:%2 failed. %3")
            .args(url.host(), port, guard->errorString()));
        return boost::none;
    }

    guard->write(request.serialize());
    while (guard->bytesToWrite() > 0)
    {
        if (!guard->waitForBytesWritten(remainingMs(timer, m_timeout)))
        {
            CCTV_DEBUG(this, lm("Could not send %1 %2 to %3:%4")
                .args(request.method, request.uri, url.host(), port));
            return boost::none;
        }
    }

    QByteArray buffer;
    boost::optional<Response> response;
    int headSize = 0;
    int expectedBodySize = -1;
    bool chunked = false;
    bool closed = false;
    for (;;)
    {
        if (!response)
        {
            const int terminatorPos = buffer.indexOf(kHeadTerminator);
            if (terminatorPos != -1)
            {
                headSize = terminatorPos + kHeadTerminator.size();
                response = Response::parseHead(buffer.left(headSize));
                if (!response)
                {
                    CCTV_DEBUG(this, lm("Malformed response from %1:%2").args(url.host(), port));
                    return boost::none;
                }

                chunked = response->isChunked();
                if (const auto contentLength = response->header("Content-Length"))
                    expectedBodySize = contentLength->toInt();
                else if (request.protocol == kRtspProtocol)
                    expectedBodySize = 0;
            }
        }

        if (response && chunked)
        {
            QByteArray body;
            const auto state = decodeChunkedBody(buffer.mid(headSize), &body);
            if (state == ChunkedBodyState::complete)
            {
                response->body = body;
                return response;
            }
            if (state == ChunkedBodyState::malformed || closed)
            {
                CCTV_DEBUG(this, lm("Broken chunked body from %1:%2").args(url.host(), port));
                return boost::none;
            }
        }
        else if (response)
        {
            const int bodySize = buffer.size() - headSize;
            if (expectedBodySize >= 0 && bodySize >= expectedBodySize)
            {
                response->body = buffer.mid(headSize, expectedBodySize);
                return response;
            }
            if (closed)
            {
                response->body = buffer.mid(headSize);
                return response;
            }
        }
        else if (closed)
        {
            break;
        }

        if (remainingMs(timer, m_timeout) == 0)
            break;

        if (!guard->waitForReadyRead(remainingMs(timer, m_timeout)))
        {
            if (guard->state() == QAbstractSocket::ConnectedState)
                break;
            closed = true;
        }
        buffer += guard->readAll();
    }

    if (response && !chunked && expectedBodySize < 0)
    {
        response->body = buffer.mid(headSize);
        return response;
    }

    CCTV_DEBUG(this, lm("No complete response from %1:%2 in %3 ms")
        .args(url.host(), port, m_timeout.count()));
    return boost::none;
}

} // namespace http
} // namespace network
} // namespace cctv
