#pragma once

#include <chrono>

#include <boost/optional.hpp>

#include <QtCore/QUrl>

#include "message.h"

namespace cctv {
namespace network {
namespace http {

/**
 * Synchronous request/response exchange with a device service.
 */
class AbstractTransport
{
public:
    virtual ~AbstractTransport() = default;

    /**
     * @param url Scheme (http, https, rtsp), host and port of the service.
     * @return boost::none on connection failure, timeout or unparsable response.
     */
    virtual boost::optional<Response> send(const QUrl& url, const Request& request) = 0;
};

/**
 * One connection per request. TLS certificates are not verified: devices almost always carry
 * self-signed ones.
 */
class TcpTransport:
    public AbstractTransport
{
public:
    explicit TcpTransport(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    virtual boost::optional<Response> send(const QUrl& url, const Request& request) override;

    static int defaultPort(const QString& scheme);

private:
    std::chrono::milliseconds m_timeout;
};

} // namespace http
} // namespace network
} // namespace cctv
