#pragma once

#include <boost/optional.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtCore/QPair>

namespace cctv {
namespace network {
namespace http {

namespace StatusCode {

enum Value
{
    undefined = 0,
    ok = 200,
    badRequest = 400,
    unauthorized = 401,
    forbidden = 403,
    notFound = 404,
    internalServerError = 500,
};

} // namespace StatusCode

static const QByteArray kHttpProtocol = "HTTP/1.1";
static const QByteArray kRtspProtocol = "RTSP/1.0";

using HeaderList = QList<QPair<QByteArray, QByteArray>>;

/**
 * Header lookup is case-insensitive by name. Multiple headers with the same name are kept.
 */
class HeaderContainer
{
public:
    void setHeader(const QByteArray& name, const QByteArray& value);
    void addHeader(const QByteArray& name, const QByteArray& value);

    boost::optional<QByteArray> header(const QByteArray& name) const;
    QList<QByteArray> headerValues(const QByteArray& name) const;

    const HeaderList& headers() const { return m_headers; }

protected:
    void serializeHeaders(QByteArray* buffer) const;

private:
    HeaderList m_headers;
};

class Request:
    public HeaderContainer
{
public:
    QByteArray method;
    QByteArray uri;
    QByteArray protocol = kHttpProtocol;
    QByteArray body;

    /**
     * Adds Content-Length for a non-empty body.
     */
    QByteArray serialize() const;
};

class Response:
    public HeaderContainer
{
public:
    QByteArray protocol;
    int statusCode = StatusCode::undefined;
    QByteArray reasonPhrase;
    QByteArray body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    /**
     * Parses status line and headers of a message that ends with an empty line.
     * Body is not touched.
     */
    static boost::optional<Response> parseHead(const QByteArray& head);

    QByteArray serialize() const;

    /**
     * @return true if the body is sent with Transfer-Encoding: chunked.
     */
    bool isChunked() const;
};

enum class ChunkedBodyState
{
    incomplete,
    complete,
    malformed,
};

/**
 * Decodes a body sent with Transfer-Encoding: chunked. Chunk extensions and trailers are
 * dropped. The body is complete once the last (zero-size) chunk is read.
 */
ChunkedBodyState decodeChunkedBody(const QByteArray& data, QByteArray* body);

} // namespace http
} // namespace network
} // namespace cctv
