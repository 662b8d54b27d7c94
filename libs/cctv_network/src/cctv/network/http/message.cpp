#include "message.h"

namespace cctv {
namespace network {
namespace http {

namespace {

bool namesEqual(const QByteArray& one, const QByteArray& two)
{
    return one.compare(two, Qt::CaseInsensitive) == 0;
}

} // namespace

void HeaderContainer::setHeader(const QByteArray& name, const QByteArray& value)
{
    for (auto& header: m_headers)
    {
        if (namesEqual(header.first, name))
        {
            header.second = value;
            return;
        }
    }
    m_headers.append(qMakePair(name, value));
}

void HeaderContainer::addHeader(const QByteArray& name, const QByteArray& value)
{
    m_headers.append(qMakePair(name, value));
}

boost::optional<QByteArray> HeaderContainer::header(const QByteArray& name) const
{
    for (const auto& header: m_headers)
    {
        if (namesEqual(header.first, name))
            return header.second;
    }
    return boost::none;
}

QList<QByteArray> HeaderContainer::headerValues(const QByteArray& name) const
{
    QList<QByteArray> result;
    for (const auto& header: m_headers)
    {
        if (namesEqual(header.first, name))
            result.append(header.second);
    }
    return result;
}

void HeaderContainer::serializeHeaders(QByteArray* buffer) const
{
    for (const auto& header: m_headers)
        *buffer += header.first + ": " + header.second + "\r\n";
}

//-------------------------------------------------------------------------------------------------

QByteArray Request::serialize() const
{
    QByteArray result = method + ' ' + uri + ' ' + protocol + "\r\n";
    serializeHeaders(&result);
    if (!body.isEmpty() && !header("Content-Length"))
        result += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    result += "\r\n";
    result += body;
    return result;
}

//-------------------------------------------------------------------------------------------------

boost::optional<Response> Response::parseHead(const QByteArray& head)
{
    const QList<QByteArray> lines = head.split('\n');
    if (lines.isEmpty())
        return boost::none;

    const QByteArray statusLine = lines.first().trimmed();
    const int firstSpace = statusLine.indexOf(' ');
    if (firstSpace <= 0)
        return boost::none;

    Response response;
    response.protocol = statusLine.left(firstSpace);
    if (!response.protocol.startsWith("HTTP/") && !response.protocol.startsWith("RTSP/"))
        return boost::none;

    const int secondSpace = statusLine.indexOf(' ', firstSpace + 1);
    bool ok = false;
    response.statusCode = statusLine.mid(
        firstSpace + 1,
        secondSpace == -1 ? -1 : secondSpace - firstSpace - 1).toInt(&ok);
    if (!ok)
        return boost::none;
    if (secondSpace != -1)
        response.reasonPhrase = statusLine.mid(secondSpace + 1);

    for (int i = 1; i < lines.size(); ++i)
    {
        const QByteArray line = lines[i].trimmed();
        if (line.isEmpty())
            break;

        const int colonPos = line.indexOf(':');
        if (colonPos <= 0)
            continue;
        response.addHeader(line.left(colonPos).trimmed(), line.mid(colonPos + 1).trimmed());
    }

    return response;
}

QByteArray Response::serialize() const
{
    QByteArray result =
        protocol + ' ' + QByteArray::number(statusCode) + ' ' + reasonPhrase + "\r\n";
    serializeHeaders(&result);
    if (!body.isEmpty() && !header("Content-Length"))
        result += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    result += "\r\n";
    result += body;
    return result;
}

bool Response::isChunked() const
{
    for (const QByteArray& value: headerValues("Transfer-Encoding"))
    {
        if (value.toLower().contains("chunked"))
            return true;
    }
    return false;
}

ChunkedBodyState decodeChunkedBody(const QByteArray& data, QByteArray* body)
{
    body->clear();
    int pos = 0;
    for (;;)
    {
        const int lineEnd = data.indexOf("\r\n", pos);
        if (lineEnd == -1)
            return ChunkedBodyState::incomplete;

        QByteArray sizeField = data.mid(pos, lineEnd - pos);
        const int extensionPos = sizeField.indexOf(';');
        if (extensionPos != -1)
            sizeField.truncate(extensionPos);

        bool ok = false;
        const int chunkSize = sizeField.trimmed().toInt(&ok, 16);
        if (!ok || chunkSize < 0)
            return ChunkedBodyState::malformed;

        pos = lineEnd + 2;
        if (chunkSize == 0)
            return ChunkedBodyState::complete;

        if (data.size() - pos < chunkSize + 2)
            return ChunkedBodyState::incomplete;
        if (data.mid(pos + chunkSize, 2) != "\r\n")
            return ChunkedBodyState::malformed;

        body->append(data.mid(pos, chunkSize));
        pos += chunkSize + 2;
    }
}

} // namespace http
} // namespace network
} // namespace cctv
