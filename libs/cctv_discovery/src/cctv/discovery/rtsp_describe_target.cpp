#include "rtsp_describe_target.h"

namespace cctv {
namespace discovery {

using namespace network;

RtspDescribeTarget::RtspDescribeTarget(http::AbstractTransport* transport, QUrl url):
    m_transport(transport),
    m_url(std::move(url))
{
}

QString RtspDescribeTarget::name() const
{
    return m_url.toString();
}

QByteArray RtspDescribeTarget::requestUri() const
{
    return m_url.toString(QUrl::RemoveUserInfo | QUrl::FullyEncoded).toUtf8();
}

boost::optional<http::Response> RtspDescribeTarget::send(
    const auth::Authorization& authorization)
{
    http::Request request;
    request.method = requestMethod();
    request.uri = requestUri();
    request.protocol = http::kRtspProtocol;
    request.setHeader("CSeq", QByteArray::number(++m_cseq));
    request.setHeader("User-Agent", kRtspUserAgent);
    request.setHeader("Accept", "application/sdp");
    if (!authorization.header.isEmpty())
        request.setHeader("Authorization", authorization.header);

    return m_transport->send(m_url, request);
}

bool RtspDescribeTarget::isAccepted(const http::Response& response) const
{
    return response.statusCode != http::StatusCode::unauthorized
        && response.statusCode != http::StatusCode::forbidden;
}

} // namespace discovery
} // namespace cctv
