#include "onvif_client.h"

#include <cctv/utils/log/log.h>

namespace cctv {
namespace discovery {
namespace onvif {

using namespace network;

namespace {

QByteArray pathOf(const QUrl& url)
{
    QByteArray path = url.path(QUrl::FullyEncoded).toUtf8();
    if (path.isEmpty())
        path = "/";
    if (url.hasQuery())
        path += '?' + url.query(QUrl::FullyEncoded).toUtf8();
    return path;
}

} // namespace

QUrl deviceServiceUrl(const QString& address, int port)
{
    QUrl url;
    url.setScheme(port == 443 || port == 8443 ? "https" : "http");
    url.setHost(address);
    url.setPort(port);
    url.setPath(kDeviceServicePath);
    return url;
}

http::Request makeSoapRequest(
    const QUrl& url, const QByteArray& body, const auth::Authorization& authorization)
{
    http::Request request;
    request.method = "POST";
    request.uri = pathOf(url);
    request.protocol = http::kHttpProtocol;
    request.setHeader("Host", url.authority(QUrl::FullyEncoded).toUtf8());
    request.setHeader("Content-Type", kSoapContentType);
    request.setHeader("Connection", "close");
    if (!authorization.header.isEmpty())
        request.setHeader("Authorization", authorization.header);
    request.body = makeEnvelope(body, authorization.soapSecurityHeader);
    return request;
}

//-------------------------------------------------------------------------------------------------
// OnvifAuthTarget

OnvifAuthTarget::OnvifAuthTarget(http::AbstractTransport* transport, QUrl serviceUrl):
    m_transport(transport),
    m_serviceUrl(std::move(serviceUrl))
{
}

QString OnvifAuthTarget::name() const
{
    return m_serviceUrl.toString();
}

QByteArray OnvifAuthTarget::requestUri() const
{
    return pathOf(m_serviceUrl);
}

boost::optional<http::Response> OnvifAuthTarget::send(const auth::Authorization& authorization)
{
    return m_transport->send(
        m_serviceUrl, makeSoapRequest(m_serviceUrl, getDeviceInformationRequest(), authorization));
}

bool OnvifAuthTarget::isAccepted(const http::Response& response) const
{
    return response.isSuccess() && !isNotAuthorizedFault(response.body);
}

//-------------------------------------------------------------------------------------------------
// OnvifClient

OnvifClient::OnvifClient(
    http::AbstractTransport* transport,
    QUrl serviceUrl,
    auth::AuthSession authSession)
    :
    m_transport(transport),
    m_serviceUrl(std::move(serviceUrl)),
    m_authSession(std::move(authSession))
{
}

boost::optional<DeviceInformation> OnvifClient::getDeviceInformation()
{
    const auto body = call(m_serviceUrl, getDeviceInformationRequest());
    return body ? parseDeviceInformation(*body) : boost::none;
}

boost::optional<QDateTime> OnvifClient::getSystemDateAndTime()
{
    const auto body = call(m_serviceUrl, getSystemDateAndTimeRequest());
    return body ? parseSystemDateAndTime(*body) : boost::none;
}

QUrl OnvifClient::getMediaServiceUrl()
{
    const auto body = call(m_serviceUrl, getCapabilitiesRequest());
    const auto xAddr = body ? parseMediaServiceUrl(*body) : boost::none;
    if (!xAddr)
        return m_serviceUrl;

    const QUrl reported(*xAddr);
    if (!reported.isValid() || reported.path().isEmpty())
        return m_serviceUrl;

    QUrl result = m_serviceUrl;
    result.setPath(reported.path());
    result.setQuery(reported.query());
    return result;
}

QStringList OnvifClient::getVideoSources(const QUrl& mediaUrl)
{
    const auto body = call(mediaUrl, getVideoSourcesRequest());
    return body ? parseVideoSourceTokens(*body) : QStringList();
}

std::vector<MediaProfile> OnvifClient::getProfiles(const QUrl& mediaUrl)
{
    const auto body = call(mediaUrl, getProfilesRequest());
    return body ? parseProfiles(*body) : std::vector<MediaProfile>();
}

boost::optional<QString> OnvifClient::getStreamUri(
    const QUrl& mediaUrl, const QString& profileToken)
{
    const auto body = call(mediaUrl, getStreamUriRequest(profileToken));
    return body ? parseStreamUri(*body) : boost::none;
}

boost::optional<QByteArray> OnvifClient::call(const QUrl& url, const QByteArray& body)
{
    auto response = m_transport->send(
        url, makeSoapRequest(url, body, m_authSession.authorize("POST", pathOf(url))));
    if (response
        && response->statusCode == http::StatusCode::unauthorized
        && m_authSession.updateChallenge(*response))
    {
        response = m_transport->send(
            url, makeSoapRequest(url, body, m_authSession.authorize("POST", pathOf(url))));
    }

    if (!response)
        return boost::none;

    if (!response->isSuccess())
    {
        const auto fault = parseFault(response->body);
        CCTV_DEBUG(this, lm("%1 failed: %2 %3").args(
            url.toString(), response->statusCode, fault ? *fault : QString()));
        return boost::none;
    }
    return response->body;
}

} // namespace onvif
} // namespace discovery
} // namespace cctv
