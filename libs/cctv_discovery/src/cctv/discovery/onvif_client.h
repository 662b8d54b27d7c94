#pragma once

#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QDateTime>
#include <QtCore/QUrl>

#include <cctv/network/auth/auth_session.h>
#include <cctv/network/auth/auth_target.h>
#include <cctv/network/http/transport.h>

#include "onvif_messages.h"

namespace cctv {
namespace discovery {
namespace onvif {

/**
 * http(s)://address:port/onvif/device_service, https for 443 and 8443.
 */
QUrl deviceServiceUrl(const QString& address, int port);

network::http::Request makeSoapRequest(
    const QUrl& url,
    const QByteArray& body,
    const network::auth::Authorization& authorization);

/**
 * GetDeviceInformation of the device service, the request ONVIF devices protect.
 */
class OnvifAuthTarget:
    public network::auth::AbstractAuthTarget
{
public:
    OnvifAuthTarget(network::http::AbstractTransport* transport, QUrl serviceUrl);

    virtual QString name() const override;
    virtual bool carriesSoap() const override { return true; }
    virtual QByteArray requestMethod() const override { return "POST"; }
    virtual QByteArray requestUri() const override;

    virtual boost::optional<network::http::Response> send(
        const network::auth::Authorization& authorization) override;

    virtual bool isAccepted(const network::http::Response& response) const override;

private:
    network::http::AbstractTransport* m_transport;
    QUrl m_serviceUrl;
};

/**
 * Device and media service calls made after authentication succeeded.
 */
class OnvifClient
{
public:
    OnvifClient(
        network::http::AbstractTransport* transport,
        QUrl serviceUrl,
        network::auth::AuthSession authSession);

    boost::optional<DeviceInformation> getDeviceInformation();
    boost::optional<QDateTime> getSystemDateAndTime();

    /**
     * Media XAddr from GetCapabilities, rebased onto the scheme, host and port used to reach the
     * device service. The device service URL itself if capabilities are not available.
     */
    QUrl getMediaServiceUrl();

    QStringList getVideoSources(const QUrl& mediaUrl);
    std::vector<MediaProfile> getProfiles(const QUrl& mediaUrl);
    boost::optional<QString> getStreamUri(const QUrl& mediaUrl, const QString& profileToken);

private:
    /**
     * @return Response body of a successful call.
     */
    boost::optional<QByteArray> call(const QUrl& url, const QByteArray& body);

private:
    network::http::AbstractTransport* m_transport;
    QUrl m_serviceUrl;
    network::auth::AuthSession m_authSession;
};

} // namespace onvif
} // namespace discovery
} // namespace cctv
