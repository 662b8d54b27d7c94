#pragma once

#include <QtCore/QUrl>

#include <cctv/network/auth/auth_target.h>
#include <cctv/network/http/transport.h>

namespace cctv {
namespace discovery {

static const QByteArray kRtspUserAgent = "cctv-scanner/1.0";

/**
 * RTSP DESCRIBE of one URL. Anything but 401 and 403 means the credentials were accepted.
 */
class RtspDescribeTarget:
    public network::auth::AbstractAuthTarget
{
public:
    RtspDescribeTarget(network::http::AbstractTransport* transport, QUrl url);

    virtual QString name() const override;
    virtual bool carriesSoap() const override { return false; }
    virtual QByteArray requestMethod() const override { return "DESCRIBE"; }
    virtual QByteArray requestUri() const override;

    virtual boost::optional<network::http::Response> send(
        const network::auth::Authorization& authorization) override;

    virtual bool isAccepted(const network::http::Response& response) const override;

private:
    network::http::AbstractTransport* m_transport;
    QUrl m_url;
    int m_cseq = 0;
};

} // namespace discovery
} // namespace cctv
