#pragma once

#include <boost/optional.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <cctv/network/http/message.h>

#include "auth_method.h"

namespace cctv {
namespace network {
namespace auth {

struct Authorization
{
    AuthMethod method = AuthMethod::none;
    QByteArray header; //< Authorization header value, empty if not used.
    QByteArray soapSecurityHeader; //< WS-Security <Security> element, empty if not used.
};

/**
 * Protected request the negotiator replays with different authorizations.
 */
class AbstractAuthTarget
{
public:
    virtual ~AbstractAuthTarget() = default;

    virtual QString name() const = 0;

    /**
     * WS-Security applies to SOAP services only.
     */
    virtual bool carriesSoap() const = 0;

    /**
     * Method and URI the Digest response is computed over.
     */
    virtual QByteArray requestMethod() const = 0;
    virtual QByteArray requestUri() const = 0;

    /**
     * @return boost::none if the service did not answer.
     */
    virtual boost::optional<http::Response> send(const Authorization& authorization) = 0;

    virtual bool isAccepted(const http::Response& response) const = 0;
};

} // namespace auth
} // namespace network
} // namespace cctv
