#pragma once

#include <boost/optional.hpp>

#include "auth_challenge.h"
#include "auth_method.h"
#include "auth_target.h"
#include "credential.h"

namespace cctv {
namespace network {
namespace auth {

/**
 * Produces authorizations for follow-up requests once negotiation has picked a method.
 * Digest needs a challenge: until one is received requests go out unauthorized and the 401
 * response supplies it.
 */
class AuthSession
{
public:
    AuthSession() = default;
    AuthSession(AuthMethod method, boost::optional<Credential> credential);

    AuthMethod method() const { return m_method; }
    const boost::optional<Credential>& credential() const { return m_credential; }

    Authorization authorize(const QByteArray& requestMethod, const QByteArray& uri) const;

    /**
     * Takes a Digest challenge from a rejected response.
     * @return true if the request is worth repeating with the new challenge.
     */
    bool updateChallenge(const http::Response& response);

private:
    AuthMethod m_method = AuthMethod::none;
    boost::optional<Credential> m_credential;
    boost::optional<AuthChallenge> m_digestChallenge;
};

} // namespace auth
} // namespace network
} // namespace cctv
