#include "auth_session.h"

#include "basic_authentication.h"
#include "digest_authentication.h"
#include "ws_security.h"

namespace cctv {
namespace network {
namespace auth {

AuthSession::AuthSession(AuthMethod method, boost::optional<Credential> credential):
    m_method(method),
    m_credential(std::move(credential))
{
}

Authorization AuthSession::authorize(const QByteArray& requestMethod, const QByteArray& uri) const
{
    Authorization authorization;
    if (!m_credential)
        return authorization;

    switch (m_method)
    {
        case AuthMethod::none:
            break;

        case AuthMethod::basic:
            authorization.method = m_method;
            authorization.header = buildBasicAuthorization(*m_credential);
            break;

        case AuthMethod::digest:
            if (!m_digestChallenge)
                break;
            authorization.method = m_method;
            authorization.header = buildDigestAuthorization(
                *m_credential, *m_digestChallenge, requestMethod, uri);
            break;

        case AuthMethod::wsSecurity:
            authorization.method = m_method;
            authorization.soapSecurityHeader =
                UsernameToken::generate(*m_credential).toSecurityHeader();
            break;
    }
    return authorization;
}

bool AuthSession::updateChallenge(const http::Response& response)
{
    if (m_method != AuthMethod::digest || !m_credential)
        return false;

    const auto challenge = findChallenge(parseChallenges(response), AuthChallenge::Scheme::digest);
    if (!challenge)
        return false;

    const bool isFirst = !m_digestChallenge;
    const bool isNewNonce = !isFirst && m_digestChallenge->nonce != challenge->nonce;
    m_digestChallenge = challenge;
    return isFirst || challenge->isStale() || isNewNonce;
}

} // namespace auth
} // namespace network
} // namespace cctv
