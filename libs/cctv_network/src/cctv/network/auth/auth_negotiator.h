#pragma once

#include <memory>
#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QString>

#include "auth_strategy.h"

namespace cctv {
namespace network {
namespace auth {

struct NegotiationResult
{
    bool success = false;
    bool serviceResponded = false;
    AuthMethod method = AuthMethod::none;
    boost::optional<Credential> credential;
    QString reason; //< Last rejection reason on failure.
    boost::optional<http::Response> response; //< Response to the accepted request.
};

/**
 * Tries an unauthenticated request first, then every credential in order through the remaining
 * schemes (Basic, Digest, WS-Security by default) until the target accepts one.
 */
class AuthNegotiator
{
public:
    AuthNegotiator();
    explicit AuthNegotiator(std::vector<std::unique_ptr<AbstractAuthStrategy>> strategies);

    NegotiationResult negotiate(
        AbstractAuthTarget& target,
        const std::vector<Credential>& credentials);

    static std::vector<std::unique_ptr<AbstractAuthStrategy>> defaultStrategies();

private:
    std::vector<std::unique_ptr<AbstractAuthStrategy>> m_strategies;
};

} // namespace auth
} // namespace network
} // namespace cctv
