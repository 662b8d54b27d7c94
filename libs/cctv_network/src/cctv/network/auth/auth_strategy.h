#pragma once

#include <boost/optional.hpp>

#include <QtCore/QString>

#include "auth_challenge.h"
#include "auth_method.h"
#include "auth_target.h"
#include "credential.h"

namespace cctv {
namespace network {
namespace auth {

struct AuthOutcome
{
    enum class Result
    {
        accepted,
        rejected,
        notApplicable,
        transportError,
    };

    Result result = Result::notApplicable;
    QString reason;
    boost::optional<http::Response> response;

    static AuthOutcome notApplicable(QString reason);
    static AuthOutcome transportError(QString reason);

    /**
     * Accepted or rejected depending on target.isAccepted(response).
     */
    static AuthOutcome fromResponse(
        const AbstractAuthTarget& target, AuthMethod method, http::Response response);
};

class AbstractAuthStrategy
{
public:
    virtual ~AbstractAuthStrategy() = default;

    virtual AuthMethod method() const = 0;

    virtual AuthOutcome attempt(
        AbstractAuthTarget& target,
        const ChallengeSet& challenges,
        const Credential& credential) = 0;
};

class NoAuthStrategy:
    public AbstractAuthStrategy
{
public:
    virtual AuthMethod method() const override { return AuthMethod::none; }

    virtual AuthOutcome attempt(
        AbstractAuthTarget& target,
        const ChallengeSet& challenges,
        const Credential& credential) override;
};

/**
 * Not applicable if the service challenges only with other schemes.
 */
class BasicAuthStrategy:
    public AbstractAuthStrategy
{
public:
    virtual AuthMethod method() const override { return AuthMethod::basic; }

    virtual AuthOutcome attempt(
        AbstractAuthTarget& target,
        const ChallengeSet& challenges,
        const Credential& credential) override;
};

/**
 * Requires a valid Digest challenge. A rejection carrying a stale nonce is retried once with
 * the new challenge.
 */
class DigestAuthStrategy:
    public AbstractAuthStrategy
{
public:
    virtual AuthMethod method() const override { return AuthMethod::digest; }

    virtual AuthOutcome attempt(
        AbstractAuthTarget& target,
        const ChallengeSet& challenges,
        const Credential& credential) override;
};

class WsSecurityAuthStrategy:
    public AbstractAuthStrategy
{
public:
    virtual AuthMethod method() const override { return AuthMethod::wsSecurity; }

    virtual AuthOutcome attempt(
        AbstractAuthTarget& target,
        const ChallengeSet& challenges,
        const Credential& credential) override;
};

} // namespace auth
} // namespace network
} // namespace cctv
