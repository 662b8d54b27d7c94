#include "auth_negotiator.h"

#include <cctv/utils/log/log.h>

namespace cctv {
namespace network {
namespace auth {

namespace {

static const QString kAllCredentialsFailed =
    QStringLiteral("Authentication failed with all credentials");

NegotiationResult acceptedResult(
    AuthMethod method,
    boost::optional<Credential> credential,
    boost::optional<http::Response> response)
{
    NegotiationResult result;
    result.success = true;
    result.serviceResponded = true;
    result.method = method;
    result.credential = std::move(credential);
    result.response = std::move(response);
    return result;
}

} // namespace

AuthNegotiator::AuthNegotiator():
    AuthNegotiator(defaultStrategies())
{
}

AuthNegotiator::AuthNegotiator(std::vector<std::unique_ptr<AbstractAuthStrategy>> strategies):
    m_strategies(std::move(strategies))
{
}

std::vector<std::unique_ptr<AbstractAuthStrategy>> AuthNegotiator::defaultStrategies()
{
    std::vector<std::unique_ptr<AbstractAuthStrategy>> strategies;
    strategies.push_back(std::make_unique<NoAuthStrategy>());
    strategies.push_back(std::make_unique<BasicAuthStrategy>());
    strategies.push_back(std::make_unique<DigestAuthStrategy>());
    strategies.push_back(std::make_unique<WsSecurityAuthStrategy>());
    return strategies;
}

NegotiationResult AuthNegotiator::negotiate(
    AbstractAuthTarget& target,
    const std::vector<Credential>& credentials)
{
    NegotiationResult result;
    ChallengeSet challenges;

    const auto updateChallenges =
        [&challenges](const AuthOutcome& outcome)
        {
            if (!challenges.empty() || !outcome.response)
                return;
            challenges = parseChallenges(*outcome.response);
        };

    for (const auto& strategy: m_strategies)
    {
        if (strategy->method() != AuthMethod::none)
            continue;

        const AuthOutcome outcome = strategy->attempt(target, challenges, Credential());
        if (outcome.result == AuthOutcome::Result::transportError)
        {
            CCTV_DEBUG(this, lm("%1: %2").args(target.name(), outcome.reason));
            result.reason = outcome.reason;
            return result;
        }

        result.serviceResponded = true;
        if (outcome.result == AuthOutcome::Result::accepted)
        {
            CCTV_DEBUG(this, lm("%1 does not require authentication").arg(target.name()));
            return acceptedResult(AuthMethod::none, boost::none, outcome.response);
        }

        result.reason = outcome.reason;
        updateChallenges(outcome);
    }

    for (const Credential& credential: credentials)
    {
        for (const auto& strategy: m_strategies)
        {
            if (strategy->method() == AuthMethod::none)
                continue;

            const AuthOutcome outcome = strategy->attempt(target, challenges, credential);
            switch (outcome.result)
            {
                case AuthOutcome::Result::accepted:
                    CCTV_DEBUG(this, lm("%1 accepted %2 authentication with %3").args(
                        target.name(), toString(strategy->method()), credential.toString()));
                    return acceptedResult(strategy->method(), credential, outcome.response);

                case AuthOutcome::Result::rejected:
                    result.serviceResponded = true;
                    result.reason = outcome.reason;
                    updateChallenges(outcome);
                    break;

                case AuthOutcome::Result::transportError:
                    result.reason = outcome.reason;
                    break;

                case AuthOutcome::Result::notApplicable:
                    break;
            }

            CCTV_VERBOSE(this, lm("%1: %2 with %3: %4").args(
                target.name(), toString(strategy->method()), credential.toString(),
                outcome.reason));
        }
    }

    if (result.reason.isEmpty())
        result.reason = kAllCredentialsFailed;

    CCTV_DEBUG(this, lm("%1: all schemes failed. %2").args(target.name(), result.reason));
    return result;
}

} // namespace auth
} // namespace network
} // namespace cctv
