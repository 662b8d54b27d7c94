#include "auth_strategy.h"

#include <cctv/utils/log/log.h>

#include "basic_authentication.h"
#include "digest_authentication.h"
#include "ws_security.h"

namespace cctv {
namespace network {
namespace auth {

namespace {

QString rejectionReason(AuthMethod method, const http::Response& response)
{
    return lm("%1 authentication rejected (%2 %3)").args(
        toString(method), response.statusCode, response.reasonPhrase).toQString().trimmed();
}

} // namespace

AuthOutcome AuthOutcome::notApplicable(QString reason)
{
    AuthOutcome outcome;
    outcome.result = Result::notApplicable;
    outcome.reason = std::move(reason);
    return outcome;
}

AuthOutcome AuthOutcome::transportError(QString reason)
{
    AuthOutcome outcome;
    outcome.result = Result::transportError;
    outcome.reason = std::move(reason);
    return outcome;
}

AuthOutcome AuthOutcome::fromResponse(
    const AbstractAuthTarget& target, AuthMethod method, http::Response response)
{
    AuthOutcome outcome;
    if (target.isAccepted(response))
    {
        outcome.result = Result::accepted;
    }
    else
    {
        outcome.result = Result::rejected;
        outcome.reason = rejectionReason(method, response);
    }
    outcome.response = std::move(response);
    return outcome;
}

//-------------------------------------------------------------------------------------------------

AuthOutcome NoAuthStrategy::attempt(
    AbstractAuthTarget& target,
    const ChallengeSet& /*challenges*/,
    const Credential& /*credential*/)
{
    auto response = target.send(Authorization());
    if (!response)
        return AuthOutcome::transportError(lm("%1 did not respond").arg(target.name()));
    return AuthOutcome::fromResponse(target, method(), std::move(*response));
}

AuthOutcome BasicAuthStrategy::attempt(
    AbstractAuthTarget& target,
    const ChallengeSet& challenges,
    const Credential& credential)
{
    if (!challenges.empty() && !findChallenge(challenges, AuthChallenge::Scheme::basic))
        return AuthOutcome::notApplicable("Basic is not offered");

    Authorization authorization;
    authorization.method = method();
    authorization.header = buildBasicAuthorization(credential);

    auto response = target.send(authorization);
    if (!response)
        return AuthOutcome::transportError(lm("%1 did not respond").arg(target.name()));
    return AuthOutcome::fromResponse(target, method(), std::move(*response));
}

AuthOutcome DigestAuthStrategy::attempt(
    AbstractAuthTarget& target,
    const ChallengeSet& challenges,
    const Credential& credential)
{
    auto challenge = findChallenge(challenges, AuthChallenge::Scheme::digest);
    if (!challenge)
        return AuthOutcome::notApplicable("No valid Digest challenge");

    AuthOutcome outcome;
    for (int attemptNumber = 0; attemptNumber < 2; ++attemptNumber)
    {
        Authorization authorization;
        authorization.method = method();
        authorization.header = buildDigestAuthorization(
            credential, *challenge, target.requestMethod(), target.requestUri());

        auto response = target.send(authorization);
        if (!response)
            return AuthOutcome::transportError(lm("%1 did not respond").arg(target.name()));

        outcome = AuthOutcome::fromResponse(target, method(), std::move(*response));
        if (outcome.result == AuthOutcome::Result::accepted)
            return outcome;

        const auto renewed = findChallenge(
            parseChallenges(*outcome.response), AuthChallenge::Scheme::digest);
        if (!renewed || !renewed->isStale())
            return outcome;

        CCTV_DEBUG(this, lm("Stale nonce from %1, retrying with the new one").arg(target.name()));
        challenge = renewed;
    }
    return outcome;
}

AuthOutcome WsSecurityAuthStrategy::attempt(
    AbstractAuthTarget& target,
    const ChallengeSet& /*challenges*/,
    const Credential& credential)
{
    if (!target.carriesSoap())
        return AuthOutcome::notApplicable("WS-Security requires a SOAP service");

    Authorization authorization;
    authorization.method = method();
    authorization.soapSecurityHeader = UsernameToken::generate(credential).toSecurityHeader();

    auto response = target.send(authorization);
    if (!response)
        return AuthOutcome::transportError(lm("%1 did not respond").arg(target.name()));
    return AuthOutcome::fromResponse(target, method(), std::move(*response));
}

} // namespace auth
} // namespace network
} // namespace cctv
