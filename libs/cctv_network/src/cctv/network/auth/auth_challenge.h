#pragma once

#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <cctv/network/http/message.h>

namespace cctv {
namespace network {
namespace auth {

/**
 * Parsed WWW-Authenticate challenge.
 */
class AuthChallenge
{
public:
    enum class Scheme
    {
        basic,
        digest,
    };

    Scheme scheme = Scheme::basic;
    boost::optional<QString> realm;
    boost::optional<QString> nonce;
    boost::optional<QString> opaque;
    boost::optional<QString> qop;
    boost::optional<QString> algorithm;
    boost::optional<QString> stale;

    /**
     * Basic is always valid, Digest requires non-empty realm and nonce.
     */
    bool isValid() const;

    bool isStale() const;

    /**
     * True if qop lists "auth" (possibly among other values).
     */
    bool offersQopAuth() const;

    /**
     * @return boost::none for empty input and for schemes other than Basic and Digest.
     */
    static boost::optional<AuthChallenge> parse(const QString& header);
};

using ChallengeSet = std::vector<AuthChallenge>;

/**
 * All recognized challenges from WWW-Authenticate headers of response, in header order.
 */
ChallengeSet parseChallenges(const http::Response& response);

/**
 * First valid challenge of scheme.
 */
boost::optional<AuthChallenge> findChallenge(
    const ChallengeSet& challenges, AuthChallenge::Scheme scheme);

/**
 * Splits auth-params on commas that are outside of double quotes. Backslash escapes the next
 * character. Empty fragments are dropped, fragments are not trimmed.
 */
QStringList splitChallengeParams(const QString& params);

/**
 * Extracts the value part of an auth-param (the text after "name="):
 * "v" -> v, \"v\" -> v, x"v"y -> v, otherwise text up to the first space, comma or semicolon.
 * @return boost::none if the result is empty.
 */
boost::optional<QString> extractChallengeValue(const QString& text);

} // namespace auth
} // namespace network
} // namespace cctv
