#include "auth_challenge.h"

#include <utility>

namespace cctv {
namespace network {
namespace auth {

namespace {

static const QString kDefaultBasicRealm = QStringLiteral("Camera");

boost::optional<QString> nonEmpty(const QString& value)
{
    if (value.isEmpty())
        return boost::none;
    return value;
}

bool hasPrefix(const QString& text, const QString& prefix)
{
    return text.startsWith(prefix, Qt::CaseInsensitive);
}

AuthChallenge parseBasic(const QString& params)
{
    AuthChallenge challenge;
    challenge.scheme = AuthChallenge::Scheme::basic;

    const QString trimmed = params.trimmed();
    if (hasPrefix(trimmed, QStringLiteral("realm=")))
        challenge.realm = extractChallengeValue(trimmed.mid(6));
    if (!challenge.realm)
        challenge.realm = kDefaultBasicRealm;
    return challenge;
}

AuthChallenge parseDigest(const QString& params)
{
    AuthChallenge challenge;
    challenge.scheme = AuthChallenge::Scheme::digest;

    const std::pair<const char*, boost::optional<QString> AuthChallenge::*> fields[] = {
        {"realm=", &AuthChallenge::realm},
        {"nonce=", &AuthChallenge::nonce},
        {"opaque=", &AuthChallenge::opaque},
        {"qop=", &AuthChallenge::qop},
        {"algorithm=", &AuthChallenge::algorithm},
        {"stale=", &AuthChallenge::stale},
    };

    for (const QString& param: splitChallengeParams(params.trimmed()))
    {
        const QString trimmed = param.trimmed();
        for (const auto& field: fields)
        {
            const QString name = QLatin1String(field.first);
            if (hasPrefix(trimmed, name))
            {
                challenge.*field.second = extractChallengeValue(trimmed.mid(name.size()));
                break;
            }
        }
    }
    return challenge;
}

} // namespace

bool AuthChallenge::isValid() const
{
    if (scheme == Scheme::basic)
        return true;

    return realm && !realm->isEmpty() && nonce && !nonce->isEmpty();
}

bool AuthChallenge::isStale() const
{
    return stale && stale->compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

bool AuthChallenge::offersQopAuth() const
{
    if (!qop)
        return false;

    for (const QString& value: qop->split(QLatin1Char(',')))
    {
        if (value.trimmed().compare(QLatin1String("auth"), Qt::CaseInsensitive) == 0)
            return true;
    }
    return false;
}

boost::optional<AuthChallenge> AuthChallenge::parse(const QString& header)
{
    const QString trimmed = header.trimmed();
    if (trimmed.isEmpty())
        return boost::none;

    if (hasPrefix(trimmed, QStringLiteral("basic")))
        return parseBasic(trimmed.mid(5));
    if (hasPrefix(trimmed, QStringLiteral("digest")))
        return parseDigest(trimmed.mid(6));

    return boost::none;
}

ChallengeSet parseChallenges(const http::Response& response)
{
    ChallengeSet result;
    for (const QByteArray& value: response.headerValues("WWW-Authenticate"))
    {
        if (auto challenge = AuthChallenge::parse(QString::fromUtf8(value)))
            result.push_back(std::move(*challenge));
    }
    return result;
}

boost::optional<AuthChallenge> findChallenge(
    const ChallengeSet& challenges, AuthChallenge::Scheme scheme)
{
    for (const AuthChallenge& challenge: challenges)
    {
        if (challenge.scheme == scheme && challenge.isValid())
            return challenge;
    }
    return boost::none;
}

QStringList splitChallengeParams(const QString& params)
{
    QStringList result;
    QString current;
    bool inQuotes = false;
    bool escaped = false;

    for (const QChar ch: params)
    {
        if (escaped)
        {
            current += ch;
            escaped = false;
            continue;
        }

        if (ch == QLatin1Char('\\'))
        {
            escaped = true;
            current += ch;
            continue;
        }

        if (ch == QLatin1Char('"'))
            inQuotes = !inQuotes;

        if (ch == QLatin1Char(',') && !inQuotes)
        {
            if (!current.isEmpty())
                result.append(current);
            current.clear();
            continue;
        }

        current += ch;
    }

    if (!current.isEmpty())
        result.append(current);
    return result;
}

boost::optional<QString> extractChallengeValue(const QString& text)
{
    const QString value = text.trimmed();
    if (value.isEmpty())
        return boost::none;

    if (value.size() > 1 && value.startsWith(QLatin1Char('"')) && value.endsWith(QLatin1Char('"')))
        return nonEmpty(value.mid(1, value.size() - 2));

    if (value.size() > 3
        && value.startsWith(QLatin1String("\\\"")) && value.endsWith(QLatin1String("\\\"")))
    {
        return nonEmpty(value.mid(2, value.size() - 4));
    }

    const int firstQuote = value.indexOf(QLatin1Char('"'));
    const int lastQuote = value.lastIndexOf(QLatin1Char('"'));
    if (firstQuote != -1 && lastQuote > firstQuote)
        return nonEmpty(value.mid(firstQuote + 1, lastQuote - firstQuote - 1));

    int end = 0;
    while (end < value.size()
        && value[end] != QLatin1Char(' ')
        && value[end] != QLatin1Char(',')
        && value[end] != QLatin1Char(';'))
    {
        ++end;
    }
    return nonEmpty(value.left(end));
}

} // namespace auth
} // namespace network
} // namespace cctv
