#include "ws_security.h"

#include <random>

#include <QtCore/QCryptographicHash>
#include <QtCore/QDateTime>

namespace cctv {
namespace network {
namespace auth {

namespace {

static const int kNonceBytes = 16;

static const char* const kSecextNamespace =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd";
static const char* const kUtilityNamespace =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd";
static const char* const kPasswordDigestType =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest";
static const char* const kBase64EncodingType =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary";

QByteArray generateNonce()
{
    std::random_device randomDevice;
    std::uniform_int_distribution<int> distribution(0, 255);

    QByteArray nonce;
    nonce.reserve(kNonceBytes);
    for (int i = 0; i < kNonceBytes; ++i)
        nonce.append(static_cast<char>(distribution(randomDevice)));
    return nonce;
}

} // namespace

UsernameToken UsernameToken::generate(const Credential& credential)
{
    return create(
        credential,
        generateNonce(),
        QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyy-MM-dd'T'HH:mm:ss'Z'")));
}

UsernameToken UsernameToken::create(
    const Credential& credential, const QByteArray& nonce, const QString& created)
{
    UsernameToken token;
    token.username = credential.username();
    token.nonce = nonce;
    token.created = created;
    token.passwordDigest = calculatePasswordDigest(nonce, created, credential.password());
    return token;
}

QByteArray UsernameToken::toSecurityHeader() const
{
    return QString(
        "<Security xmlns=\"%1\" xmlns:wsu=\"%2\">"
            "<UsernameToken>"
                "<Username>%3</Username>"
                "<Password Type=\"%4\">%5</Password>"
                "<Nonce EncodingType=\"%6\">%7</Nonce>"
                "<wsu:Created>%8</wsu:Created>"
            "</UsernameToken>"
        "</Security>")
        .arg(
            QString::fromLatin1(kSecextNamespace),
            QString::fromLatin1(kUtilityNamespace),
            escapeXml(username),
            QString::fromLatin1(kPasswordDigestType),
            QString::fromLatin1(passwordDigest),
            QString::fromLatin1(kBase64EncodingType),
            QString::fromLatin1(nonce.toBase64()),
            created)
        .toUtf8();
}

QByteArray calculatePasswordDigest(
    const QByteArray& nonce, const QString& created, const QString& password)
{
    QCryptographicHash sha1(QCryptographicHash::Sha1);
    sha1.addData(nonce);
    sha1.addData(created.toUtf8());
    sha1.addData(password.toUtf8());
    return sha1.result().toBase64();
}

QString escapeXml(const QString& text)
{
    QString result;
    result.reserve(text.size());
    for (const QChar ch: text)
    {
        switch (ch.unicode())
        {
            case '&': result += QLatin1String("&amp;"); break;
            case '<': result += QLatin1String("&lt;"); break;
            case '>': result += QLatin1String("&gt;"); break;
            case '"': result += QLatin1String("&quot;"); break;
            case '\'': result += QLatin1String("&apos;"); break;
            default: result += ch; break;
        }
    }
    return result;
}

} // namespace auth
} // namespace network
} // namespace cctv
