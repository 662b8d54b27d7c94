#include "digest_authentication.h"

#include <random>

#include <QtCore/QCryptographicHash>

namespace cctv {
namespace network {
namespace auth {

namespace {

static const int kCnonceRandomBytes = 16;

QByteArray quoted(const QByteArray& value)
{
    return '"' + value + '"';
}

} // namespace

QByteArray calculateHa1(const QString& username, const QString& realm, const QString& password)
{
    QCryptographicHash md5(QCryptographicHash::Md5);
    md5.addData(username.toUtf8());
    md5.addData(":");
    md5.addData(realm.toUtf8());
    md5.addData(":");
    md5.addData(password.toUtf8());
    return md5.result().toHex();
}

QByteArray calculateHa2(const QByteArray& method, const QByteArray& uri)
{
    QCryptographicHash md5(QCryptographicHash::Md5);
    md5.addData(method);
    md5.addData(":");
    md5.addData(uri);
    return md5.result().toHex();
}

QByteArray calculateDigestResponse(
    const QByteArray& ha1,
    const QByteArray& nonce,
    const QByteArray& nonceCount,
    const QByteArray& cnonce,
    const QByteArray& qop,
    const QByteArray& ha2)
{
    QCryptographicHash md5(QCryptographicHash::Md5);
    md5.addData(ha1);
    md5.addData(":");
    md5.addData(nonce);
    md5.addData(":");
    if (!qop.isEmpty())
    {
        md5.addData(nonceCount);
        md5.addData(":");
        md5.addData(cnonce);
        md5.addData(":");
        md5.addData(qop);
        md5.addData(":");
    }
    md5.addData(ha2);
    return md5.result().toHex();
}

QByteArray generateCnonce()
{
    std::random_device randomDevice;
    std::uniform_int_distribution<int> distribution(0, 255);

    QByteArray bytes;
    bytes.reserve(kCnonceRandomBytes);
    for (int i = 0; i < kCnonceRandomBytes; ++i)
        bytes.append(static_cast<char>(distribution(randomDevice)));

    return QCryptographicHash::hash(bytes, QCryptographicHash::Md5).toHex();
}

QByteArray buildDigestAuthorization(
    const Credential& credential,
    const AuthChallenge& challenge,
    const QByteArray& method,
    const QByteArray& uri,
    QByteArray cnonce)
{
    const QString realm = challenge.realm.get_value_or(QString());
    const QByteArray nonce = challenge.nonce.get_value_or(QString()).toUtf8();
    const QByteArray qop = challenge.offersQopAuth() ? QByteArray("auth") : QByteArray();
    if (!qop.isEmpty() && cnonce.isEmpty())
        cnonce = generateCnonce();

    const QByteArray response = calculateDigestResponse(
        calculateHa1(credential.username(), realm, credential.password()),
        nonce,
        kDigestNonceCount,
        cnonce,
        qop,
        calculateHa2(method, uri));

    QByteArray header = "Digest username=" + quoted(credential.username().toUtf8())
        + ", realm=" + quoted(realm.toUtf8())
        + ", nonce=" + quoted(nonce)
        + ", uri=" + quoted(uri);
    if (!qop.isEmpty())
    {
        header += ", qop=" + qop
            + ", nc=" + kDigestNonceCount
            + ", cnonce=" + quoted(cnonce);
    }
    header += ", response=" + quoted(response);
    if (challenge.opaque)
        header += ", opaque=" + quoted(challenge.opaque->toUtf8());
    return header;
}

} // namespace auth
} // namespace network
} // namespace cctv
