#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include "credential.h"

namespace cctv {
namespace network {
namespace auth {

/**
 * WS-Security UsernameToken with PasswordDigest.
 */
struct UsernameToken
{
    QString username;
    QByteArray nonce; //< Raw bytes, sent base64-encoded.
    QString created; //< UTC, "yyyy-MM-ddTHH:mm:ssZ".
    QByteArray passwordDigest; //< Base64.

    /**
     * Fresh 16-byte nonce and the current time.
     */
    static UsernameToken generate(const Credential& credential);

    static UsernameToken create(
        const Credential& credential, const QByteArray& nonce, const QString& created);

    /**
     * <Security> element for a SOAP header.
     */
    QByteArray toSecurityHeader() const;
};

/**
 * base64(SHA1(nonce + created + password)).
 */
QByteArray calculatePasswordDigest(
    const QByteArray& nonce, const QString& created, const QString& password);

QString escapeXml(const QString& text);

} // namespace auth
} // namespace network
} // namespace cctv
