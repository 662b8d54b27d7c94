#pragma once

#include <QtCore/QByteArray>

#include "auth_challenge.h"
#include "credential.h"

namespace cctv {
namespace network {
namespace auth {

static const QByteArray kDigestNonceCount = "00000001";

/**
 * md5hex(username:realm:password).
 */
QByteArray calculateHa1(const QString& username, const QString& realm, const QString& password);

/**
 * md5hex(method:uri).
 */
QByteArray calculateHa2(const QByteArray& method, const QByteArray& uri);

/**
 * RFC 2617 response. With empty qop the RFC 2069 form md5hex(HA1:nonce:HA2) is used.
 */
QByteArray calculateDigestResponse(
    const QByteArray& ha1,
    const QByteArray& nonce,
    const QByteArray& nonceCount,
    const QByteArray& cnonce,
    const QByteArray& qop,
    const QByteArray& ha2);

/**
 * md5hex of 16 random bytes.
 */
QByteArray generateCnonce();

/**
 * Builds the Authorization header value for a valid Digest challenge.
 * qop=auth with nc and cnonce is sent only if the challenge offers it, opaque is echoed only if
 * the challenge carries one.
 * @param cnonce Generated if empty.
 */
QByteArray buildDigestAuthorization(
    const Credential& credential,
    const AuthChallenge& challenge,
    const QByteArray& method,
    const QByteArray& uri,
    QByteArray cnonce = QByteArray());

} // namespace auth
} // namespace network
} // namespace cctv
