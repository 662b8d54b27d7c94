#pragma once

#include <QtCore/QHash>
#include <QtCore/QString>

namespace cctv {
namespace network {
namespace auth {

class Credential
{
public:
    Credential() = default;
    Credential(QString username, QString password);

    const QString& username() const { return m_username; }
    const QString& password() const { return m_password; }

    /**
     * Loggable form, the password is masked: "" stays empty, up to 2 characters become "**",
     * longer ones keep only the first and the last character ("a***z").
     */
    QString toString() const;

    /**
     * Unmasked "username:password". Only for explicit review by the operator, never for logs.
     */
    QString toDisplayString() const;

    /**
     * Parses "username:password". The password may contain ':'.
     * @return false if there is no ':' or the username is empty.
     */
    static bool parse(const QString& text, Credential* credential);

    static QString maskPassword(const QString& password);

    bool operator==(const Credential& other) const;
    bool operator!=(const Credential& other) const { return !(*this == other); }

private:
    QString m_username;
    QString m_password;
};

uint qHash(const Credential& credential, uint seed = 0);

} // namespace auth
} // namespace network
} // namespace cctv
