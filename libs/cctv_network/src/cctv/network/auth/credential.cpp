#include "credential.h"

namespace cctv {
namespace network {
namespace auth {

Credential::Credential(QString username, QString password):
    m_username(std::move(username)),
    m_password(std::move(password))
{
}

QString Credential::toString() const
{
    return m_username + QLatin1Char(':') + maskPassword(m_password);
}

QString Credential::toDisplayString() const
{
    return m_username + QLatin1Char(':') + m_password;
}

bool Credential::parse(const QString& text, Credential* credential)
{
    const int colonPos = text.indexOf(QLatin1Char(':'));
    if (colonPos <= 0)
        return false;

    *credential = Credential(text.left(colonPos), text.mid(colonPos + 1));
    return true;
}

QString Credential::maskPassword(const QString& password)
{
    if (password.isEmpty())
        return QString();
    if (password.size() <= 2)
        return QStringLiteral("**");
    return password.left(1) + QStringLiteral("***") + password.right(1);
}

bool Credential::operator==(const Credential& other) const
{
    return m_username == other.m_username && m_password == other.m_password;
}

uint qHash(const Credential& credential, uint seed)
{
    return ::qHash(credential.username(), seed) ^ ::qHash(credential.password(), seed + 1);
}

} // namespace auth
} // namespace network
} // namespace cctv
