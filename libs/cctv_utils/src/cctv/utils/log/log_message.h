#pragma once

#include <string>
#include <type_traits>

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace cctv {
namespace utils {
namespace log {

namespace detail {

inline QString toString(const QString& value) { return value; }
inline QString toString(const QByteArray& value) { return QString::fromUtf8(value); }
inline QString toString(const char* value) { return QString::fromUtf8(value); }
inline QString toString(const std::string& value) { return QString::fromStdString(value); }
inline QString toString(bool value)
{
    return value ? QStringLiteral("true") : QStringLiteral("false");
}

template<typename T>
QString toString(
    const T& value,
    typename std::enable_if<std::is_arithmetic<T>::value>::type* = nullptr)
{
    return QString::number(value);
}

} // namespace detail

/**
 * QString builder used by the log macros: lm("Port %1 of %2").args(port, address).
 */
class Message
{
public:
    Message() = default;
    Message(const char* text): m_text(QString::fromUtf8(text)) {}
    Message(QString text): m_text(std::move(text)) {}

    template<typename T>
    Message arg(const T& value) const
    {
        return Message(m_text.arg(detail::toString(value)));
    }

    Message args() const { return *this; }

    template<typename T, typename... Rest>
    Message args(const T& value, const Rest&... rest) const
    {
        return arg(value).args(rest...);
    }

    const QString& toQString() const { return m_text; }
    operator QString() const { return m_text; }

private:
    QString m_text;
};

} // namespace log
} // namespace utils
} // namespace cctv

using lm = cctv::utils::log::Message;
