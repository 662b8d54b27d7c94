#include "mac_address.h"

#include <QtCore/QRegularExpression>

namespace cctv {
namespace network {

namespace {

static const int kMacHexDigits = 12;
static const int kMinPrefixSourceLength = 8;

bool isHexDigits(const QString& text)
{
    for (const QChar ch: text)
    {
        if (!((ch >= QLatin1Char('0') && ch <= QLatin1Char('9'))
            || (ch >= QLatin1Char('A') && ch <= QLatin1Char('F'))))
        {
            return false;
        }
    }
    return true;
}

QString stripSeparators(const QString& text)
{
    QString result = text;
    result.remove(QLatin1Char(':'));
    result.remove(QLatin1Char('-'));
    return result.toUpper();
}

} // namespace

QString normalizeMac(const QString& text)
{
    const QString digits = stripSeparators(text);
    if (digits.size() != kMacHexDigits || !isHexDigits(digits))
        return text;

    QString result;
    for (int i = 0; i < kMacHexDigits; i += 2)
    {
        if (i > 0)
            result += QLatin1Char(':');
        result += digits.midRef(i, 2);
    }
    return result;
}

boost::optional<QString> macPrefix(const QString& text)
{
    if (text.size() < kMinPrefixSourceLength)
        return boost::none;

    const QString digits = stripSeparators(text);
    if (digits.size() != kMacHexDigits || !isHexDigits(digits))
        return boost::none;

    return normalizeMac(text).left(8);
}

boost::optional<QString> findMac(const QString& text)
{
    static const QRegularExpression kMacPattern(
        QStringLiteral("([0-9A-Fa-f]{2}[:-]){5}([0-9A-Fa-f]{2})"));

    const QRegularExpressionMatch match = kMacPattern.match(text);
    if (!match.hasMatch())
        return boost::none;

    return normalizeMac(match.captured(0));
}

} // namespace network
} // namespace cctv
