#include "ip_range.h"

#include <algorithm>

#include <QtCore/QStringList>

namespace cctv {
namespace network {

namespace {

static const int kMaxPrefixLength = 32;

bool parseDecimal(const QString& text, int maxValue, int* result)
{
    if (text.isEmpty() || text.size() > 3)
        return false;

    int value = 0;
    for (const QChar ch: text)
    {
        if (ch < QLatin1Char('0') || ch > QLatin1Char('9'))
            return false;
        value = value * 10 + (ch.unicode() - '0');
    }

    if (value > maxValue)
        return false;

    *result = value;
    return true;
}

quint32 parseIpv4OrThrow(const QString& text)
{
    quint32 address = 0;
    if (!parseIpv4(text, &address))
        throw ValidationError(QString("Invalid IPv4 address: \"%1\"").arg(text));
    return address;
}

} // namespace

bool parseIpv4(const QString& text, quint32* result)
{
    const QStringList octets = text.split(QLatin1Char('.'));
    if (octets.size() != 4)
        return false;

    quint32 address = 0;
    for (const QString& octet: octets)
    {
        int value = 0;
        if (!parseDecimal(octet, 255, &value))
            return false;
        address = (address << 8) | static_cast<quint32>(value);
    }

    *result = address;
    return true;
}

QString ipv4ToString(quint32 address)
{
    return QString("%1.%2.%3.%4")
        .arg((address >> 24) & 0xFF)
        .arg((address >> 16) & 0xFF)
        .arg((address >> 8) & 0xFF)
        .arg(address & 0xFF);
}

//-------------------------------------------------------------------------------------------------
// Ipv4Range

Ipv4Range::Ipv4Range(quint32 first, quint64 size):
    m_first(first),
    m_size(size)
{
}

Ipv4Range Ipv4Range::fromCidr(const QString& cidr)
{
    const QString trimmed = cidr.trimmed();
    const int slashPos = trimmed.indexOf(QLatin1Char('/'));
    if (slashPos == -1)
        throw ValidationError(QString("CIDR notation requires a prefix length: \"%1\"").arg(cidr));

    const quint32 address = parseIpv4OrThrow(trimmed.left(slashPos));

    int prefixLength = 0;
    if (!parseDecimal(trimmed.mid(slashPos + 1), kMaxPrefixLength, &prefixLength))
        throw ValidationError(QString("Invalid prefix length in \"%1\"").arg(cidr));

    const quint64 blockSize = quint64(1) << (kMaxPrefixLength - prefixLength);
    if (blockSize <= 2)
        return Ipv4Range();

    const quint32 mask = prefixLength == 0
        ? 0
        : ~quint32(0) << (kMaxPrefixLength - prefixLength);
    const quint32 networkAddress = address & mask;
    return Ipv4Range(networkAddress + 1, blockSize - 2);
}

Ipv4Range Ipv4Range::fromBounds(const QString& start, const QString& end)
{
    const quint32 first = parseIpv4OrThrow(start.trimmed());
    const quint32 last = parseIpv4OrThrow(end.trimmed());
    if (first > last)
    {
        throw ValidationError(QString("Range start %1 is greater than range end %2")
            .arg(start.trimmed()).arg(end.trimmed()));
    }

    return Ipv4Range(first, quint64(last) - first + 1);
}

Ipv4Range Ipv4Range::fromAddress(const QString& address)
{
    return Ipv4Range(parseIpv4OrThrow(address.trimmed()), 1);
}

Ipv4Range Ipv4Range::parse(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.contains(QLatin1Char('/')))
        return fromCidr(trimmed);

    const int dashPos = trimmed.indexOf(QLatin1Char('-'));
    if (dashPos != -1)
        return fromBounds(trimmed.left(dashPos), trimmed.mid(dashPos + 1));

    return fromAddress(trimmed);
}

bool Ipv4Range::isValidCidr(const QString& cidr)
{
    try
    {
        fromCidr(cidr);
        return true;
    }
    catch (const ValidationError&)
    {
        return false;
    }
}

quint32 Ipv4Range::last() const
{
    return m_size == 0 ? m_first : static_cast<quint32>(m_first + m_size - 1);
}

std::vector<QString> Ipv4Range::addresses() const
{
    std::vector<QString> result;
    result.reserve(static_cast<std::size_t>(m_size));
    for (quint64 i = 0; i < m_size; ++i)
        result.push_back(ipv4ToString(static_cast<quint32>(m_first + i)));
    return result;
}

//-------------------------------------------------------------------------------------------------
// RangeExpander

void RangeExpander::add(const Ipv4Range& range)
{
    if (range.isEmpty())
        return;

    Interval added{range.first(), quint64(range.first()) + range.size() - 1};

    std::vector<Interval> merged;
    merged.reserve(m_intervals.size() + 1);
    bool inserted = false;
    for (const Interval& interval: m_intervals)
    {
        if (interval.last + 1 < added.first)
        {
            merged.push_back(interval);
        }
        else if (added.last + 1 < interval.first)
        {
            if (!inserted)
            {
                merged.push_back(added);
                inserted = true;
            }
            merged.push_back(interval);
        }
        else
        {
            added.first = std::min(added.first, interval.first);
            added.last = std::max(added.last, interval.last);
        }
    }

    if (!inserted)
        merged.push_back(added);

    m_intervals = std::move(merged);
}

void RangeExpander::add(const QString& text)
{
    add(Ipv4Range::parse(text));
}

void RangeExpander::add(const QStringList& texts)
{
    for (const QString& text: texts)
        add(text);
}

bool RangeExpander::contains(quint32 address) const
{
    return std::any_of(
        m_intervals.begin(), m_intervals.end(),
        [address](const Interval& interval)
        {
            return interval.first <= address && address <= interval.last;
        });
}

quint64 RangeExpander::count() const
{
    quint64 total = 0;
    for (const Interval& interval: m_intervals)
        total += interval.last - interval.first + 1;
    return total;
}

std::vector<QString> RangeExpander::expand() const
{
    std::vector<QString> result;
    result.reserve(static_cast<std::size_t>(count()));
    for (const Interval& interval: m_intervals)
    {
        for (quint64 address = interval.first; address <= interval.last; ++address)
            result.push_back(ipv4ToString(static_cast<quint32>(address)));
    }
    return result;
}

} // namespace network
} // namespace cctv
