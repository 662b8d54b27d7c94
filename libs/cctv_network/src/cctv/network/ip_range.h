#pragma once

#include <vector>

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "validation_error.h"

namespace cctv {
namespace network {

/**
 * Parses strict dotted-quad notation: four decimal octets 0-255, no signs or spaces inside.
 * @return false if text is not an IPv4 address. *result is not modified then.
 */
bool parseIpv4(const QString& text, quint32* result);
QString ipv4ToString(quint32 address);

/**
 * Inclusive interval of IPv4 host addresses.
 */
class Ipv4Range
{
public:
    Ipv4Range() = default;

    /**
     * Host addresses of "a.b.c.d/n": network and broadcast addresses are excluded,
     * so /31 and /32 yield an empty range.
     * @throws ValidationError
     */
    static Ipv4Range fromCidr(const QString& cidr);

    /**
     * Inclusive [start, end].
     * @throws ValidationError if either bound is malformed or start > end.
     */
    static Ipv4Range fromBounds(const QString& start, const QString& end);

    static Ipv4Range fromAddress(const QString& address);

    /**
     * Accepts "a.b.c.d/n", "a.b.c.d-e.f.g.h" or a single address.
     * @throws ValidationError
     */
    static Ipv4Range parse(const QString& text);

    static bool isValidCidr(const QString& cidr);

    bool isEmpty() const { return m_size == 0; }
    quint64 size() const { return m_size; }
    quint32 first() const { return m_first; }
    quint32 last() const;

    std::vector<QString> addresses() const;

private:
    Ipv4Range(quint32 first, quint64 size);

private:
    quint32 m_first = 0;
    quint64 m_size = 0;
};

/**
 * Union of ranges, kept as disjoint ascending intervals.
 */
class RangeExpander
{
public:
    void add(const Ipv4Range& range);

    /**
     * @throws ValidationError
     */
    void add(const QString& text);

    void add(const QStringList& texts);

    bool contains(quint32 address) const;

    /**
     * Number of distinct addresses. Does not materialize them.
     */
    quint64 count() const;

    /**
     * All distinct addresses in ascending numeric order.
     */
    std::vector<QString> expand() const;

private:
    struct Interval
    {
        quint64 first;
        quint64 last;
    };

    std::vector<Interval> m_intervals;
};

} // namespace network
} // namespace cctv
