#pragma once

#include <boost/optional.hpp>

#include <QtCore/QString>

namespace cctv {
namespace network {

/**
 * Strips ':' and '-' separators and upper-cases. If exactly 12 hex digits remain the result is
 * "XX:XX:XX:XX:XX:XX", otherwise text is returned unchanged.
 */
QString normalizeMac(const QString& text);

/**
 * First three octets of the canonical form ("XX:XX:XX").
 * @return boost::none for text shorter than 8 characters or not normalizable.
 */
boost::optional<QString> macPrefix(const QString& text);

/**
 * Finds the first MAC-shaped token (six hex pairs separated by ':' or '-') in text.
 */
boost::optional<QString> findMac(const QString& text);

} // namespace network
} // namespace cctv
