#pragma once

#include <stdexcept>

#include <QtCore/QString>

namespace cctv {
namespace network {

/**
 * Malformed user input (address, CIDR notation, range bounds). Thrown before any I/O is started.
 */
class ValidationError:
    public std::runtime_error
{
public:
    explicit ValidationError(const QString& message):
        std::runtime_error(message.toStdString())
    {
    }
};

} // namespace network
} // namespace cctv
