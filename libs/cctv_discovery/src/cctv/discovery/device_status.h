#pragma once

#include <QtCore/QString>

namespace cctv {
namespace discovery {

enum class DeviceStatus
{
    pending,
    scanning,
    authenticating,
    analyzing,
    completed,
    authFailed,
    error,
};

QString toString(DeviceStatus status);

bool isTerminal(DeviceStatus status);

/**
 * Forward-only graph: pending -> scanning -> authenticating -> analyzing -> completed,
 * authenticating -> authFailed, and any non-terminal status -> error.
 */
bool isTransitionAllowed(DeviceStatus from, DeviceStatus to);

/**
 * Entering authFailed or error requires a non-empty message.
 */
bool requiresMessage(DeviceStatus status);

} // namespace discovery
} // namespace cctv
