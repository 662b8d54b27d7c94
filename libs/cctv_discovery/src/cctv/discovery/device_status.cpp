#include "device_status.h"

namespace cctv {
namespace discovery {

QString toString(DeviceStatus status)
{
    switch (status)
    {
        case DeviceStatus::pending:
            return QStringLiteral("PENDING");
        case DeviceStatus::scanning:
            return QStringLiteral("SCANNING");
        case DeviceStatus::authenticating:
            return QStringLiteral("AUTHENTICATING");
        case DeviceStatus::analyzing:
            return QStringLiteral("ANALYZING");
        case DeviceStatus::completed:
            return QStringLiteral("COMPLETED");
        case DeviceStatus::authFailed:
            return QStringLiteral("AUTH_FAILED");
        case DeviceStatus::error:
            return QStringLiteral("ERROR");
    }
    return QString();
}

bool isTerminal(DeviceStatus status)
{
    return status == DeviceStatus::completed
        || status == DeviceStatus::authFailed
        || status == DeviceStatus::error;
}

bool isTransitionAllowed(DeviceStatus from, DeviceStatus to)
{
    if (isTerminal(from))
        return false;

    if (to == DeviceStatus::error)
        return true;

    switch (from)
    {
        case DeviceStatus::pending:
            return to == DeviceStatus::scanning;
        case DeviceStatus::scanning:
            return to == DeviceStatus::authenticating;
        case DeviceStatus::authenticating:
            return to == DeviceStatus::analyzing || to == DeviceStatus::authFailed;
        case DeviceStatus::analyzing:
            return to == DeviceStatus::completed;
        default:
            return false;
    }
}

bool requiresMessage(DeviceStatus status)
{
    return status == DeviceStatus::authFailed || status == DeviceStatus::error;
}

} // namespace discovery
} // namespace cctv
