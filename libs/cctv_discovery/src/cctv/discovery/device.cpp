#include "device.h"

#include <cctv/utils/log/log.h>

namespace cctv {
namespace discovery {

Device::Device(QString address):
    address(std::move(address))
{
}

bool Device::transitionTo(DeviceStatus status, const QString& message)
{
    if (!isTransitionAllowed(m_status, status))
    {
        CCTV_WARNING(this, lm("%1: illegal status change %2 -> %3").args(
            address, toString(m_status), toString(status)));
        return false;
    }

    if (requiresMessage(status) && message.trimmed().isEmpty())
    {
        CCTV_WARNING(this, lm("%1: status %2 requires a message").args(address, toString(status)));
        return false;
    }

    CCTV_VERBOSE(this, lm("%1: %2 -> %3").args(address, toString(m_status), toString(status)));
    m_status = status;
    if (status == DeviceStatus::completed)
        m_errorMessage = boost::none;
    else if (requiresMessage(status))
        m_errorMessage = message;
    return true;
}

bool Device::hasOpenPorts() const
{
    return !onvifPorts.empty() || !rtspPorts.empty() || !specialPorts.empty();
}

void Device::addStream(RtspStream stream)
{
    streams.push_back(std::move(stream));
}

} // namespace discovery
} // namespace cctv
