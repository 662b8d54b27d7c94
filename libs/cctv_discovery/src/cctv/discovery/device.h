#pragma once

#include <set>
#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QString>

#include <cctv/network/auth/auth_method.h>
#include <cctv/network/auth/credential.h>

#include "device_status.h"
#include "rtsp_stream.h"

namespace cctv {
namespace discovery {

/**
 * Discovery record of one candidate address. Mutated only by the pipeline run that owns it,
 * observers receive copies.
 */
class Device
{
public:
    Device() = default;
    explicit Device(QString address);

    QString address;
    boost::optional<QString> hardwareAddress;
    QString name;
    QString type;
    QString manufacturer;
    QString model;
    QString serialNumber;
    QString firmwareVersion;
    boost::optional<qint64> clockOffsetSeconds; //< Device clock minus scanner clock.
    boost::optional<network::auth::Credential> credential;
    boost::optional<QString> onvifServiceUrl;
    network::auth::AuthMethod authMethod = network::auth::AuthMethod::none;
    bool authFailed = false;
    std::set<int> onvifPorts;
    std::set<int> rtspPorts;
    std::set<int> specialPorts;
    bool isNvr = false;
    std::vector<RtspStream> streams;

    DeviceStatus status() const { return m_status; }
    const boost::optional<QString>& errorMessage() const { return m_errorMessage; }

    /**
     * Moves along the status graph. Entering completed clears the error message, entering
     * authFailed or error records message.
     * @return false (status unchanged) for an illegal transition or a missing message.
     */
    bool transitionTo(DeviceStatus status, const QString& message = QString());

    bool hasOpenPorts() const;

    void addStream(RtspStream stream);

private:
    DeviceStatus m_status = DeviceStatus::pending;
    boost::optional<QString> m_errorMessage;
};

} // namespace discovery
} // namespace cctv
