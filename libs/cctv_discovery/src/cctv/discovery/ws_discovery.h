#pragma once

#include <chrono>
#include <vector>

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace cctv {
namespace discovery {

static const QString kWsDiscoveryMulticastAddress = QStringLiteral("239.255.255.250");
static const quint16 kWsDiscoveryPort = 3702;

struct WsDiscoveryMatch
{
    QString address; //< Host of the first usable XAddr.
    QString serviceUrl; //< Device service URL (first usable XAddr).
    QString endpointReference;
    QStringList scopes;
};

/**
 * ONVIF WS-Discovery: one multicast Probe for NetworkVideoTransmitter, ProbeMatch responses
 * collected until the timeout expires.
 */
class WsDiscoveryProbe
{
public:
    explicit WsDiscoveryProbe(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

    /**
     * Blocks for the whole timeout. Duplicate addresses are reported once.
     * @return Empty if the probe could not be sent.
     */
    std::vector<WsDiscoveryMatch> probe();

    static QByteArray makeProbeMessage(const QString& messageId);

    /**
     * A datagram may carry several ProbeMatch elements. Matches without an http(s) XAddr are
     * dropped.
     */
    static std::vector<WsDiscoveryMatch> parseProbeMatches(const QByteArray& datagram);

private:
    std::chrono::milliseconds m_timeout;
};

} // namespace discovery
} // namespace cctv
