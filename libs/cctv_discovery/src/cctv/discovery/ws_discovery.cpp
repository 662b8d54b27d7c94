#include "ws_discovery.h"

#include <algorithm>

#include <boost/optional.hpp>

#include <QtCore/QElapsedTimer>
#include <QtCore/QRegExp>
#include <QtCore/QUrl>
#include <QtCore/QUuid>
#include <QtCore/QXmlStreamReader>
#include <QtNetwork/QHostAddress>
#include <QtNetwork/QUdpSocket>

#include <cctv/utils/log/log.h>

namespace cctv {
namespace discovery {

namespace {

static const int kMaxDatagramSize = 64 * 1024;

boost::optional<QUrl> firstUsableXAddr(const QString& xAddrs)
{
    for (const QString& item: xAddrs.split(QRegExp("\\s+"), QString::SkipEmptyParts))
    {
        const QUrl url(item);
        if (!url.isValid() || url.host().isEmpty())
            continue;
        if (url.scheme() == QLatin1String("http") || url.scheme() == QLatin1String("https"))
            return url;
    }
    return boost::none;
}

} // namespace

WsDiscoveryProbe::WsDiscoveryProbe(std::chrono::milliseconds timeout):
    m_timeout(timeout)
{
}

std::vector<WsDiscoveryMatch> WsDiscoveryProbe::probe()
{
    std::vector<WsDiscoveryMatch> matches;

    QUdpSocket socket;
    if (!socket.bind(QHostAddress(QHostAddress::AnyIPv4), 0))
    {
        CCTV_WARNING(this, lm("Cannot bind UDP socket. %1").arg(socket.errorString()));
        return matches;
    }

    const QByteArray message = makeProbeMessage(
        QUuid::createUuid().toString().mid(1, 36));
    const qint64 sent = socket.writeDatagram(
        message, QHostAddress(kWsDiscoveryMulticastAddress), kWsDiscoveryPort);
    if (sent != message.size())
    {
        CCTV_WARNING(this, lm("Cannot send probe. %1").arg(socket.errorString()));
        return matches;
    }

    CCTV_DEBUG(this, lm("Probe sent, collecting matches for %1 ms").arg(m_timeout.count()));

    QElapsedTimer timer;
    timer.start();
    for (;;)
    {
        const qint64 remaining = m_timeout.count() - timer.elapsed();
        if (remaining <= 0)
            break;

        if (!socket.hasPendingDatagrams() && !socket.waitForReadyRead((int) remaining))
            continue;

        while (socket.hasPendingDatagrams())
        {
            QByteArray datagram;
            datagram.resize((int) std::min<qint64>(
                std::max<qint64>(socket.pendingDatagramSize(), 0), kMaxDatagramSize));
            QHostAddress sender;
            const qint64 size = socket.readDatagram(datagram.data(), datagram.size(), &sender);
            if (size < 0)
                break;
            datagram.resize((int) size);

            for (WsDiscoveryMatch& match: parseProbeMatches(datagram))
            {
                const auto existing = std::find_if(matches.begin(), matches.end(),
                    [&match](const WsDiscoveryMatch& item)
                    {
                        return item.address == match.address;
                    });
                if (existing != matches.end())
                    continue;

                CCTV_DEBUG(this, lm("ProbeMatch from %1: %2").args(
                    sender.toString(), match.serviceUrl));
                matches.push_back(std::move(match));
            }
        }
    }

    CCTV_INFO(this, lm("WS-Discovery found %1 device(s)").arg(matches.size()));
    return matches;
}

QByteArray WsDiscoveryProbe::makeProbeMessage(const QString& messageId)
{
    return QString(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<s:Envelope xmlns:s=\"http://www.w3.org/2003/05/soap-envelope\" "
            "xmlns:a=\"http://schemas.xmlsoap.org/ws/2004/08/addressing\" "
            "xmlns:d=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\" "
            "xmlns:dn=\"http://www.onvif.org/ver10/network/wsdl\">"
        "<s:Header>"
        "<a:Action s:mustUnderstand=\"1\">"
            "http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe</a:Action>"
        "<a:MessageID>uuid:%1</a:MessageID>"
        "<a:ReplyTo><a:Address>"
            "http://schemas.xmlsoap.org/ws/2004/08/addressing/role/anonymous"
        "</a:Address></a:ReplyTo>"
        "<a:To s:mustUnderstand=\"1\">urn:schemas-xmlsoap-org:ws:2005:04:discovery</a:To>"
        "</s:Header>"
        "<s:Body><d:Probe><d:Types>dn:NetworkVideoTransmitter</d:Types></d:Probe></s:Body>"
        "</s:Envelope>").arg(messageId).toUtf8();
}

std::vector<WsDiscoveryMatch> WsDiscoveryProbe::parseProbeMatches(const QByteArray& datagram)
{
    std::vector<WsDiscoveryMatch> matches;

    QXmlStreamReader xml(datagram);
    bool inProbeMatch = false;
    bool inEndpointReference = false;
    WsDiscoveryMatch current;
    QString xAddrs;

    while (!xml.atEnd())
    {
        xml.readNext();
        if (xml.isStartElement())
        {
            const QStringRef name = xml.name();
            if (name == QLatin1String("ProbeMatch"))
            {
                inProbeMatch = true;
                current = WsDiscoveryMatch();
                xAddrs.clear();
            }
            else if (!inProbeMatch)
            {
                continue;
            }
            else if (name == QLatin1String("EndpointReference"))
            {
                inEndpointReference = true;
            }
            else if (name == QLatin1String("Address") && inEndpointReference)
            {
                current.endpointReference = xml.readElementText().trimmed();
            }
            else if (name == QLatin1String("XAddrs"))
            {
                xAddrs = xml.readElementText().trimmed();
            }
            else if (name == QLatin1String("Scopes"))
            {
                current.scopes = xml.readElementText().split(
                    QRegExp("\\s+"), QString::SkipEmptyParts);
            }
        }
        else if (xml.isEndElement())
        {
            const QStringRef name = xml.name();
            if (name == QLatin1String("EndpointReference"))
            {
                inEndpointReference = false;
            }
            else if (name == QLatin1String("ProbeMatch") && inProbeMatch)
            {
                inProbeMatch = false;
                if (const auto url = firstUsableXAddr(xAddrs))
                {
                    current.serviceUrl = url->toString();
                    current.address = url->host();
                    matches.push_back(current);
                }
            }
        }
    }

    if (xml.hasError())
        CCTV_DEBUG("WsDiscovery", lm("Malformed ProbeMatch: %1").arg(xml.errorString()));

    return matches;
}

} // namespace discovery
} // namespace cctv
