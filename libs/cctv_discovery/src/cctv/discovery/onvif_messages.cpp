#include "onvif_messages.h"

#include <functional>

#include <QtCore/QXmlStreamReader>

namespace cctv {
namespace discovery {
namespace onvif {

namespace {

static const char* const kDeviceNamespace = "http://www.onvif.org/ver10/device/wsdl";
static const char* const kMediaNamespace = "http://www.onvif.org/ver10/media/wsdl";
static const char* const kSchemaNamespace = "http://www.onvif.org/ver10/schema";

QByteArray emptyRequest(const char* name, const char* xmlNamespace)
{
    return QByteArray("<") + name + " xmlns=\"" + xmlNamespace + "\"/>";
}

/**
 * Walks all elements, handler receives local name, the local name of the parent and the reader
 * positioned at the start element. Returns false if the document is not well-formed.
 */
bool forEachElement(
    const QByteArray& xml,
    const std::function<void(
        const QString& name, const QString& parent, QXmlStreamReader* reader)>& handler)
{
    QXmlStreamReader reader(xml);
    QStringList stack;
    while (!reader.atEnd())
    {
        reader.readNext();
        if (reader.isStartElement())
        {
            const QString parent = stack.isEmpty() ? QString() : stack.last();
            const QString name = reader.name().toString();
            stack.append(name);
            handler(name, parent, &reader);
            if (reader.isEndElement())
                stack.removeLast();
        }
        else if (reader.isEndElement())
        {
            if (!stack.isEmpty())
                stack.removeLast();
        }
    }
    return !reader.hasError();
}

QString readText(QXmlStreamReader* reader)
{
    return reader->readElementText(QXmlStreamReader::SkipChildElements).trimmed();
}

int toInt(const QString& text)
{
    bool ok = false;
    const int value = text.toInt(&ok);
    return ok ? value : 0;
}

} // namespace

QByteArray makeEnvelope(const QByteArray& body, const QByteArray& securityHeader)
{
    QByteArray envelope =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<s:Envelope xmlns:s=\"http://www.w3.org/2003/05/soap-envelope\">";
    if (!securityHeader.isEmpty())
        envelope += "<s:Header>" + securityHeader + "</s:Header>";
    envelope += "<s:Body>" + body + "</s:Body></s:Envelope>";
    return envelope;
}

QByteArray getDeviceInformationRequest()
{
    return emptyRequest("GetDeviceInformation", kDeviceNamespace);
}

QByteArray getSystemDateAndTimeRequest()
{
    return emptyRequest("GetSystemDateAndTime", kDeviceNamespace);
}

QByteArray getCapabilitiesRequest()
{
    return QByteArray("<GetCapabilities xmlns=\"") + kDeviceNamespace + "\">"
        "<Category>Media</Category>"
        "</GetCapabilities>";
}

QByteArray getVideoSourcesRequest()
{
    return emptyRequest("GetVideoSources", kMediaNamespace);
}

QByteArray getProfilesRequest()
{
    return emptyRequest("GetProfiles", kMediaNamespace);
}

QByteArray getStreamUriRequest(const QString& profileToken)
{
    QString token = profileToken;
    token.replace('&', "&amp;").replace('<', "&lt;").replace('>', "&gt;");

    return QByteArray("<GetStreamUri xmlns=\"") + kMediaNamespace + "\">"
        "<StreamSetup>"
            "<Stream xmlns=\"" + kSchemaNamespace + "\">RTP-Unicast</Stream>"
            "<Transport xmlns=\"" + kSchemaNamespace + "\"><Protocol>RTSP</Protocol></Transport>"
        "</StreamSetup>"
        "<ProfileToken>" + token.toUtf8() + "</ProfileToken>"
        "</GetStreamUri>";
}

boost::optional<DeviceInformation> parseDeviceInformation(const QByteArray& xml)
{
    DeviceInformation information;
    bool found = false;
    const bool wellFormed = forEachElement(xml,
        [&](const QString& name, const QString& /*parent*/, QXmlStreamReader* reader)
        {
            if (name == "GetDeviceInformationResponse")
                found = true;
            else if (name == "Manufacturer")
                information.manufacturer = readText(reader);
            else if (name == "Model")
                information.model = readText(reader);
            else if (name == "FirmwareVersion")
                information.firmwareVersion = readText(reader);
            else if (name == "SerialNumber")
                information.serialNumber = readText(reader);
            else if (name == "HardwareId")
                information.hardwareId = readText(reader);
        });

    if (!wellFormed || !found)
        return boost::none;
    return information;
}

boost::optional<QDateTime> parseSystemDateAndTime(const QByteArray& xml)
{
    bool inUtc = false;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    bool found = false;

    QXmlStreamReader reader(xml);
    while (!reader.atEnd())
    {
        reader.readNext();
        if (reader.isStartElement())
        {
            const QStringRef name = reader.name();
            if (name == "UTCDateTime")
            {
                inUtc = true;
                found = true;
            }
            else if (inUtc && name == "Year") year = toInt(readText(&reader));
            else if (inUtc && name == "Month") month = toInt(readText(&reader));
            else if (inUtc && name == "Day") day = toInt(readText(&reader));
            else if (inUtc && name == "Hour") hour = toInt(readText(&reader));
            else if (inUtc && name == "Minute") minute = toInt(readText(&reader));
            else if (inUtc && name == "Second") second = toInt(readText(&reader));
        }
        else if (reader.isEndElement() && reader.name() == "UTCDateTime")
        {
            inUtc = false;
        }
    }

    if (reader.hasError() || !found)
        return boost::none;

    const QDateTime dateTime(QDate(year, month, day), QTime(hour, minute, second), Qt::UTC);
    if (!dateTime.isValid())
        return boost::none;
    return dateTime;
}

boost::optional<QString> parseMediaServiceUrl(const QByteArray& xml)
{
    boost::optional<QString> result;
    forEachElement(xml,
        [&](const QString& name, const QString& parent, QXmlStreamReader* reader)
        {
            if (!result && name == "XAddr" && parent == "Media")
            {
                const QString text = readText(reader);
                if (!text.isEmpty())
                    result = text;
            }
        });
    return result;
}

QStringList parseVideoSourceTokens(const QByteArray& xml)
{
    QStringList result;
    forEachElement(xml,
        [&](const QString& name, const QString& /*parent*/, QXmlStreamReader* reader)
        {
            if (name != "VideoSources")
                return;
            const QString token = reader->attributes().value("token").toString();
            if (!token.isEmpty())
                result.append(token);
        });
    return result;
}

std::vector<MediaProfile> parseProfiles(const QByteArray& xml)
{
    std::vector<MediaProfile> result;
    QString section;
    forEachElement(xml,
        [&](const QString& name, const QString& parent, QXmlStreamReader* reader)
        {
            if (name == "Profiles")
            {
                MediaProfile profile;
                profile.token = reader->attributes().value("token").toString();
                result.push_back(profile);
                section.clear();
                return;
            }

            if (result.empty())
                return;

            MediaProfile& profile = result.back();
            if (parent == "Profiles")
                section = name;

            if (name == "Name" && parent == "Profiles")
                profile.name = readText(reader);
            else if (name == "SourceToken" && section == "VideoSourceConfiguration")
                profile.videoSourceToken = readText(reader);
            else if (section != "VideoEncoderConfiguration")
                return;
            else if (name == "Encoding")
                profile.encoding = readText(reader);
            else if (name == "Width" && parent == "Resolution")
                profile.width = toInt(readText(reader));
            else if (name == "Height" && parent == "Resolution")
                profile.height = toInt(readText(reader));
            else if (name == "FrameRateLimit")
                profile.frameRate = readText(reader).toDouble();
            else if (name == "BitrateLimit")
                profile.bitrateKbps = toInt(readText(reader));
            else if (name == "H264Profile")
                profile.h264Profile = readText(reader);
        });

    for (auto& profile: result)
    {
        if (profile.frameRate && *profile.frameRate <= 0)
            profile.frameRate = boost::none;
        if (profile.bitrateKbps && *profile.bitrateKbps <= 0)
            profile.bitrateKbps = boost::none;
    }
    return result;
}

boost::optional<QString> parseStreamUri(const QByteArray& xml)
{
    boost::optional<QString> result;
    forEachElement(xml,
        [&](const QString& name, const QString& parent, QXmlStreamReader* reader)
        {
            if (!result && name == "Uri" && parent == "MediaUri")
            {
                const QString text = readText(reader);
                if (!text.isEmpty())
                    result = text;
            }
        });
    return result;
}

boost::optional<QString> parseFault(const QByteArray& xml)
{
    bool isFault = false;
    QStringList texts;
    forEachElement(xml,
        [&](const QString& name, const QString& parent, QXmlStreamReader* reader)
        {
            if (name == "Fault")
            {
                isFault = true;
            }
            else if (isFault && ((name == "Value" && (parent == "Code" || parent == "Subcode"))
                || (name == "Text" && parent == "Reason")))
            {
                const QString text = readText(reader);
                if (!text.isEmpty())
                    texts.append(text);
            }
        });

    if (!isFault)
        return boost::none;
    return texts.join(QStringLiteral("; "));
}

bool isNotAuthorizedFault(const QByteArray& xml)
{
    const auto fault = parseFault(xml);
    return fault
        && (fault->contains(QLatin1String("NotAuthorized"), Qt::CaseInsensitive)
            || fault->contains(QLatin1String("not authorized"), Qt::CaseInsensitive));
}

} // namespace onvif
} // namespace discovery
} // namespace cctv
