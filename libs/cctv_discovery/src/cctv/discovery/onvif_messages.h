#pragma once

#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace cctv {
namespace discovery {
namespace onvif {

static const QByteArray kSoapContentType = "application/soap+xml; charset=utf-8";
static const QString kDeviceServicePath = QStringLiteral("/onvif/device_service");

struct DeviceInformation
{
    QString manufacturer;
    QString model;
    QString firmwareVersion;
    QString serialNumber;
    QString hardwareId;
};

struct MediaProfile
{
    QString token;
    QString name;
    QString videoSourceToken;
    QString encoding; //< As reported: "H264", "H265", "JPEG", "MPEG4".
    int width = 0;
    int height = 0;
    boost::optional<double> frameRate;
    boost::optional<int> bitrateKbps;
    QString h264Profile;

    bool hasVideo() const { return !encoding.isEmpty(); }
};

/**
 * SOAP 1.2 envelope around body. securityHeader goes into <s:Header> if not empty.
 */
QByteArray makeEnvelope(const QByteArray& body, const QByteArray& securityHeader = QByteArray());

QByteArray getDeviceInformationRequest();
QByteArray getSystemDateAndTimeRequest();
QByteArray getCapabilitiesRequest();
QByteArray getVideoSourcesRequest();
QByteArray getProfilesRequest();
QByteArray getStreamUriRequest(const QString& profileToken);

boost::optional<DeviceInformation> parseDeviceInformation(const QByteArray& xml);

/**
 * UTCDateTime of a GetSystemDateAndTime response.
 */
boost::optional<QDateTime> parseSystemDateAndTime(const QByteArray& xml);

/**
 * Media service XAddr of a GetCapabilities response.
 */
boost::optional<QString> parseMediaServiceUrl(const QByteArray& xml);

QStringList parseVideoSourceTokens(const QByteArray& xml);
std::vector<MediaProfile> parseProfiles(const QByteArray& xml);
boost::optional<QString> parseStreamUri(const QByteArray& xml);

/**
 * @return Fault code and reason texts, boost::none if xml is not a SOAP fault.
 */
boost::optional<QString> parseFault(const QByteArray& xml);

bool isNotAuthorizedFault(const QByteArray& xml);

} // namespace onvif
} // namespace discovery
} // namespace cctv
