#include "fake_camera_network.h"

#include <QtCore/QDateTime>
#include <QtCore/QMutexLocker>
#include <QtCore/QRegularExpression>

namespace cctv {
namespace discovery {
namespace test {

using namespace network;

namespace {

static const int kRtspPort = 554;

http::Response makeResponse(
    const QUrl& url, int statusCode, const QByteArray& reasonPhrase,
    const QByteArray& body = QByteArray())
{
    http::Response response;
    response.protocol = url.scheme() == "rtsp" ? http::kRtspProtocol : http::kHttpProtocol;
    response.statusCode = statusCode;
    response.reasonPhrase = reasonPhrase;
    response.body = body;
    return response;
}

bool isAuthorized(const FakeCamera& camera, const http::Request& request)
{
    if (!camera.requiresAuthentication)
        return true;

    const QString userInfo =
        camera.credential.username() + QLatin1Char(':') + camera.credential.password();
    const QByteArray expected = "Basic " + userInfo.toUtf8().toBase64();
    return request.header("Authorization").get_value_or(QByteArray()) == expected;
}

QString elementText(const QByteArray& xml, const QString& name)
{
    const QRegularExpression expression(QString("<%1>([^<]*)</%1>").arg(name));
    return expression.match(QString::fromUtf8(xml)).captured(1);
}

QByteArray profilesXml(const std::vector<FakeMediaProfile>& profiles)
{
    QByteArray xml = "<trt:GetProfilesResponse>";
    for (const auto& profile: profiles)
    {
        xml += "<trt:Profiles token=\"" + profile.token.toUtf8() + "\">"
            "<tt:Name>" + profile.name.toUtf8() + "</tt:Name>"
            "<tt:VideoSourceConfiguration token=\"VideoSourceConfig\">"
            "<tt:SourceToken>VideoSource_1</tt:SourceToken>"
            "</tt:VideoSourceConfiguration>";
        if (!profile.encoding.isEmpty())
        {
            xml += "<tt:VideoEncoderConfiguration>"
                "<tt:Encoding>" + profile.encoding.toUtf8() + "</tt:Encoding>"
                "<tt:Resolution>"
                "<tt:Width>" + QByteArray::number(profile.width) + "</tt:Width>"
                "<tt:Height>" + QByteArray::number(profile.height) + "</tt:Height>"
                "</tt:Resolution>"
                "<tt:RateControl>"
                "<tt:FrameRateLimit>25</tt:FrameRateLimit>"
                "<tt:BitrateLimit>" + QByteArray::number(profile.bitrateKbps) + "</tt:BitrateLimit>"
                "</tt:RateControl>";
            if (!profile.h264Profile.isEmpty())
            {
                xml += "<tt:H264><tt:H264Profile>" + profile.h264Profile.toUtf8()
                    + "</tt:H264Profile></tt:H264>";
            }
            xml += "</tt:VideoEncoderConfiguration>";
        }
        xml += "</trt:Profiles>";
    }
    xml += "</trt:GetProfilesResponse>";
    return xml;
}

} // namespace

void FakeCameraNetwork::addCamera(const QString& address, FakeCamera camera)
{
    QMutexLocker lock(&m_mutex);
    m_cameras[address] = std::move(camera);
}

bool FakeCameraNetwork::isOpen(
    const QString& address,
    quint16 port,
    std::chrono::milliseconds /*timeout*/)
{
    QMutexLocker lock(&m_mutex);
    const auto camera = m_cameras.find(address);
    return camera != m_cameras.end() && camera->second.openPorts.count(port) > 0;
}

boost::optional<QString> FakeCameraNetwork::resolve(const QString& address)
{
    QMutexLocker lock(&m_mutex);
    const auto camera = m_cameras.find(address);
    if (camera == m_cameras.end())
        return boost::none;
    return camera->second.hardwareAddress;
}

boost::optional<http::Response> FakeCameraNetwork::send(
    const QUrl& url, const http::Request& request)
{
    QMutexLocker lock(&m_mutex);
    ++m_requestCount;
    m_requestedUrls[url.host()].append(url.toString());
    if (const auto authorization = request.header("Authorization"))
        m_authenticationSchemes.insert(QString::fromLatin1(authorization->split(' ').first()));
    if (request.body.contains("UsernameToken"))
        m_authenticationSchemes.insert("WS-Security");

    const auto it = m_cameras.find(url.host());
    if (it == m_cameras.end())
        return boost::none;

    const FakeCamera& camera = it->second;
    if (!camera.responding || camera.openPorts.count(url.port()) == 0)
        return boost::none;

    if (!isAuthorized(camera, request))
    {
        http::Response response = makeResponse(url, http::StatusCode::unauthorized, "Unauthorized");
        response.addHeader("WWW-Authenticate", "Basic realm=\"fake camera\"");
        if (camera.offerDigestChallenge)
        {
            response.addHeader(
                "WWW-Authenticate",
                "Digest realm=\"fake camera\", nonce=\"0a4f113b\", algorithm=MD5");
        }
        return response;
    }

    if (url.scheme() == "rtsp")
        return rtspResponse(camera, url);

    if (!camera.onvif)
        return makeResponse(url, http::StatusCode::notFound, "Not Found");
    return onvifResponse(url.host(), camera, request.body);
}

int FakeCameraNetwork::requestCount() const
{
    QMutexLocker lock(&m_mutex);
    return m_requestCount;
}

QStringList FakeCameraNetwork::requestedUrls(const QString& address) const
{
    QMutexLocker lock(&m_mutex);
    const auto it = m_requestedUrls.find(address);
    return it == m_requestedUrls.end() ? QStringList() : it->second;
}

std::set<QString> FakeCameraNetwork::authenticationSchemes() const
{
    QMutexLocker lock(&m_mutex);
    return m_authenticationSchemes;
}

QByteArray FakeCameraNetwork::soapResponse(const QByteArray& body)
{
    return
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<SOAP-ENV:Envelope xmlns:SOAP-ENV=\"http://www.w3.org/2003/05/soap-envelope\" "
            "xmlns:tds=\"http://www.onvif.org/ver10/device/wsdl\" "
            "xmlns:trt=\"http://www.onvif.org/ver10/media/wsdl\" "
            "xmlns:tt=\"http://www.onvif.org/ver10/schema\">"
        "<SOAP-ENV:Body>" + body + "</SOAP-ENV:Body>"
        "</SOAP-ENV:Envelope>";
}

http::Response FakeCameraNetwork::onvifResponse(
    const QString& address, const FakeCamera& camera, const QByteArray& body) const
{
    const QUrl url(QString("http://%1/").arg(address));
    QByteArray content;
    if (body.contains("GetDeviceInformation"))
    {
        content = "<tds:GetDeviceInformationResponse>"
            "<tds:Manufacturer>" + camera.manufacturer.toUtf8() + "</tds:Manufacturer>"
            "<tds:Model>" + camera.model.toUtf8() + "</tds:Model>"
            "<tds:FirmwareVersion>" + camera.firmwareVersion.toUtf8() + "</tds:FirmwareVersion>"
            "<tds:SerialNumber>" + camera.serialNumber.toUtf8() + "</tds:SerialNumber>"
            "<tds:HardwareId>88</tds:HardwareId>"
            "</tds:GetDeviceInformationResponse>";
    }
    else if (body.contains("GetSystemDateAndTime"))
    {
        const QDateTime now = QDateTime::currentDateTimeUtc().addSecs(120);
        content = "<tds:GetSystemDateAndTimeResponse><tds:SystemDateAndTime><tt:UTCDateTime>"
            "<tt:Time>"
            "<tt:Hour>" + QByteArray::number(now.time().hour()) + "</tt:Hour>"
            "<tt:Minute>" + QByteArray::number(now.time().minute()) + "</tt:Minute>"
            "<tt:Second>" + QByteArray::number(now.time().second()) + "</tt:Second>"
            "</tt:Time>"
            "<tt:Date>"
            "<tt:Year>" + QByteArray::number(now.date().year()) + "</tt:Year>"
            "<tt:Month>" + QByteArray::number(now.date().month()) + "</tt:Month>"
            "<tt:Day>" + QByteArray::number(now.date().day()) + "</tt:Day>"
            "</tt:Date>"
            "</tt:UTCDateTime></tds:SystemDateAndTime></tds:GetSystemDateAndTimeResponse>";
    }
    else if (body.contains("GetCapabilities"))
    {
        // Devices often report an address the scanner can't reach.
        content = "<tds:GetCapabilitiesResponse><tds:Capabilities>"
            "<tt:Media><tt:XAddr>http://192.0.2.1/onvif/Media</tt:XAddr></tt:Media>"
            "</tds:Capabilities></tds:GetCapabilitiesResponse>";
    }
    else if (body.contains("GetVideoSources"))
    {
        content = "<trt:GetVideoSourcesResponse>";
        for (const QString& token: camera.videoSources)
            content += "<trt:VideoSources token=\"" + token.toUtf8() + "\"/>";
        content += "</trt:GetVideoSourcesResponse>";
    }
    else if (body.contains("GetProfiles"))
    {
        content = profilesXml(camera.profiles);
    }
    else if (body.contains("GetStreamUri"))
    {
        const QString token = elementText(body, "ProfileToken");
        for (const auto& profile: camera.profiles)
        {
            if (profile.token != token)
                continue;
            content = "<trt:GetStreamUriResponse><trt:MediaUri><tt:Uri>"
                + QString("rtsp://%1:%2%3").arg(address).arg(kRtspPort).arg(profile.streamPath)
                    .toUtf8()
                + "</tt:Uri></trt:MediaUri></trt:GetStreamUriResponse>";
        }
    }

    if (content.isEmpty())
        return makeResponse(url, http::StatusCode::internalServerError, "Internal Server Error");
    return makeResponse(url, http::StatusCode::ok, "OK", soapResponse(content));
}

http::Response FakeCameraNetwork::rtspResponse(const FakeCamera& camera, const QUrl& url) const
{
    QString path = url.path();
    if (url.hasQuery())
        path += '?' + url.query();

    const auto stream = camera.rtspStreams.find(path);
    if (stream == camera.rtspStreams.end())
        return makeResponse(url, http::StatusCode::notFound, "Not Found");

    http::Response response = makeResponse(url, http::StatusCode::ok, "OK", stream->second);
    response.setHeader("Content-Type", "application/sdp");
    return response;
}

//-------------------------------------------------------------------------------------------------

namespace sdp {

const char* const kMainStream =
    "v=0\r\n"
    "o=- 1109162014219182 0 IN IP4 0.0.0.0\r\n"
    "s=Media Presentation\r\n"
    "t=0 0\r\n"
    "m=video 0 RTP/AVP 96\r\n"
    "b=AS:4096\r\n"
    "a=rtpmap:96 H264/90000\r\n"
    "a=fmtp:96 profile-level-id=420029; packetization-mode=1; "
        "sprop-parameter-sets=Z00AKO0A8ARPyoA=,aO48gA==\r\n"
    "a=framerate:25\r\n";

const char* const kSubStream =
    "v=0\r\n"
    "s=Media Presentation\r\n"
    "m=video 0 RTP/AVP 96\r\n"
    "b=AS:256\r\n"
    "a=rtpmap:96 H264/90000\r\n"
    "a=fmtp:96 packetization-mode=1;profile-level-id=4d401e\r\n"
    "a=x-dimensions:640,360\r\n";

const char* const kMjpegStream =
    "v=0\r\n"
    "s=-\r\n"
    "m=video 0 RTP/AVP 26\r\n"
    "a=rtpmap:26 JPEG/90000\r\n"
    "a=x-dimensions:1280,720\r\n";

} // namespace sdp

FakeCamera makeOnvifCamera()
{
    FakeCamera camera;
    camera.openPorts = {80, 554};
    camera.hardwareAddress = QString("44:19:B6:12:34:56");
    camera.onvif = true;

    FakeMediaProfile mainProfile;
    mainProfile.token = "Profile_1";
    mainProfile.name = "mainStream";
    mainProfile.encoding = "H264";
    mainProfile.width = 1920;
    mainProfile.height = 1080;
    mainProfile.bitrateKbps = 4096;
    mainProfile.h264Profile = "Main";
    mainProfile.streamPath = "/Streaming/Channels/101";

    FakeMediaProfile subProfile = mainProfile;
    subProfile.token = "Profile_2";
    subProfile.name = "subStream";
    subProfile.width = 640;
    subProfile.height = 360;
    subProfile.bitrateKbps = 256;
    subProfile.streamPath = "/Streaming/Channels/102";

    camera.profiles = {mainProfile, subProfile};
    camera.rtspStreams = {
        {"/Streaming/Channels/101", sdp::kMainStream},
        {"/Streaming/Channels/102", sdp::kSubStream}};
    return camera;
}

FakeCamera makeRtspCamera()
{
    FakeCamera camera;
    camera.openPorts = {554};
    camera.hardwareAddress = QString("44:19:B6:AB:CD:EF");
    camera.rtspStreams = {
        {"/Streaming/Channels/101", sdp::kMainStream},
        {"/Streaming/Channels/102", sdp::kSubStream}};
    return camera;
}

} // namespace test
} // namespace discovery
} // namespace cctv
