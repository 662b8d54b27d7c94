#pragma once

#include <map>
#include <set>
#include <vector>

#include <boost/optional.hpp>

#include <QtCore/QMutex>
#include <QtCore/QStringList>

#include <cctv/network/auth/credential.h>
#include <cctv/network/hardware_address_resolver.h>
#include <cctv/network/http/transport.h>
#include <cctv/network/port_probe.h>

namespace cctv {
namespace discovery {
namespace test {

struct FakeMediaProfile
{
    QString token;
    QString name;
    QString encoding;
    int width = 0;
    int height = 0;
    int bitrateKbps = 0;
    QString h264Profile;
    QString streamPath; //< Path on RTSP port 554 returned by GetStreamUri.
};

/**
 * Camera reachable through FakeCameraNetwork. Every service requires Basic authentication with
 * credential unless requiresAuthentication is false.
 */
struct FakeCamera
{
    std::set<int> openPorts;
    boost::optional<QString> hardwareAddress;
    bool responding = true; //< false: ports accept connections but requests time out.
    bool onvif = false; //< Device and media services on every open HTTP port.
    bool requiresAuthentication = true;
    bool offerDigestChallenge = false; //< Digest is offered but never accepted.
    network::auth::Credential credential{"admin", "12345"};

    QString manufacturer = "HIKVISION";
    QString model = "DS-2CD2043G0-I";
    QString serialNumber = "DS-2CD2043G0-I20170101AAWR123456789";
    QString firmwareVersion = "V5.5.0 build 170725";
    QStringList videoSources{"VideoSource_1"};
    std::vector<FakeMediaProfile> profiles;

    std::map<QString, QByteArray> rtspStreams; //< Path with query to SDP.
};

/**
 * Port probe, ARP table and device services of a set of fake cameras. Thread-safe.
 */
class FakeCameraNetwork:
    public network::AbstractPortProbe,
    public network::AbstractHardwareAddressResolver,
    public network::http::AbstractTransport
{
public:
    void addCamera(const QString& address, FakeCamera camera);

    virtual bool isOpen(
        const QString& address,
        quint16 port,
        std::chrono::milliseconds timeout) override;

    virtual boost::optional<QString> resolve(const QString& address) override;

    virtual boost::optional<network::http::Response> send(
        const QUrl& url, const network::http::Request& request) override;

    int requestCount() const;

    /**
     * URLs of requests sent to address, in order.
     */
    QStringList requestedUrls(const QString& address) const;

    /**
     * "Basic", "Digest" and "WS-Security" as seen in requests to any camera.
     */
    std::set<QString> authenticationSchemes() const;

    static QByteArray soapResponse(const QByteArray& body);

private:
    network::http::Response onvifResponse(
        const QString& address, const FakeCamera& camera, const QByteArray& body) const;
    network::http::Response rtspResponse(const FakeCamera& camera, const QUrl& url) const;

private:
    mutable QMutex m_mutex;
    std::map<QString, FakeCamera> m_cameras;
    std::map<QString, QStringList> m_requestedUrls;
    std::set<QString> m_authenticationSchemes;
    int m_requestCount = 0;
};

//-------------------------------------------------------------------------------------------------

namespace sdp {

/** H.264 Main 1920x1080, 4096 kbps, 25 fps. */
extern const char* const kMainStream;

/** H.264 Main 640x360, 256 kbps. */
extern const char* const kSubStream;

/** MJPEG 1280x720. */
extern const char* const kMjpegStream;

} // namespace sdp

FakeCamera makeOnvifCamera();

/**
 * Hikvision-style RTSP paths /Streaming/Channels/101 and 102, no ONVIF.
 */
FakeCamera makeRtspCamera();

} // namespace test
} // namespace discovery
} // namespace cctv
