#pragma once

#include <boost/optional.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace cctv {
namespace discovery {
namespace media {

/**
 * Video description extracted from an SDP document. Unknown fields are left empty.
 */
struct SdpVideoInfo
{
    boost::optional<QString> sessionName;
    QString codec; //< "H.264", "H.265", "MPEG-4", "MJPEG" or the raw encoding name.
    QString profile;
    int width = 0;
    int height = 0;
    boost::optional<int> bitrateKbps;
    boost::optional<double> frameRate;

    QString resolution() const;
};

/**
 * @return boost::none if the document has no "v=" line or no video media section.
 */
boost::optional<SdpVideoInfo> parseSdp(const QByteArray& sdp);

/**
 * Maps an rtpmap encoding name to the codec display name.
 */
QString codecFromEncodingName(const QByteArray& encodingName);

} // namespace media
} // namespace discovery
} // namespace cctv
