#pragma once

#include <boost/optional.hpp>

#include <QtCore/QString>

namespace cctv {
namespace discovery {

struct RtspStream
{
    QString videoSourceName;
    QString channelName;
    QString streamName;
    QString url;
    QString resolution; //< "WxH".
    QString codec;
    QString profile;
    boost::optional<int> bitrateKbps;
    boost::optional<double> frameRate;
    bool compliant = true;
    boost::optional<QString> complianceIssues; //< Reasons joined with ", ".
    boost::optional<QString> sdpSessionName;

    bool isSubStream() const
    {
        return streamName.contains(QLatin1String("sub"), Qt::CaseInsensitive);
    }
};

} // namespace discovery
} // namespace cctv
