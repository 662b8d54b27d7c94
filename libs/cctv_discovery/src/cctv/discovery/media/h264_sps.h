#pragma once

#include <boost/optional.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace cctv {
namespace discovery {
namespace media {

/**
 * Fields of an H.264 sequence parameter set needed to describe a stream.
 */
struct H264Sps
{
    int profileIdc = 0;
    int constraintFlags = 0;
    int levelIdc = 0;
    int width = 0; //< After cropping.
    int height = 0; //< After cropping.
    boost::optional<double> frameRate; //< From VUI timing info.

    /**
     * @param nalUnit SPS NAL unit including its header byte, without start code.
     * @throws BitStreamException
     */
    void decode(const QByteArray& nalUnit);

    QString profileName() const;
};

/**
 * "Baseline", "Main", "High", ... Baseline with constraint_set1_flag is "Constrained Baseline".
 * @return empty string for an unknown profile_idc.
 */
QString h264ProfileName(int profileIdc, int constraintFlags = 0);

QString hevcProfileName(int profileId);

} // namespace media
} // namespace discovery
} // namespace cctv
