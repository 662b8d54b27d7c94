#pragma once

#include <QtCore/QStringList>

#include "rtsp_stream.h"
#include "scan_settings.h"

namespace cctv {
namespace discovery {

class StreamComplianceAnalyzer
{
public:
    explicit StreamComplianceAnalyzer(CompliancePolicy policy = CompliancePolicy());

    QStringList findIssues(const RtspStream& stream) const;

    /**
     * Sets compliant and complianceIssues of stream from findIssues().
     */
    void analyze(RtspStream* stream) const;

    const CompliancePolicy& policy() const { return m_policy; }

    /**
     * "WxH" with positive integers.
     */
    static bool parseResolution(const QString& resolution, int* width, int* height);

    static bool isHighProfile(const QString& profile);

private:
    CompliancePolicy m_policy;
};

} // namespace discovery
} // namespace cctv
