#include "stream_compliance_analyzer.h"

namespace cctv {
namespace discovery {

namespace {

static const QString kH264 = QStringLiteral("H.264");

} // namespace

StreamComplianceAnalyzer::StreamComplianceAnalyzer(CompliancePolicy policy):
    m_policy(std::move(policy))
{
}

QStringList StreamComplianceAnalyzer::findIssues(const RtspStream& stream) const
{
    QStringList issues;

    if (stream.codec.isEmpty())
        issues.append(QStringLiteral("Codec unknown"));
    else if (!m_policy.acceptedCodecs.contains(stream.codec, Qt::CaseInsensitive))
        issues.append(QString("Codec %1 not accepted").arg(stream.codec));

    int width = 0;
    int height = 0;
    const bool hasResolution = parseResolution(stream.resolution, &width, &height);
    if (!hasResolution)
    {
        issues.append(stream.resolution.isEmpty()
            ? QStringLiteral("Resolution unknown")
            : QString("Resolution %1 malformed").arg(stream.resolution));
    }

    if (stream.bitrateKbps
        && (*stream.bitrateKbps < m_policy.minBitrateKbps
            || *stream.bitrateKbps > m_policy.maxBitrateKbps))
    {
        issues.append(QString("Bitrate %1 kbps outside %2-%3 kbps")
            .arg(*stream.bitrateKbps).arg(m_policy.minBitrateKbps).arg(m_policy.maxBitrateKbps));
    }

    if (!stream.profile.isEmpty()
        && !m_policy.recognizedProfiles.contains(stream.profile, Qt::CaseInsensitive))
    {
        issues.append(QString("Profile %1 not recognized").arg(stream.profile));
    }

    if (m_policy.flagHighProfile && isHighProfile(stream.profile))
        issues.append(QStringLiteral("High profile (requires transcoding for browser HLS)"));

    if (stream.isSubStream())
    {
        if (hasResolution
            && (height < m_policy.subStreamMinHeight || height > m_policy.subStreamMaxHeight))
        {
            issues.append(QString("Resolution not in %1p-%2p range")
                .arg(m_policy.subStreamMinHeight).arg(m_policy.subStreamMaxHeight));
        }

        if (!stream.codec.isEmpty() && !stream.codec.contains(kH264))
            issues.append(QStringLiteral("Codec is not H.264"));

        if (stream.bitrateKbps && *stream.bitrateKbps >= m_policy.subStreamMaxBitrateKbps)
            issues.append(QString("Bitrate >= %1kbps").arg(m_policy.subStreamMaxBitrateKbps));
    }

    return issues;
}

void StreamComplianceAnalyzer::analyze(RtspStream* stream) const
{
    const QStringList issues = findIssues(*stream);
    stream->compliant = issues.isEmpty();
    if (issues.isEmpty())
        stream->complianceIssues = boost::none;
    else
        stream->complianceIssues = issues.join(QStringLiteral(", "));
}

bool StreamComplianceAnalyzer::parseResolution(
    const QString& resolution, int* width, int* height)
{
    const QStringList parts = resolution.trimmed().split(
        QLatin1Char('x'), QString::KeepEmptyParts, Qt::CaseInsensitive);
    if (parts.size() != 2)
        return false;

    bool widthOk = false;
    bool heightOk = false;
    const int parsedWidth = parts[0].toInt(&widthOk);
    const int parsedHeight = parts[1].toInt(&heightOk);
    if (!widthOk || !heightOk || parsedWidth <= 0 || parsedHeight <= 0)
        return false;

    *width = parsedWidth;
    *height = parsedHeight;
    return true;
}

bool StreamComplianceAnalyzer::isHighProfile(const QString& profile)
{
    return profile.startsWith(QLatin1String("High"), Qt::CaseInsensitive);
}

} // namespace discovery
} // namespace cctv
