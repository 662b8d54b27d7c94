#include "hardware_address_resolver.h"

#include <algorithm>

#include <QtCore/QElapsedTimer>
#include <QtCore/QProcess>
#include <QtCore/QRegularExpression>

#include <cctv/utils/log/log.h>

#include "mac_address.h"

namespace cctv {
namespace network {

NeighborTableResolver::NeighborTableResolver(std::chrono::milliseconds timeout):
    m_timeout(timeout)
{
}

boost::optional<QString> NeighborTableResolver::resolve(const QString& address)
{
    QString program;
    QStringList arguments;
    if (!neighborTableCommand(address, &program, &arguments))
        return boost::none;

    const auto output = runCommand(program, arguments, m_timeout);
    if (!output)
        return boost::none;

    const auto mac = extractMac(QString::fromLocal8Bit(*output), address);
    CCTV_VERBOSE(this, lm("Hardware address of %1: %2").args(
        address, mac ? *mac : QString("unknown")));
    return mac;
}

boost::optional<QByteArray> NeighborTableResolver::runCommand(
    const QString& program, const QStringList& arguments, std::chrono::milliseconds timeout)
{
    static const char* const kTag = "NeighborTableResolver";

    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, arguments);
    if (!process.waitForStarted(static_cast<int>(timeout.count())))
    {
        CCTV_DEBUG(kTag, lm("Could not start %1: %2").args(program, process.errorString()));
        return boost::none;
    }

    const qint64 remainingMs = std::max<qint64>(0, timeout.count() - timer.elapsed());
    if (remainingMs == 0 || !process.waitForFinished(static_cast<int>(remainingMs)))
    {
        CCTV_DEBUG(kTag, lm("%1 %2 did not finish in %3 ms, killing")
            .args(program, arguments.join(' '), timeout.count()));
        process.kill();
        process.waitForFinished(-1);
        return boost::none;
    }

    return process.readAll();
}

boost::optional<QString> NeighborTableResolver::extractMac(
    const QString& output, const QString& address)
{
    const QRegularExpression addressPattern(
        QStringLiteral("(^|[^0-9.])%1($|[^0-9.])").arg(QRegularExpression::escape(address)));

    for (const QString& line: output.split(QRegularExpression("[\r\n]+"), QString::SkipEmptyParts))
    {
        if (!addressPattern.match(line).hasMatch())
            continue;

        if (const auto mac = findMac(line))
            return mac;
    }
    return boost::none;
}

bool NeighborTableResolver::neighborTableCommand(
    const QString& address, QString* program, QStringList* arguments)
{
    #if defined(Q_OS_WIN)
        *program = QStringLiteral("arp");
        *arguments = QStringList{QStringLiteral("-a"), address};
        return true;
    #elif defined(Q_OS_LINUX) || defined(Q_OS_MACOS) || defined(Q_OS_FREEBSD) \
        || defined(Q_OS_OPENBSD) || defined(Q_OS_NETBSD)
        *program = QStringLiteral("arp");
        *arguments = QStringList{QStringLiteral("-n"), address};
        return true;
    #else
        Q_UNUSED(address);
        Q_UNUSED(program);
        Q_UNUSED(arguments);
        return false;
    #endif
}

} // namespace network
} // namespace cctv
