#pragma once

#include <chrono>

#include <boost/optional.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace cctv {
namespace network {

class AbstractHardwareAddressResolver
{
public:
    virtual ~AbstractHardwareAddressResolver() = default;

    /**
     * @return Canonical "XX:XX:XX:XX:XX:XX" or boost::none if unknown.
     * Never throws.
     */
    virtual boost::optional<QString> resolve(const QString& address) = 0;
};

/**
 * Reads the OS neighbor (ARP) table with the platform arp utility.
 */
class NeighborTableResolver:
    public AbstractHardwareAddressResolver
{
public:
    explicit NeighborTableResolver(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

    virtual boost::optional<QString> resolve(const QString& address) override;

    /**
     * Scans command output: the first line mentioning address that holds a MAC-shaped token wins.
     */
    static boost::optional<QString> extractMac(const QString& output, const QString& address);

    /**
     * Runs program with one deadline covering both start and completion. A program still
     * running at the deadline is killed.
     * @return Combined stdout and stderr, or boost::none on failure or timeout.
     */
    static boost::optional<QByteArray> runCommand(
        const QString& program,
        const QStringList& arguments,
        std::chrono::milliseconds timeout);

    /**
     * @return false if the neighbor table cannot be queried on this platform.
     */
    static bool neighborTableCommand(
        const QString& address, QString* program, QStringList* arguments);

private:
    std::chrono::milliseconds m_timeout;
};

} // namespace network
} // namespace cctv
