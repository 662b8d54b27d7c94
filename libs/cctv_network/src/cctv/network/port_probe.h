#pragma once

#include <chrono>

#include <QtCore/QString>

namespace cctv {
namespace network {

class AbstractPortProbe
{
public:
    virtual ~AbstractPortProbe() = default;

    /**
     * @return true only if a TCP connection was established within timeout.
     * Never throws: any failure is reported as closed.
     */
    virtual bool isOpen(
        const QString& address,
        quint16 port,
        std::chrono::milliseconds timeout) = 0;
};

class TcpPortProbe:
    public AbstractPortProbe
{
public:
    virtual bool isOpen(
        const QString& address,
        quint16 port,
        std::chrono::milliseconds timeout) override;
};

} // namespace network
} // namespace cctv
