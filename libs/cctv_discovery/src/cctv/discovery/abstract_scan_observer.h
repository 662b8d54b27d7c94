#pragma once

#include "device.h"

namespace cctv {
namespace discovery {

/**
 * Receives scan results. Called from worker threads, calls are serialized by the session.
 */
class AbstractScanObserver
{
public:
    virtual ~AbstractScanObserver() = default;

    /**
     * @param device Snapshot of the record after its run ended.
     */
    virtual void deviceUpdated(const Device& device) = 0;

    virtual void progressChanged(int done, int total) = 0;

    virtual void scanFinished() = 0;
};

} // namespace discovery
} // namespace cctv
