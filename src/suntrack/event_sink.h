#pragma once

#include "suntrack/session_tracker.h"

namespace suntrack {

/**
 * @brief Interface for forwarding derived events to an external log.
 *
 * Called after the gateway has released its lock. A sink may throw
 * std::exception; the gateway counts and logs the failure and carries on.
 * Implementations must be safe to call from several connection workers.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    /**
     * @brief Record one event.
     * @param event Event already appended to the in-memory history
     */
    virtual void Write(const BeaconScanEvent& event) = 0;
};

} // namespace suntrack
