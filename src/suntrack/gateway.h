#pragma once

#include "suntrack/dispatcher.h"
#include "suntrack/event_sink.h"
#include "suntrack/history_store.h"
#include "suntrack/report.h"
#include "suntrack/session_tracker.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace suntrack {

struct GatewayConfig {
    FrameDispatcherConfig dispatcher{};
    SessionTrackerConfig session{};
    std::size_t reportHistoryCapacity{kReportHistoryCapacity};
    std::size_t eventHistoryCapacity{kEventHistoryCapacity};
};

/**
 * @brief Gateway counters, read as one consistent copy.
 */
struct GatewayMetrics {
    uint64_t framesReceived{0};
    uint64_t statusReports{0};
    uint64_t beaconScanReports{0};
    uint64_t parseErrors{0};
    uint64_t unknownHeaders{0};
    uint64_t eventsEmitted{0};
    uint64_t sinkFailures{0};
    uint64_t reportsEvicted{0};
    uint64_t eventsEvicted{0};
};

/**
 * @brief Shared ingestion core behind every connection.
 *
 * Decodes a frame, records it, applies it to the session state and stores
 * the derived events. The record append, the session update and the event
 * append for one frame happen under a single lock, so a concurrent reader
 * never sees the report without its events (or the reverse).
 *
 * Events are forwarded to the optional EventSink after the lock is released.
 *
 * Thread-safe: ProcessFrame may be called from any number of connection
 * workers.
 */
class TelemetryGateway {
public:
    explicit TelemetryGateway(GatewayConfig config = {}, std::shared_ptr<EventSink> sink = nullptr);

    /**
     * @brief Decode and ingest one frame.
     * @param data Frame bytes (one socket read)
     * @param length Number of bytes
     * @param now Receive time
     * @return The decoded report (also appended to the report history)
     */
    DecodedReport ProcessFrame(const uint8_t* data, std::size_t length,
                               WallClock::time_point now = WallClock::now());

    std::vector<ReportRecord> SnapshotReports() const;
    std::vector<BeaconScanEvent> SnapshotEvents() const;
    DeviceSessionState CurrentSessionState() const;
    GatewayMetrics GetMetrics() const;

    const FrameDispatcher& Dispatcher() const { return m_dispatcher; }

private:
    void CountReport(const DecodedReport& report);
    void ForwardToSink(const std::vector<BeaconScanEvent>& events);

    GatewayConfig m_config;
    FrameDispatcher m_dispatcher;
    SessionTracker m_tracker;
    std::shared_ptr<EventSink> m_sink;

    mutable std::mutex m_mutex; // Guards everything below
    BoundedHistory<ReportRecord> m_reports;
    BoundedHistory<BeaconScanEvent> m_events;
    DeviceSessionState m_session;
    GatewayMetrics m_metrics{};
};

} // namespace suntrack
