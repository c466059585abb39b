#include "suntrack/gateway.h"

#include <exception>
#include <iostream>
#include <utility>

namespace suntrack {

TelemetryGateway::TelemetryGateway(GatewayConfig config, std::shared_ptr<EventSink> sink)
    : m_config(std::move(config)),
      m_dispatcher(m_config.dispatcher),
      m_tracker(m_config.session),
      m_sink(std::move(sink)),
      m_reports(m_config.reportHistoryCapacity),
      m_events(m_config.eventHistoryCapacity) {}

DecodedReport TelemetryGateway::ProcessFrame(const uint8_t* data, std::size_t length,
                                             WallClock::time_point now) {
    // Decoding is stateless; keep it outside the lock
    DecodedReport report = m_dispatcher.Dispatch(data, length);

    std::vector<BeaconScanEvent> events;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        CountReport(report);
        if (m_reports.Append(ReportRecord{now, report})) {
            ++m_metrics.reportsEvicted;
        }

        events = m_tracker.Apply(m_session, report, now);
        for (const auto& event : events) {
            if (m_events.Append(event)) {
                ++m_metrics.eventsEvicted;
            }
        }
        m_metrics.eventsEmitted += events.size();
    }

    ForwardToSink(events);
    return report;
}

void TelemetryGateway::CountReport(const DecodedReport& report) {
    ++m_metrics.framesReceived;
    if (std::holds_alternative<StatusReport>(report)) {
        ++m_metrics.statusReports;
    } else if (std::holds_alternative<BeaconScanReport>(report)) {
        ++m_metrics.beaconScanReports;
    } else if (std::holds_alternative<ParseError>(report)) {
        ++m_metrics.parseErrors;
    } else {
        ++m_metrics.unknownHeaders;
    }
}

void TelemetryGateway::ForwardToSink(const std::vector<BeaconScanEvent>& events) {
    if (!m_sink) {
        return;
    }
    for (const auto& event : events) {
        try {
            m_sink->Write(event);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_metrics.sinkFailures;
            }
            std::cerr << "[Gateway] event sink failed for " << event.macId << ": " << e.what() << std::endl;
        }
    }
}

std::vector<ReportRecord> TelemetryGateway::SnapshotReports() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reports.Snapshot();
}

std::vector<BeaconScanEvent> TelemetryGateway::SnapshotEvents() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.Snapshot();
}

DeviceSessionState TelemetryGateway::CurrentSessionState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session;
}

GatewayMetrics TelemetryGateway::GetMetrics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_metrics;
}

} // namespace suntrack
