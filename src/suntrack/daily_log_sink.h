#pragma once

#include "suntrack/event_sink.h"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace suntrack {

/**
 * @brief Configuration for the daily JSON-lines event log.
 */
struct DailyLogSinkConfig {
    std::string directory{"logs"};
    std::string filePrefix{"beacon_scans"};
};

/**
 * @brief Appends each event as one JSON line to <directory>/<prefix>_YYYY-MM-DD.jsonl.
 *
 * The file name follows the local calendar day of the event timestamp; a new
 * file is opened when the day changes. Failures to open or write are logged
 * (throttled) and reported to the caller as std::runtime_error.
 *
 * Thread-safe.
 */
class DailyLogSink : public EventSink {
public:
    explicit DailyLogSink(DailyLogSinkConfig config = {});
    ~DailyLogSink() override;

    void Write(const BeaconScanEvent& event) override;

    /// Path the sink would use for an event at `time`
    std::string PathFor(WallClock::time_point time) const;

    uint64_t LinesWritten() const;

private:
    void OpenForDay(const std::string& day);
    /// `withErrno` is false for stream failures, which leave errno unspecified
    void LogError(const std::string& message, bool withErrno = true);

    DailyLogSinkConfig m_config;
    mutable std::mutex m_mutex;
    std::ofstream m_file;
    std::string m_currentDay;
    uint64_t m_linesWritten{0};
    std::chrono::steady_clock::time_point m_lastErrorLog{};
};

} // namespace suntrack
