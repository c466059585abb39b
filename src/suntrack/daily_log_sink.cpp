#include "suntrack/daily_log_sink.h"

#include "suntrack/report_json.h"

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>
#include <utility>

namespace suntrack {

namespace {
/// @brief Minimum interval between error log messages to prevent spam.
constexpr auto kLogThrottle = std::chrono::seconds(1);
} // namespace

DailyLogSink::DailyLogSink(DailyLogSinkConfig config)
    : m_config(std::move(config)) {}

DailyLogSink::~DailyLogSink() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

std::string DailyLogSink::PathFor(WallClock::time_point time) const {
    return m_config.directory + "/" + m_config.filePrefix + "_" + FormatCalendarDay(time) + ".jsonl";
}

uint64_t DailyLogSink::LinesWritten() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_linesWritten;
}

void DailyLogSink::Write(const BeaconScanEvent& event) {
    const std::string line = ToJson(event).dump();
    const std::string day = FormatCalendarDay(event.timestamp);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.is_open() || day != m_currentDay) {
        OpenForDay(day);
    }

    m_file << line << '\n';
    m_file.flush();
    if (!m_file) {
        LogError("write failed to " + PathFor(event.timestamp), false);
        m_file.close();
        m_currentDay.clear();
        throw std::runtime_error("event log write failed");
    }
    ++m_linesWritten;
}

/**
 * @brief Close the current file and open the one for `day` in append mode.
 *
 * Creates the log directory if missing (one level). Throws on failure.
 * Caller holds m_mutex.
 */
void DailyLogSink::OpenForDay(const std::string& day) {
    if (m_file.is_open()) {
        m_file.close();
    }
    m_currentDay.clear();

    if (::mkdir(m_config.directory.c_str(), 0755) < 0 && errno != EEXIST) {
        LogError("mkdir " + m_config.directory);
        throw std::runtime_error("cannot create log directory " + m_config.directory);
    }

    const std::string path = m_config.directory + "/" + m_config.filePrefix + "_" + day + ".jsonl";
    m_file.clear();
    m_file.open(path, std::ios::out | std::ios::app);
    if (!m_file.is_open()) {
        LogError("open " + path);
        throw std::runtime_error("cannot open event log " + path);
    }
    m_currentDay = day;
}

void DailyLogSink::LogError(const std::string& message, bool withErrno) {
    const int savedErrno = errno;
    const auto now = std::chrono::steady_clock::now();
    if (now - m_lastErrorLog < kLogThrottle) {
        return;
    }
    m_lastErrorLog = now;
    std::cerr << "[EventLog] error: " << message;
    if (withErrno) {
        std::cerr << " errno=" << savedErrno;
    }
    std::cerr << std::endl;
}

} // namespace suntrack
