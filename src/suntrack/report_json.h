#pragma once

/**
 * @file report_json.h
 * @brief JSON rendering of reports, events and session state.
 *
 * Field names follow the tracker vendor's tooling (device_id_esn,
 * timestamp_gps, ...) so existing dashboards can read the output.
 */

#include "suntrack/report.h"
#include "suntrack/session_tracker.h"

#include <nlohmann/json.hpp>

#include <string>

namespace suntrack {

nlohmann::json ToJson(const DecodedReport& report);
nlohmann::json ToJson(const ReportRecord& record);
nlohmann::json ToJson(const BeaconScanEvent& event);
nlohmann::json ToJson(const DeviceSessionState& state);

/// ISO-8601 local time with microseconds ("2025-11-19T23:57:15.123456").
std::string FormatIsoTimestamp(WallClock::time_point time);

/// Local calendar day ("2025-11-19").
std::string FormatCalendarDay(WallClock::time_point time);

} // namespace suntrack
