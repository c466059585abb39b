#include "suntrack/report_json.h"

#include "suntrack/codec.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace suntrack {
namespace {

using nlohmann::json;

std::string FormatFixed(double value, int precision) {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}

std::tm LocalTime(WallClock::time_point time) {
    const std::time_t seconds = WallClock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);
    return local;
}

template<typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json HeaderJson(uint8_t header, const char* ackNote) {
    return "0x" + FormatHexValue(header, 2) + " (" + ackNote + ")";
}

json GpsJson(const GpsFix& gps) {
    return json{
        {"latitude", FormatFixed(gps.latitude, 6)},
        {"longitude", FormatFixed(gps.longitude, 6)},
        {"speed_kmh", FormatFixed(gps.speedKmh, 2)},
        {"course_deg", FormatFixed(gps.courseDeg, 2)},
        {"satellites", gps.satellites},
        {"fix_status", gps.FixStatusLabel()},
    };
}

json StatusJson(const StatusReport& report) {
    json out{
        {"report_type", "STT (Status Report)"},
        {"header", HeaderJson(report.header, "No ACK required")},
        {"device_id_esn", report.deviceId},
        {"packet_length", report.packetLength},
        {"report_map", "0x" + FormatHexValue(report.reportMap, 6)},
        {"model_id", report.model},
        {"software_version", report.softwareVersion},
        {"message_type", report.messageType == 1 ? "Real Time" : "Stored"},
        {"timestamp_gps", report.gpsDate + " " + report.gpsTime},
        {"gps", GpsJson(report.gps)},
        {"cellular", {
            {"mcc", report.cellular.mcc},
            {"mnc", report.cellular.mnc},
            {"lac", FormatHexValue(report.cellular.lac, 4)},
            {"rx_level_rssi", report.cellular.rxLevel},
            {"cell_id", FormatHexValue(report.cellular.cellId, 8)},
        }},
        {"status", {
            {"input_state_hex", "0x" + FormatHexValue(report.status.inputState, 2)},
            {"output_state_hex", "0x" + FormatHexValue(report.status.outputState, 2)},
            {"device_mode", report.status.DeviceModeLabel()},
            {"report_type_id", report.status.reportTypeId},
            {"message_number", report.status.messageNumber},
        }},
        {"assign_map_custom_headers", "0x" + FormatHexValue(report.assignMap, 8)},
        {"input_voltage_mv", OptionalToJson(report.inputVoltageMv)},
        {"raw_trailing_data_length", report.rawTrailingDataLength},
    };
    out["status"]["ignition"] = report.status.ignition ? json(ToString(*report.status.ignition)) : json(nullptr);
    return out;
}

json SensorJson(const SensorSighting& sensor) {
    json out{
        {"mac_address", sensor.macAddress},
        {"mac_endianness_used", ToString(sensor.macEndianness)},
        {"rssi", nullptr},
        {"is_target_mac", sensor.isTarget},
        {"byte_position", OptionalToJson(sensor.bytePosition)},
        {"battery_level", OptionalToJson(sensor.batteryLevel)},
    };
    if (sensor.rssi) {
        out["rssi"] = static_cast<int>(*sensor.rssi);
        out["rssi_hex"] = "0x" + FormatHexValue(static_cast<uint8_t>(*sensor.rssi), 2);
    }
    if (!sensor.rawPayload.empty()) {
        out["raw_payload"] = ToHex(sensor.rawPayload.data(), sensor.rawPayload.size());
    }
    return out;
}

json BeaconScanJson(const BeaconScanReport& report) {
    json sensors = json::array();
    for (const auto& sensor : report.sensors) {
        sensors.push_back(SensorJson(sensor));
    }

    json out{
        {"report_type", "BDA/SNB (BLE Sensor Data Report)"},
        {"header", HeaderJson(report.header, report.RequiresAck() ? "ACK required" : "No ACK required")},
        {"device_id_esn", report.deviceId},
        {"packet_length", report.packetLength},
        {"report_map", "0x" + FormatHexValue(report.reportMap, 6)},
        {"model_id", report.model},
        {"software_version", report.softwareVersion},
        {"ble_scan_status", report.scanStatus == 1 ? "Scan Performed" : "No Scan"},
        {"total_reports_expected", report.totalReportsExpected},
        {"current_report_number", report.currentReportNumber},
        {"scanned_sensor_count", report.expectedSensorCount},
        {"location_scan_start", "not available"},
        {"raw_data_start_index", report.rawDataStartIndex},
        {"remaining_payload_bytes", report.RemainingPayloadBytes()},
        {"sensors", std::move(sensors)},
        {"sensors_parsed", report.SensorsParsed()},
        {"has_target_mac", report.HasTargetMac()},
        {"sensor_layout", ToString(report.sensorLayout)},
    };
    if (report.scanDate && report.scanTime) {
        out["timestamp_gps"] = *report.scanDate + " " + *report.scanTime;
    }
    if (report.scanLocation) {
        out["location_scan_start"] = {
            {"latitude", FormatFixed(report.scanLocation->latitude, 6)},
            {"longitude", FormatFixed(report.scanLocation->longitude, 6)},
        };
    }
    return out;
}

} // namespace

std::string FormatIsoTimestamp(WallClock::time_point time) {
    const std::tm local = LocalTime(time);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                            time.time_since_epoch()).count() % 1000000;
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld",
                  local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
                  local.tm_hour, local.tm_min, local.tm_sec,
                  static_cast<long long>(micros < 0 ? micros + 1000000 : micros));
    return buffer;
}

std::string FormatCalendarDay(WallClock::time_point time) {
    const std::tm local = LocalTime(time);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d",
                  local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
    return buffer;
}

json ToJson(const DecodedReport& report) {
    if (const auto* status = std::get_if<StatusReport>(&report)) {
        return StatusJson(*status);
    }
    if (const auto* scan = std::get_if<BeaconScanReport>(&report)) {
        return BeaconScanJson(*scan);
    }
    const Bytes& raw = RawBytesOf(report);
    if (const auto* error = std::get_if<ParseError>(&report)) {
        return json{
            {"error", error->reason},
            {"error_code", ToString(error->error)},
            {"raw_data", ToHex(raw.data(), raw.size())},
            {"data_length", error->byteLength},
        };
    }
    const auto& unknown = std::get<UnknownHeader>(report);
    return json{
        {"error", unknown.note},
        {"error_code", ToString(DecodeError::UnknownHeader)},
        {"header", "0x" + FormatHexValue(unknown.headerByte, 2)},
        {"raw_data", ToHex(raw.data(), raw.size())},
    };
}

json ToJson(const ReportRecord& record) {
    json out = ToJson(record.report);
    out["timestamp"] = FormatIsoTimestamp(record.receivedAt);
    return out;
}

json ToJson(const BeaconScanEvent& event) {
    json out{
        {"timestamp", FormatIsoTimestamp(event.timestamp)},
        {"mac_id", event.macId},
        {"ignition_status", ToString(event.ignitionStatus)},
        {"latitude", OptionalToJson(event.latitude)},
        {"longitude", OptionalToJson(event.longitude)},
        {"frequency_seconds", OptionalToJson(event.frequencySeconds)},
        {"input_voltage_mv", OptionalToJson(event.inputVoltageMv)},
        {"sensor_count_in_message", event.sensorCountInMessage},
        {"rssi", event.rssi ? json(static_cast<int>(*event.rssi)) : json(nullptr)},
        {"battery_level", OptionalToJson(event.batteryLevel)},
    };
    if (event.isIgnitionChange) {
        out["is_ignition_change"] = true;
        out["previous_status"] = event.previousStatus ? json(ToString(*event.previousStatus)) : json(nullptr);
        out["new_status"] = event.newStatus ? json(ToString(*event.newStatus)) : json(nullptr);
    }
    return out;
}

json ToJson(const DeviceSessionState& state) {
    json lastSeen = json::object();
    for (const auto& entry : state.lastSeen) {
        lastSeen[entry.first] = FormatIsoTimestamp(entry.second);
    }
    return json{
        {"current_ignition_status", ToString(state.currentIgnition)},
        {"previous_ignition_status",
         state.previousIgnition ? json(ToString(*state.previousIgnition)) : json(nullptr)},
        {"current_latitude", OptionalToJson(state.latitude)},
        {"current_longitude", OptionalToJson(state.longitude)},
        {"current_input_voltage_mv", OptionalToJson(state.inputVoltageMv)},
        {"last_seen", std::move(lastSeen)},
    };
}

} // namespace suntrack
