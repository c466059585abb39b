#include "suntrack/report.h"

#include <algorithm>

namespace suntrack {

const char* ToString(DecodeError error) {
    switch (error) {
        case DecodeError::None: return "none";
        case DecodeError::EmptyFrame: return "empty_frame";
        case DecodeError::UnknownHeader: return "unknown_header";
        case DecodeError::TruncatedRequiredField: return "truncated_required_field";
        case DecodeError::InvalidSensorLayout: return "invalid_sensor_layout";
        case DecodeError::DecodeFailure: return "decode_failure";
    }
    return "decode_failure";
}

const char* ToString(IgnitionState state) {
    return state == IgnitionState::On ? "ON" : "OFF";
}

const char* ToString(MacEndianness endianness) {
    return endianness == MacEndianness::Little ? "little" : "big";
}

std::string GpsFix::FixStatusLabel() const {
    switch (fixStatus) {
        case FixStatus::NotFixed: return "Not Fixed";
        case FixStatus::Fixed: return "Fixed";
        case FixStatus::DeadReckoning: return "DR Activated";
        case FixStatus::Other: break;
    }
    return std::to_string(fixStatusRaw);
}

std::string DeviceStatus::DeviceModeLabel() const {
    switch (deviceModeRaw) {
        case 1: return "Driving";
        case 5: return "Deactivate Zone";
        default: return std::to_string(deviceModeRaw);
    }
}

bool BeaconScanReport::HasTargetMac() const {
    return std::any_of(sensors.begin(), sensors.end(),
                       [](const SensorSighting& sensor) { return sensor.isTarget; });
}

const Bytes& RawBytesOf(const DecodedReport& report) {
    return std::visit([](const auto& alternative) -> const Bytes& { return alternative.rawBytes; }, report);
}

std::string ReportKind(const DecodedReport& report) {
    if (std::holds_alternative<StatusReport>(report)) {
        return "STT (Status Report)";
    }
    if (std::holds_alternative<BeaconScanReport>(report)) {
        return "BDA/SNB (BLE Sensor Data Report)";
    }
    if (std::holds_alternative<ParseError>(report)) {
        return "Parse Error";
    }
    return "Unknown Header";
}

} // namespace suntrack
