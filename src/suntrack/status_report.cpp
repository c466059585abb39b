#include "suntrack/status_report.h"

#include "suntrack/codec.h"

namespace suntrack {
namespace {

/// True when `length` holds `size` bytes starting at `offset`.
bool Fits(std::size_t length, std::size_t offset, std::size_t size) {
    return offset + size <= length;
}

FixStatus MapFixStatus(uint8_t raw) {
    switch (raw) {
        case 0: return FixStatus::NotFixed;
        case 1: return FixStatus::Fixed;
        case 3: return FixStatus::DeadReckoning;
        default: return FixStatus::Other;
    }
}

} // namespace

std::optional<uint16_t> ValidateInputVoltage(uint16_t millivolts) {
    if (millivolts < kMinInputVoltageMv || millivolts > kMaxInputVoltageMv) {
        return std::nullopt;
    }
    return millivolts;
}

StatusDecodeResult DecodeStatusReport(const uint8_t* data, std::size_t length) {
    StatusDecodeResult result{};

    if (!data || length < kStatusMinimumLength) {
        result.error = DecodeError::TruncatedRequiredField;
        result.reason = "STT message too short: " + std::to_string(length) +
                        " bytes (expected at least " + std::to_string(kStatusMinimumLength) + ")";
        return result;
    }

    StatusReport report;
    const FramePrefix prefix = DecodeFramePrefix(data);
    report.header = prefix.header;
    report.packetLength = prefix.packetLength;
    report.deviceId = prefix.deviceId;
    report.reportMap = prefix.reportMap;
    report.model = prefix.model;
    report.softwareVersion = prefix.softwareVersion;
    report.messageType = data[kStatusMessageTypeIndex];

    // Time/date and cellular
    if (Fits(length, kStatusDateIndex, kDateSize)) {
        report.gpsDate = DecodeDate(&data[kStatusDateIndex], kDateSize);
    }
    if (Fits(length, kStatusTimeIndex, kTimeSize)) {
        report.gpsTime = DecodeTime(&data[kStatusTimeIndex], kTimeSize);
    }
    if (Fits(length, kStatusCellIdIndex, 4)) {
        report.cellular.cellId = detail::LoadU32(&data[kStatusCellIdIndex]);
    }
    if (Fits(length, kStatusMccIndex, 2)) {
        report.cellular.mcc = static_cast<uint32_t>(DecodeBcd(&data[kStatusMccIndex], 2));
    }
    if (Fits(length, kStatusMncIndex, 2)) {
        report.cellular.mnc = static_cast<uint32_t>(DecodeBcd(&data[kStatusMncIndex], 2));
    }
    if (Fits(length, kStatusLacIndex, 2)) {
        report.cellular.lac = detail::LoadU16(&data[kStatusLacIndex]);
    }
    if (Fits(length, kStatusRxLevelIndex, 1)) {
        report.cellular.rxLevel = data[kStatusRxLevelIndex];
    }

    // GPS
    if (Fits(length, kStatusLatitudeIndex, kCoordinateSize)) {
        report.gps.latitude = DecodeCoordinate(&data[kStatusLatitudeIndex]);
    }
    if (Fits(length, kStatusLongitudeIndex, kCoordinateSize)) {
        report.gps.longitude = DecodeCoordinate(&data[kStatusLongitudeIndex]);
        report.positionPresent = true;
    }
    if (Fits(length, kStatusSpeedIndex, 2)) {
        report.gps.speedKmh = DecodeHundredths(&data[kStatusSpeedIndex]);
    }
    if (Fits(length, kStatusCourseIndex, 2)) {
        report.gps.courseDeg = DecodeHundredths(&data[kStatusCourseIndex]);
    }
    if (Fits(length, kStatusSatellitesIndex, 1)) {
        report.gps.satellites = data[kStatusSatellitesIndex];
    }
    if (Fits(length, kStatusFixIndex, 1)) {
        report.gps.fixStatusRaw = data[kStatusFixIndex];
        report.gps.fixStatus = MapFixStatus(report.gps.fixStatusRaw);
    }

    // Status
    if (Fits(length, kStatusInputStateIndex, 1)) {
        report.status.inputState = data[kStatusInputStateIndex];
        report.status.ignition = (report.status.inputState & kInputIgnitionBit) ? IgnitionState::On
                                                                                : IgnitionState::Off;
    }
    if (Fits(length, kStatusOutputStateIndex, 1)) {
        report.status.outputState = data[kStatusOutputStateIndex];
    }
    if (Fits(length, kStatusModeIndex, 1)) {
        report.status.deviceModeRaw = data[kStatusModeIndex];
    }
    if (Fits(length, kStatusReportTypeIndex, 1)) {
        report.status.reportTypeId = data[kStatusReportTypeIndex];
    }
    if (Fits(length, kStatusMessageNumberIndex, 2)) {
        report.status.messageNumber = detail::LoadU16(&data[kStatusMessageNumberIndex]);
    }
    if (Fits(length, kStatusReservedIndex, 1)) {
        report.reserved = data[kStatusReservedIndex];
    }
    if (Fits(length, kStatusAssignMapIndex, 4)) {
        report.assignMap = detail::LoadU32(&data[kStatusAssignMapIndex]);
    }

    if (length >= kStatusFullLength) {
        report.rawTrailingDataLength = length - kStatusFullLength;
        if ((report.assignMap & kAssignInputVoltage) && Fits(length, kStatusFullLength, 2)) {
            report.inputVoltageMv = ValidateInputVoltage(detail::LoadU16(&data[kStatusFullLength]));
        }
    }

    report.rawBytes.assign(data, data + length);
    result.report = std::move(report);
    return result;
}

} // namespace suntrack
