#pragma once

/**
 * @file report.h
 * @brief Decoded tracker report types.
 *
 * A DecodedReport is produced for every frame the dispatcher sees. Each
 * alternative keeps the raw frame bytes so a report can be re-analysed
 * later regardless of how far decoding got.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace suntrack {

/**
 * @defgroup HeaderBytes Frame Header Bytes
 * @brief Leading byte values and their meaning (fixed by the device vendor).
 * @{
 */

/** @brief Status report (STT). */
constexpr uint8_t kHeaderStatus = 0x81;

/** @brief Status report variant; decoded as STT when the layout fits. */
constexpr uint8_t kHeaderStatusVariant = 0x82;

/** @brief BLE sensor data report, no transport acknowledgment. */
constexpr uint8_t kHeaderBeaconScan = 0xAA;

/** @brief BLE sensor data report, acknowledgment expected. */
constexpr uint8_t kHeaderBeaconScanAck = 0xBA;

/** @} */ // end of HeaderBytes

using Bytes = std::vector<uint8_t>;
using WallClock = std::chrono::system_clock;

/**
 * @brief Error codes attached to frames that could not be fully decoded.
 */
enum class DecodeError {
    None,                   ///< Frame decoded
    EmptyFrame,             ///< Zero-length read
    UnknownHeader,          ///< Leading byte not recognised
    TruncatedRequiredField, ///< Frame ends before the mandatory leading fields
    InvalidSensorLayout,    ///< Structured sensor list stopped early (degrade, not failure)
    DecodeFailure           ///< Any other decoder rejection
};

/// Short stable name for an error code ("truncated_required_field").
const char* ToString(DecodeError error);

enum class FixStatus {
    NotFixed,
    Fixed,
    DeadReckoning,
    Other
};

enum class IgnitionState {
    Off,
    On
};

/// "ON" / "OFF"
const char* ToString(IgnitionState state);

enum class MacEndianness {
    Big,
    Little
};

/// "big" / "little"
const char* ToString(MacEndianness endianness);

/**
 * @brief GPS position block shared by status and beacon scan reports.
 */
struct GpsFix {
    double latitude{0.0};         ///< Decimal degrees, signed
    double longitude{0.0};        ///< Decimal degrees, signed
    double speedKmh{0.0};
    double courseDeg{0.0};
    uint8_t satellites{0};
    FixStatus fixStatus{FixStatus::NotFixed};
    uint8_t fixStatusRaw{0};      ///< Wire value, meaningful for FixStatus::Other

    /// "Not Fixed", "Fixed", "DR Activated" or the raw value.
    std::string FixStatusLabel() const;

    /// True when both coordinates are exactly zero (no position sentinel).
    bool IsZeroPosition() const { return latitude == 0.0 && longitude == 0.0; }
};

struct CellInfo {
    uint32_t cellId{0};
    uint32_t mcc{0};              ///< BCD decoded
    uint32_t mnc{0};              ///< BCD decoded
    uint16_t lac{0};
    uint8_t rxLevel{0};
};

struct DeviceStatus {
    uint8_t inputState{0};        ///< Bit 0 is the ignition input
    uint8_t outputState{0};
    uint8_t deviceModeRaw{0};
    uint8_t reportTypeId{0};
    uint16_t messageNumber{0};
    std::optional<IgnitionState> ignition; ///< Absent when the input-state byte was not received

    /// "Driving", "Deactivate Zone" or the raw value.
    std::string DeviceModeLabel() const;
};

/**
 * @brief Decoded STT status frame (headers 0x81 and 0x82).
 *
 * Fields past the message-type byte default to zero/placeholder values when
 * the frame is truncated.
 */
struct StatusReport {
    uint8_t header{kHeaderStatus};
    uint16_t packetLength{0};     ///< As transmitted, not validated
    uint64_t deviceId{0};
    uint32_t reportMap{0};        ///< 24-bit field bitmap
    uint8_t model{0};
    std::string softwareVersion;
    uint8_t messageType{0};       ///< 1 = real time, 0 = stored
    std::string gpsDate{"00000000"};
    std::string gpsTime{"00:00:00"};
    CellInfo cellular{};
    GpsFix gps{};
    bool positionPresent{false};  ///< Both coordinates fit in the frame
    DeviceStatus status{};
    uint8_t reserved{0};
    uint32_t assignMap{0};
    std::optional<uint16_t> inputVoltageMv; ///< Only inside the plausible supply band
    std::size_t rawTrailingDataLength{0};
    Bytes rawBytes;
};

/**
 * @brief One beacon observed in a scan report.
 */
struct SensorSighting {
    std::string macAddress;       ///< Canonical "AA:BB:CC:DD:EE:FF"
    MacEndianness macEndianness{MacEndianness::Big};
    std::optional<int8_t> rssi;   ///< dBm
    bool isTarget{false};
    std::optional<std::size_t> bytePosition; ///< Set for sightings found by the frame rescan
    Bytes rawPayload;             ///< Advertisement bytes from the structured list
    std::optional<uint8_t> batteryLevel; ///< Percent, from the advertisement payload
};

/**
 * @brief Decoded BLE sensor data frame (headers 0xAA and 0xBA).
 *
 * Invariant: no two entries of `sensors` share a macAddress.
 */
struct BeaconScanReport {
    uint8_t header{kHeaderBeaconScan};
    uint16_t packetLength{0};
    uint64_t deviceId{0};
    uint32_t reportMap{0};
    uint8_t model{0};
    std::string softwareVersion;
    uint8_t scanStatus{0};        ///< 1 = scan performed
    uint8_t totalReportsExpected{0};
    uint8_t currentReportNumber{0};
    uint16_t expectedSensorCount{0};
    std::optional<std::string> scanDate;
    std::optional<std::string> scanTime;
    std::optional<GpsFix> scanLocation; ///< Present only when date, time, latitude and longitude all fit
    std::size_t rawDataStartIndex{0};   ///< Offset where the structured sensor list starts
    std::vector<SensorSighting> sensors;
    DecodeError sensorLayout{DecodeError::None}; ///< InvalidSensorLayout when the structured pass stopped early
    Bytes rawBytes;

    bool RequiresAck() const { return header == kHeaderBeaconScanAck; }
    std::size_t SensorsParsed() const { return sensors.size(); }
    bool HasTargetMac() const;
    std::size_t RemainingPayloadBytes() const {
        return rawBytes.size() > rawDataStartIndex ? rawBytes.size() - rawDataStartIndex : 0;
    }
};

struct ParseError {
    DecodeError error{DecodeError::DecodeFailure};
    std::string reason;
    Bytes rawBytes;
    std::size_t byteLength{0};
};

struct UnknownHeader {
    uint8_t headerByte{0};
    std::string note;             ///< "STT Variant" when a 0x82 frame did not fit the STT layout
    Bytes rawBytes;
};

using DecodedReport = std::variant<StatusReport, BeaconScanReport, ParseError, UnknownHeader>;

/**
 * @brief Entry of the raw report history.
 */
struct ReportRecord {
    WallClock::time_point receivedAt{};
    DecodedReport report;
};

/// Raw bytes of any report alternative.
const Bytes& RawBytesOf(const DecodedReport& report);

/// Human-readable kind ("STT (Status Report)", "BDA/SNB (BLE Sensor Data Report)", ...).
std::string ReportKind(const DecodedReport& report);

} // namespace suntrack
