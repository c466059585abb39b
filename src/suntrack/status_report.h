#pragma once

/**
 * @file status_report.h
 * @brief Decoder for the fixed-layout STT status frame.
 */

#include "suntrack/report.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace suntrack {

/**
 * @defgroup StatusOffsets STT Byte Offsets
 * @brief Byte indices into a status frame (big-endian fields).
 * @{
 */
constexpr std::size_t kStatusMessageTypeIndex = 15;
constexpr std::size_t kStatusDateIndex = 16;
constexpr std::size_t kStatusTimeIndex = 19;
constexpr std::size_t kStatusCellIdIndex = 22;
constexpr std::size_t kStatusMccIndex = 26;
constexpr std::size_t kStatusMncIndex = 28;
constexpr std::size_t kStatusLacIndex = 30;
constexpr std::size_t kStatusRxLevelIndex = 32;
constexpr std::size_t kStatusLatitudeIndex = 33;
constexpr std::size_t kStatusLongitudeIndex = 37;
constexpr std::size_t kStatusSpeedIndex = 41;
constexpr std::size_t kStatusCourseIndex = 43;
constexpr std::size_t kStatusSatellitesIndex = 45;
constexpr std::size_t kStatusFixIndex = 46;
constexpr std::size_t kStatusInputStateIndex = 47;
constexpr std::size_t kStatusOutputStateIndex = 48;
constexpr std::size_t kStatusModeIndex = 49;
constexpr std::size_t kStatusReportTypeIndex = 50;
constexpr std::size_t kStatusMessageNumberIndex = 51;
constexpr std::size_t kStatusReservedIndex = 53;
constexpr std::size_t kStatusAssignMapIndex = 54;
/** @} */ // end of StatusOffsets

/** @brief Frames shorter than this cannot be decoded (prefix + message type). */
constexpr std::size_t kStatusMinimumLength = kStatusMessageTypeIndex + 1;

/** @brief Length of the complete fixed layout. */
constexpr std::size_t kStatusFullLength = 58;

/** @brief Input-state bit wired to the ignition line. */
constexpr uint8_t kInputIgnitionBit = 0x01;

/** @brief Assignment-map bit announcing a 2-byte input voltage after the fixed layout. */
constexpr uint32_t kAssignInputVoltage = 0x00000001;

/** @brief Plausible vehicle supply band in millivolts (inclusive). */
constexpr uint16_t kMinInputVoltageMv = 10000;
constexpr uint16_t kMaxInputVoltageMv = 20000;

/**
 * @brief Result of decoding a status frame.
 *
 * `report` is set on success. On failure `error` and `reason` describe why;
 * no exception is thrown for any input.
 */
struct StatusDecodeResult {
    std::optional<StatusReport> report;
    DecodeError error{DecodeError::None};
    std::string reason;
};

/**
 * @brief Decode an STT status frame.
 *
 * Requires kStatusMinimumLength bytes. Each later field is read only when
 * the frame still holds all of its bytes; missing fields keep their
 * defaults, so a truncated frame still yields a report.
 *
 * @param data Frame bytes (header byte included)
 * @param length Number of bytes in the frame
 */
StatusDecodeResult DecodeStatusReport(const uint8_t* data, std::size_t length);

/**
 * @brief Apply the supply band to a voltage reading.
 * @return The reading, or nullopt when outside [kMinInputVoltageMv, kMaxInputVoltageMv]
 */
std::optional<uint16_t> ValidateInputVoltage(uint16_t millivolts);

} // namespace suntrack
