#pragma once

/**
 * @file codec.h
 * @brief Wire-level primitives shared by every suntrack frame decoder.
 *
 * Tracker frames are big-endian throughout. Numeric identifiers and
 * calendar fields are nominally BCD, but some firmware builds emit plain
 * binary in the same positions, so the BCD helpers fall back to a hex
 * reinterpretation instead of failing.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace suntrack {

namespace detail {

inline uint16_t LoadU16(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8U) | data[1]);
}

inline uint32_t LoadU24(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 16U) |
           (static_cast<uint32_t>(data[1]) << 8U) |
           static_cast<uint32_t>(data[2]);
}

inline uint32_t LoadU32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24U) |
           (static_cast<uint32_t>(data[1]) << 16U) |
           (static_cast<uint32_t>(data[2]) << 8U) |
           static_cast<uint32_t>(data[3]);
}

inline int32_t LoadI32(const uint8_t* data) {
    return static_cast<int32_t>(LoadU32(data));
}

inline void StoreU16(uint16_t value, uint8_t* out) {
    out[0] = static_cast<uint8_t>((value >> 8U) & 0xFFU);
    out[1] = static_cast<uint8_t>(value & 0xFFU);
}

inline void StoreU32(uint32_t value, uint8_t* out) {
    out[0] = static_cast<uint8_t>((value >> 24U) & 0xFFU);
    out[1] = static_cast<uint8_t>((value >> 16U) & 0xFFU);
    out[2] = static_cast<uint8_t>((value >> 8U) & 0xFFU);
    out[3] = static_cast<uint8_t>(value & 0xFFU);
}

} // namespace detail

/** @brief Size of a BCD date field (YY MM DD). */
constexpr std::size_t kDateSize = 3;

/** @brief Size of a BCD time field (HH MM SS). */
constexpr std::size_t kTimeSize = 3;

/** @brief Size of a fixed-point coordinate field. */
constexpr std::size_t kCoordinateSize = 4;

/** @brief Coordinates are transmitted as micro-degrees. */
constexpr double kCoordinateScale = 1000000.0;

/** @brief Speed (km/h) and course (degrees) are transmitted in hundredths. */
constexpr double kSpeedCourseScale = 100.0;

/**
 * @brief Decode a big-endian BCD byte run to an integer.
 *
 * Each byte carries two decimal digits (high nibble first). If any nibble
 * is above 9 the run is not BCD and the whole sequence is instead read as
 * one hexadecimal number (0x0B 0x13 -> 0x0B13).
 *
 * @param data Pointer to the first byte
 * @param length Number of bytes (at most 8 for an exact hex fallback)
 * @return Decoded value (0 for an empty run)
 */
uint64_t DecodeBcd(const uint8_t* data, std::size_t length);

/**
 * @brief Decode a YY MM DD field to a "YYYYMMDD" string.
 *
 * Each byte goes through DecodeBcd, so a non-BCD byte contributes its hex
 * value. Missing bytes decode as zero.
 */
std::string DecodeDate(const uint8_t* data, std::size_t length);

/**
 * @brief Decode an HH MM SS field to an "HH:MM:SS" string.
 */
std::string DecodeTime(const uint8_t* data, std::size_t length);

/**
 * @brief Decode a signed 32-bit big-endian micro-degree value.
 * @param data Pointer to kCoordinateSize bytes
 * @return Decimal degrees
 */
double DecodeCoordinate(const uint8_t* data);

/**
 * @brief Decode an unsigned 16-bit big-endian hundredths value (speed, course).
 */
double DecodeHundredths(const uint8_t* data);

/** @brief Size of the identity prefix every report kind starts with. */
constexpr std::size_t kFramePrefixSize = 15;

/**
 * @brief Identity prefix shared by status and beacon scan frames.
 *
 * header(1) + packet length(2) + device id BCD(5) + report map(3) +
 * model(1) + software version(3).
 */
struct FramePrefix {
    uint8_t header{0};
    uint16_t packetLength{0};
    uint64_t deviceId{0};
    uint32_t reportMap{0};
    uint8_t model{0};
    std::string softwareVersion;
};

/**
 * @brief Decode the identity prefix.
 * @param data Frame bytes, at least kFramePrefixSize long
 */
FramePrefix DecodeFramePrefix(const uint8_t* data);

/**
 * @brief Render the 3 software version bytes the way the device tooling does.
 *
 * The bytes become 6 hex digits D0..D5, shown as "D0.D1.D2D3D4D5"
 * (01 01 0C -> "0.1.010C").
 */
std::string FormatSoftwareVersion(const uint8_t* data);

/// Upper-case hex rendering without separators ("0A1B2C").
std::string ToHex(const uint8_t* data, std::size_t length);

/// Colon-separated rendering of a 12-digit hex address ("AC:23:3F:...").
std::string FormatMacAddress(const std::string& hexAddress);

/// Zero-padded upper-case hex of a value ("0x%0*X" without the prefix).
std::string FormatHexValue(uint32_t value, int width);

} // namespace suntrack
