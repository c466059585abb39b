#pragma once

/**
 * @file beacon_scan.h
 * @brief Decoder for BLE sensor data frames and beacon address resolution.
 *
 * A scan frame carries a structured sensor list, but the sending firmware
 * does not always align beacon records to it. Sightings are therefore
 * collected in two passes:
 *
 * 1. The structured list: `{size:2, payload:size, mac:6, rssi:1}` entries.
 * 2. A rescan of the whole frame with a 6-byte window, keeping every window
 *    that reads as a target address in either byte order.
 *
 * Both passes feed one list deduplicated by resolved address; the first
 * registration of an address wins.
 */

#include "suntrack/report.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace suntrack {

/**
 * @defgroup ScanOffsets Scan Frame Byte Offsets
 * @{
 */
constexpr std::size_t kScanStatusIndex = 15;
constexpr std::size_t kScanTotalReportsIndex = 16;
constexpr std::size_t kScanCurrentReportIndex = 17;
constexpr std::size_t kScanSensorCountIndex = 18;
constexpr std::size_t kScanDateIndex = 20;
/** @} */ // end of ScanOffsets

/** @brief Frames shorter than this cannot be decoded (prefix + scan metadata). */
constexpr std::size_t kScanMinimumLength = kScanDateIndex;

/** @brief Size of a BLE device address. */
constexpr std::size_t kMacSize = 6;

/**
 * @brief Set of vendor address prefixes identifying tracker tags.
 *
 * Prefixes are hex digit strings matched against the 12-digit rendering
 * of an address; they may have an odd number of digits. Input is
 * normalised to upper case with ':' and '-' separators removed.
 */
class TargetPrefixSet {
public:
    /// Default tag vendors.
    TargetPrefixSet();
    explicit TargetPrefixSet(std::vector<std::string> prefixes);

    /// Build from a comma-separated list ("AC233F,C3000"). Empty entries are skipped.
    static TargetPrefixSet Parse(const std::string& commaSeparated);

    /// True when `hexAddress` (upper-case, no separators) starts with any prefix.
    bool Matches(const std::string& hexAddress) const;

    const std::vector<std::string>& Prefixes() const { return m_prefixes; }
    bool Empty() const { return m_prefixes.empty(); }

private:
    std::vector<std::string> m_prefixes;
};

/**
 * @brief Address read from 6 wire bytes after orientation resolution.
 */
struct MacResolution {
    std::string address;          ///< 12 upper-case hex digits, no separators
    MacEndianness endianness{MacEndianness::Big};
    bool isTarget{false};
};

/**
 * @brief Resolve the byte order of a 6-byte address.
 *
 * The big-endian rendering is tested first, then the byte-reversed one.
 * The first orientation matching a target prefix is returned; when neither
 * matches the big-endian rendering is returned with isTarget false.
 *
 * @param data Pointer to kMacSize bytes
 * @param targets Target prefixes
 */
MacResolution ResolveMacAddress(const uint8_t* data, const TargetPrefixSet& targets);

/**
 * @brief Read a battery percentage from a BLE advertisement payload.
 *
 * Walks the AD structures looking for Service Data (0x16) for UUID 0xFFE1
 * with frame type 0xA1; the battery byte follows the frame version.
 *
 * @return Battery level, or nullopt if the payload carries none
 */
std::optional<uint8_t> ExtractBatteryLevel(const uint8_t* payload, std::size_t length);

struct BeaconScanDecodeResult {
    std::optional<BeaconScanReport> report;
    DecodeError error{DecodeError::None};
    std::string reason;
};

/**
 * @brief Decode a BLE sensor data frame.
 *
 * Requires kScanMinimumLength bytes. Scan date, time, latitude and
 * longitude are each read only if they fit; the scan location is reported
 * only when all four were read. Sensor extraction never fails the decode:
 * a structured list that ends early sets `sensorLayout` to
 * DecodeError::InvalidSensorLayout and keeps the entries read so far.
 *
 * @param data Frame bytes (header byte included)
 * @param length Number of bytes in the frame
 * @param targets Target prefixes used by both sensor passes
 */
BeaconScanDecodeResult DecodeBeaconScanReport(const uint8_t* data, std::size_t length,
                                              const TargetPrefixSet& targets);

} // namespace suntrack
