/**
 * @file beacon_scan.cpp
 * @brief BLE sensor data frame decoding.
 */

#include "suntrack/beacon_scan.h"

#include "suntrack/codec.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace suntrack {
namespace {

const char* const kDefaultTargetPrefixes[] = {"AC233F", "C3000"};

/// AD type carrying 16-bit UUID service data.
constexpr uint8_t kAdServiceData16 = 0x16;

/// Tag info frame: UUID 0xFFE1 (little-endian on air), frame type 0xA1.
constexpr uint8_t kInfoFrameUuidLow = 0xE1;
constexpr uint8_t kInfoFrameUuidHigh = 0xFF;
constexpr uint8_t kInfoFrameType = 0xA1;

std::string NormalizePrefix(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (c == ':' || c == '-' || std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

bool Fits(std::size_t length, std::size_t offset, std::size_t size) {
    return offset + size <= length;
}

/**
 * @brief Accumulates sightings for one frame, keyed by resolved address.
 */
class SightingCollector {
public:
    bool Contains(const std::string& address) const {
        return m_seen.count(address) != 0;
    }

    /// Adds the sighting unless its address was already registered.
    bool Add(const MacResolution& mac, SensorSighting sighting) {
        if (!m_seen.insert(mac.address).second) {
            return false;
        }
        sighting.macAddress = FormatMacAddress(mac.address);
        sighting.macEndianness = mac.endianness;
        sighting.isTarget = mac.isTarget;
        m_sensors.push_back(std::move(sighting));
        return true;
    }

    std::vector<SensorSighting> Take() { return std::move(m_sensors); }

private:
    std::unordered_set<std::string> m_seen;
    std::vector<SensorSighting> m_sensors;
};

/**
 * @brief Structured pass over the sensor list.
 * @return true when all expected entries were read
 */
bool ParseStructuredSensors(const uint8_t* data, std::size_t length, std::size_t offset,
                            uint16_t expected, const TargetPrefixSet& targets,
                            SightingCollector& collector) {
    for (uint16_t i = 0; i < expected; ++i) {
        if (!Fits(length, offset, 2)) {
            return false;
        }
        const std::size_t payloadSize = detail::LoadU16(&data[offset]);
        const std::size_t payloadIndex = offset + 2;
        const std::size_t macIndex = payloadIndex + payloadSize;
        const std::size_t rssiIndex = macIndex + kMacSize;
        if (!Fits(length, rssiIndex, 1)) {
            // Partial entry: dropped
            return false;
        }

        SensorSighting sighting;
        sighting.rssi = static_cast<int8_t>(data[rssiIndex]);
        sighting.rawPayload.assign(&data[payloadIndex], &data[macIndex]);
        sighting.batteryLevel = ExtractBatteryLevel(sighting.rawPayload.data(), sighting.rawPayload.size());
        collector.Add(ResolveMacAddress(&data[macIndex], targets), std::move(sighting));

        offset = rssiIndex + 1;
    }
    return true;
}

/**
 * @brief Rescan every 6-byte window of the frame for target addresses.
 *
 * Deliberate brute force: frames are a few hundred bytes, so testing both
 * orientations at every offset is cheap.
 */
void RescanForTargets(const uint8_t* data, std::size_t length, const TargetPrefixSet& targets,
                      SightingCollector& collector) {
    if (length < kMacSize || targets.Empty()) {
        return;
    }
    for (std::size_t offset = 0; offset + kMacSize <= length; ++offset) {
        const MacResolution mac = ResolveMacAddress(&data[offset], targets);
        if (!mac.isTarget || collector.Contains(mac.address)) {
            continue;
        }
        SensorSighting sighting;
        sighting.bytePosition = offset;
        if (offset + kMacSize < length) {
            sighting.rssi = static_cast<int8_t>(data[offset + kMacSize]);
        }
        collector.Add(mac, std::move(sighting));
    }
}

} // namespace

TargetPrefixSet::TargetPrefixSet()
    : m_prefixes(std::begin(kDefaultTargetPrefixes), std::end(kDefaultTargetPrefixes)) {}

TargetPrefixSet::TargetPrefixSet(std::vector<std::string> prefixes) {
    for (const auto& prefix : prefixes) {
        std::string normalized = NormalizePrefix(prefix);
        if (!normalized.empty()) {
            m_prefixes.push_back(std::move(normalized));
        }
    }
}

TargetPrefixSet TargetPrefixSet::Parse(const std::string& commaSeparated) {
    std::vector<std::string> prefixes;
    std::size_t start = 0;
    while (start <= commaSeparated.size()) {
        const std::size_t comma = commaSeparated.find(',', start);
        const std::size_t end = comma == std::string::npos ? commaSeparated.size() : comma;
        prefixes.push_back(commaSeparated.substr(start, end - start));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return TargetPrefixSet(std::move(prefixes));
}

bool TargetPrefixSet::Matches(const std::string& hexAddress) const {
    return std::any_of(m_prefixes.begin(), m_prefixes.end(), [&](const std::string& prefix) {
        return hexAddress.compare(0, prefix.size(), prefix) == 0;
    });
}

MacResolution ResolveMacAddress(const uint8_t* data, const TargetPrefixSet& targets) {
    std::array<uint8_t, kMacSize> reversed{};
    std::reverse_copy(data, data + kMacSize, reversed.begin());

    MacResolution result;
    result.address = ToHex(data, kMacSize);
    if (targets.Matches(result.address)) {
        result.isTarget = true;
        return result;
    }

    std::string little = ToHex(reversed.data(), reversed.size());
    if (targets.Matches(little)) {
        result.address = std::move(little);
        result.endianness = MacEndianness::Little;
        result.isTarget = true;
    }
    return result;
}

std::optional<uint8_t> ExtractBatteryLevel(const uint8_t* payload, std::size_t length) {
    if (!payload) {
        return std::nullopt;
    }
    std::size_t index = 0;
    while (index < length) {
        const std::size_t elementLength = payload[index];
        if (elementLength == 0 || !Fits(length, index + 1, elementLength)) {
            break;
        }
        const uint8_t type = payload[index + 1];
        const uint8_t* value = &payload[index + 2];
        const std::size_t valueLength = elementLength - 1;
        if (type == kAdServiceData16 && valueLength >= 5 &&
            value[0] == kInfoFrameUuidLow && value[1] == kInfoFrameUuidHigh &&
            value[2] == kInfoFrameType) {
            return value[4];
        }
        index += elementLength + 1;
    }
    return std::nullopt;
}

BeaconScanDecodeResult DecodeBeaconScanReport(const uint8_t* data, std::size_t length,
                                              const TargetPrefixSet& targets) {
    BeaconScanDecodeResult result{};

    if (!data || length < kScanMinimumLength) {
        result.error = DecodeError::TruncatedRequiredField;
        result.reason = "BDA message too short: " + std::to_string(length) +
                        " bytes (expected at least " + std::to_string(kScanMinimumLength) + ")";
        return result;
    }

    BeaconScanReport report;
    const FramePrefix prefix = DecodeFramePrefix(data);
    report.header = prefix.header;
    report.packetLength = prefix.packetLength;
    report.deviceId = prefix.deviceId;
    report.reportMap = prefix.reportMap;
    report.model = prefix.model;
    report.softwareVersion = prefix.softwareVersion;

    report.scanStatus = data[kScanStatusIndex];
    report.totalReportsExpected = data[kScanTotalReportsIndex];
    report.currentReportNumber = data[kScanCurrentReportIndex];
    report.expectedSensorCount = detail::LoadU16(&data[kScanSensorCountIndex]);

    // Scan timestamp and location, each optional
    std::size_t index = kScanDateIndex;
    if (Fits(length, index, kDateSize)) {
        report.scanDate = DecodeDate(&data[index], kDateSize);
        index += kDateSize;
    }
    if (Fits(length, index, kTimeSize)) {
        report.scanTime = DecodeTime(&data[index], kTimeSize);
        index += kTimeSize;
    }
    std::optional<double> latitude;
    std::optional<double> longitude;
    if (Fits(length, index, kCoordinateSize)) {
        latitude = DecodeCoordinate(&data[index]);
        index += kCoordinateSize;
    }
    if (Fits(length, index, kCoordinateSize)) {
        longitude = DecodeCoordinate(&data[index]);
        index += kCoordinateSize;
    }
    if (report.scanDate && report.scanTime && latitude && longitude) {
        GpsFix location;
        location.latitude = *latitude;
        location.longitude = *longitude;
        report.scanLocation = location;
    }
    report.rawDataStartIndex = index;

    SightingCollector collector;
    if (!ParseStructuredSensors(data, length, index, report.expectedSensorCount, targets, collector)) {
        report.sensorLayout = DecodeError::InvalidSensorLayout;
    }
    RescanForTargets(data, length, targets, collector);
    report.sensors = collector.Take();

    report.rawBytes.assign(data, data + length);
    result.report = std::move(report);
    return result;
}

} // namespace suntrack
