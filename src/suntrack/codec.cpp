#include "suntrack/codec.h"

#include <cstdio>

namespace suntrack {
namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

std::string PadNumber(uint64_t value, int width) {
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "%0*llu", width, static_cast<unsigned long long>(value));
    return buffer;
}

uint64_t DecodeField(const uint8_t* data, std::size_t length, std::size_t index) {
    if (!data || index >= length) {
        return 0;
    }
    return DecodeBcd(&data[index], 1);
}

} // namespace

uint64_t DecodeBcd(const uint8_t* data, std::size_t length) {
    if (!data || length == 0) {
        return 0;
    }

    uint64_t result = 0;
    for (std::size_t i = 0; i < length; ++i) {
        const uint8_t high = static_cast<uint8_t>((data[i] >> 4U) & 0x0FU);
        const uint8_t low = static_cast<uint8_t>(data[i] & 0x0FU);
        if (high > 9 || low > 9) {
            // Not BCD: the firmware wrote raw hex into this field
            uint64_t hexValue = 0;
            for (std::size_t j = 0; j < length; ++j) {
                hexValue = (hexValue << 8U) | data[j];
            }
            return hexValue;
        }
        result = result * 100U + high * 10U + low;
    }
    return result;
}

std::string DecodeDate(const uint8_t* data, std::size_t length) {
    const uint64_t year = 2000 + DecodeField(data, length, 0);
    const uint64_t month = DecodeField(data, length, 1);
    const uint64_t day = DecodeField(data, length, 2);
    return PadNumber(year, 4) + PadNumber(month, 2) + PadNumber(day, 2);
}

std::string DecodeTime(const uint8_t* data, std::size_t length) {
    const uint64_t hour = DecodeField(data, length, 0);
    const uint64_t minute = DecodeField(data, length, 1);
    const uint64_t second = DecodeField(data, length, 2);
    return PadNumber(hour, 2) + ":" + PadNumber(minute, 2) + ":" + PadNumber(second, 2);
}

double DecodeCoordinate(const uint8_t* data) {
    return static_cast<double>(detail::LoadI32(data)) / kCoordinateScale;
}

double DecodeHundredths(const uint8_t* data) {
    return static_cast<double>(detail::LoadU16(data)) / kSpeedCourseScale;
}

FramePrefix DecodeFramePrefix(const uint8_t* data) {
    FramePrefix prefix;
    prefix.header = data[0];
    prefix.packetLength = detail::LoadU16(&data[1]);
    prefix.deviceId = DecodeBcd(&data[3], 5);
    prefix.reportMap = detail::LoadU24(&data[8]);
    prefix.model = data[11];
    prefix.softwareVersion = FormatSoftwareVersion(&data[12]);
    return prefix;
}

std::string FormatSoftwareVersion(const uint8_t* data) {
    const std::string hex = ToHex(data, 3);
    return hex.substr(0, 1) + "." + hex.substr(1, 1) + "." + hex.substr(2);
}

std::string ToHex(const uint8_t* data, std::size_t length) {
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kHexDigits[(data[i] >> 4U) & 0x0FU]);
        out.push_back(kHexDigits[data[i] & 0x0FU]);
    }
    return out;
}

std::string FormatMacAddress(const std::string& hexAddress) {
    std::string out;
    out.reserve(hexAddress.size() + hexAddress.size() / 2);
    for (std::size_t i = 0; i < hexAddress.size(); i += 2) {
        if (i > 0) {
            out.push_back(':');
        }
        out.append(hexAddress, i, 2);
    }
    return out;
}

std::string FormatHexValue(uint32_t value, int width) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%0*X", width, value);
    return buffer;
}

} // namespace suntrack
