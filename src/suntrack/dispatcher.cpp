/**
 * @file dispatcher.cpp
 * @brief Header-byte routing of tracker frames to their decoders.
 */

#include "suntrack/dispatcher.h"

#include "suntrack/codec.h"
#include "suntrack/status_report.h"

#include <utility>

namespace suntrack {
namespace {

/// Note attached to 0x82 frames that did not decode as STT.
constexpr const char* kStatusVariantNote = "STT Variant";

ParseError MakeParseError(DecodeError error, std::string reason, const uint8_t* data, std::size_t length) {
    ParseError parseError;
    parseError.error = error;
    parseError.reason = std::move(reason);
    if (data && length > 0) {
        parseError.rawBytes.assign(data, data + length);
    }
    parseError.byteLength = length;
    return parseError;
}

} // namespace

/**
 * @brief Construct a dispatcher.
 * @param config Target prefixes handed to the beacon scan decoder
 */
FrameDispatcher::FrameDispatcher(FrameDispatcherConfig config)
    : m_config(std::move(config)) {}

/**
 * @brief Decode one frame.
 *
 * @param data Frame bytes (may be null when length is 0)
 * @param length Number of bytes received
 * @return The decoded report; failures are returned as ParseError/UnknownHeader
 */
DecodedReport FrameDispatcher::Dispatch(const uint8_t* data, std::size_t length) const {
    if (!data || length == 0) {
        return MakeParseError(DecodeError::EmptyFrame, "Empty message", nullptr, 0);
    }

    switch (data[0]) {
        case kHeaderStatus:
            return DispatchStatus(data, length);
        case kHeaderStatusVariant:
            return DispatchStatusVariant(data, length);
        case kHeaderBeaconScan:
        case kHeaderBeaconScanAck:
            return DispatchBeaconScan(data, length);
        default:
            break;
    }

    UnknownHeader unknown;
    unknown.headerByte = data[0];
    unknown.note = "Unknown Header: 0x" + FormatHexValue(data[0], 2);
    unknown.rawBytes.assign(data, data + length);
    return unknown;
}

DecodedReport FrameDispatcher::DispatchStatus(const uint8_t* data, std::size_t length) const {
    auto result = DecodeStatusReport(data, length);
    if (result.report) {
        return std::move(*result.report);
    }
    return MakeParseError(result.error, "STT parse error: " + result.reason, data, length);
}

/**
 * @brief 0x82 frames share the STT layout on most firmware; anything that
 *        does not fit is kept as an UnknownHeader instead of an error.
 */
DecodedReport FrameDispatcher::DispatchStatusVariant(const uint8_t* data, std::size_t length) const {
    auto result = DecodeStatusReport(data, length);
    if (result.report) {
        return std::move(*result.report);
    }
    UnknownHeader unknown;
    unknown.headerByte = data[0];
    unknown.note = kStatusVariantNote;
    unknown.rawBytes.assign(data, data + length);
    return unknown;
}

DecodedReport FrameDispatcher::DispatchBeaconScan(const uint8_t* data, std::size_t length) const {
    auto result = DecodeBeaconScanReport(data, length, m_config.targets);
    if (result.report) {
        return std::move(*result.report);
    }
    return MakeParseError(result.error, "BDA parse error: " + result.reason, data, length);
}

} // namespace suntrack
