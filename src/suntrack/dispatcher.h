#pragma once

#include "suntrack/beacon_scan.h"
#include "suntrack/report.h"

#include <cstddef>
#include <cstdint>

namespace suntrack {

/// Configuration for the frame dispatcher
struct FrameDispatcherConfig {
    TargetPrefixSet targets{};
};

/**
 * @brief Routes a frame to its decoder by the leading header byte.
 *
 * Every call returns a DecodedReport; nothing is thrown and no frame is
 * dropped:
 * - empty frame          -> ParseError (EmptyFrame)
 * - 0x81                 -> StatusReport, or ParseError if too short
 * - 0x82                 -> StatusReport, or UnknownHeader tagged "STT Variant"
 * - 0xAA / 0xBA          -> BeaconScanReport, or ParseError if too short
 * - anything else        -> UnknownHeader
 *
 * Dispatch holds no mutable state, so one dispatcher can be shared by all
 * connection workers without locking.
 *
 * Usage:
 *   FrameDispatcher dispatcher;
 *   DecodedReport report = dispatcher.Dispatch(buffer.data(), received);
 *   if (auto* status = std::get_if<StatusReport>(&report)) {
 *       // ...
 *   }
 */
class FrameDispatcher {
public:
    explicit FrameDispatcher(FrameDispatcherConfig config = {});

    /// Decode one frame (one socket read)
    DecodedReport Dispatch(const uint8_t* data, std::size_t length) const;

    const FrameDispatcherConfig& Config() const { return m_config; }

private:
    DecodedReport DispatchStatus(const uint8_t* data, std::size_t length) const;
    DecodedReport DispatchStatusVariant(const uint8_t* data, std::size_t length) const;
    DecodedReport DispatchBeaconScan(const uint8_t* data, std::size_t length) const;

    FrameDispatcherConfig m_config;
};

} // namespace suntrack
