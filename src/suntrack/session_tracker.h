#pragma once

/**
 * @file session_tracker.h
 * @brief Cross-frame device state and beacon/ignition event derivation.
 */

#include "suntrack/report.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace suntrack {

/**
 * @brief Configuration for the session tracker.
 */
struct SessionTrackerConfig {
    /// Upper bound on per-address last-seen entries; the stalest entry is evicted beyond it
    std::size_t maxTrackedDevices{4096};

    /// mac_id used for ignition-change events
    std::string ignitionMarker{"IGNITION_CHANGE"};
};

/**
 * @brief Last known state of the vehicle, shared by every connection.
 *
 * Mutated only through SessionTracker::Apply while the owner's lock is held.
 * Readers get copies.
 */
struct DeviceSessionState {
    IgnitionState currentIgnition{IgnitionState::Off};
    std::optional<IgnitionState> previousIgnition;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<uint16_t> inputVoltageMv;
    std::unordered_map<std::string, WallClock::time_point> lastSeen; ///< Keyed by canonical address
};

/**
 * @brief Enriched record derived from a target sighting or an ignition transition.
 */
struct BeaconScanEvent {
    WallClock::time_point timestamp{};
    std::string macId;            ///< Canonical address or the ignition marker
    IgnitionState ignitionStatus{IgnitionState::Off};
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<double> frequencySeconds; ///< Seconds since the previous sighting of macId
    std::optional<uint16_t> inputVoltageMv;
    std::size_t sensorCountInMessage{0};
    std::optional<int8_t> rssi;
    std::optional<uint8_t> batteryLevel;

    bool isIgnitionChange{false};
    std::optional<IgnitionState> previousStatus; ///< Ignition events only
    std::optional<IgnitionState> newStatus;      ///< Ignition events only
};

/**
 * @brief State-transition function over DeviceSessionState.
 *
 * The tracker holds configuration only; the state object is passed in by
 * the caller, which serialises calls.
 *
 * - StatusReport: caches position (only when both coordinates were in the
 *   frame and not 0,0), voltage (already band
 *   checked by the decoder) and ignition; emits one ignition-change event
 *   when the ignition differs from the previous report's.
 * - BeaconScanReport: one event per target sighting, with the time since
 *   that address was last seen (absent on first sighting or a non-positive
 *   delta).
 * - Other reports: no change, no events.
 */
class SessionTracker {
public:
    explicit SessionTracker(SessionTrackerConfig config = {});

    /**
     * @brief Apply one decoded report.
     * @param state Session state to update
     * @param report Decoded frame
     * @param now Wall-clock time the frame was received
     * @return Events emitted by this report, in emission order
     */
    std::vector<BeaconScanEvent> Apply(DeviceSessionState& state, const DecodedReport& report,
                                       WallClock::time_point now) const;

    const SessionTrackerConfig& Config() const { return m_config; }

private:
    void ApplyStatus(DeviceSessionState& state, const StatusReport& report,
                     WallClock::time_point now, std::vector<BeaconScanEvent>& events) const;
    void ApplyBeaconScan(DeviceSessionState& state, const BeaconScanReport& report,
                         WallClock::time_point now, std::vector<BeaconScanEvent>& events) const;
    void EvictStalest(DeviceSessionState& state, const std::string& keep) const;

    SessionTrackerConfig m_config;
};

/// Seconds from `previous` to `now`, or nullopt when not strictly positive.
std::optional<double> ElapsedSeconds(WallClock::time_point previous, WallClock::time_point now);

} // namespace suntrack
