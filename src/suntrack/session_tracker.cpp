#include "suntrack/session_tracker.h"

#include <chrono>
#include <utility>

namespace suntrack {

std::optional<double> ElapsedSeconds(WallClock::time_point previous, WallClock::time_point now) {
    const std::chrono::duration<double> delta = now - previous;
    if (delta.count() <= 0.0) {
        return std::nullopt;
    }
    return delta.count();
}

SessionTracker::SessionTracker(SessionTrackerConfig config)
    : m_config(std::move(config)) {
    if (m_config.maxTrackedDevices == 0) {
        m_config.maxTrackedDevices = 1;
    }
}

std::vector<BeaconScanEvent> SessionTracker::Apply(DeviceSessionState& state, const DecodedReport& report,
                                                   WallClock::time_point now) const {
    std::vector<BeaconScanEvent> events;
    if (const auto* status = std::get_if<StatusReport>(&report)) {
        ApplyStatus(state, *status, now, events);
    } else if (const auto* scan = std::get_if<BeaconScanReport>(&report)) {
        ApplyBeaconScan(state, *scan, now, events);
    }
    return events;
}

void SessionTracker::ApplyStatus(DeviceSessionState& state, const StatusReport& report,
                                 WallClock::time_point now, std::vector<BeaconScanEvent>& events) const {
    if (report.positionPresent && !report.gps.IsZeroPosition()) {
        state.latitude = report.gps.latitude;
        state.longitude = report.gps.longitude;
    }
    if (report.inputVoltageMv) {
        state.inputVoltageMv = report.inputVoltageMv;
    }

    if (!report.status.ignition) {
        return;
    }
    const IgnitionState ignition = *report.status.ignition;

    if (state.previousIgnition && *state.previousIgnition != ignition) {
        BeaconScanEvent event;
        event.timestamp = now;
        event.macId = m_config.ignitionMarker;
        event.ignitionStatus = ignition;
        event.latitude = state.latitude;
        event.longitude = state.longitude;
        event.inputVoltageMv = state.inputVoltageMv;
        event.isIgnitionChange = true;
        event.previousStatus = *state.previousIgnition;
        event.newStatus = ignition;
        events.push_back(std::move(event));
    }

    state.previousIgnition = ignition;
    state.currentIgnition = ignition;
}

void SessionTracker::ApplyBeaconScan(DeviceSessionState& state, const BeaconScanReport& report,
                                     WallClock::time_point now, std::vector<BeaconScanEvent>& events) const {
    for (const auto& sensor : report.sensors) {
        if (!sensor.isTarget) {
            continue;
        }

        BeaconScanEvent event;
        event.timestamp = now;
        event.macId = sensor.macAddress;
        event.ignitionStatus = state.currentIgnition;
        event.latitude = state.latitude;
        event.longitude = state.longitude;
        event.inputVoltageMv = state.inputVoltageMv;
        event.sensorCountInMessage = report.sensors.size();
        event.rssi = sensor.rssi;
        event.batteryLevel = sensor.batteryLevel;

        auto it = state.lastSeen.find(sensor.macAddress);
        if (it != state.lastSeen.end()) {
            event.frequencySeconds = ElapsedSeconds(it->second, now);
            it->second = now;
        } else {
            state.lastSeen.emplace(sensor.macAddress, now);
            if (state.lastSeen.size() > m_config.maxTrackedDevices) {
                EvictStalest(state, sensor.macAddress);
            }
        }

        events.push_back(std::move(event));
    }
}

/**
 * @brief Drop the address with the oldest last-seen time, other than `keep`.
 *
 * Linear scan; only runs when a new address pushes the map past its bound.
 * `keep` is the address just inserted, which may carry the oldest time when
 * the wall clock stepped back.
 */
void SessionTracker::EvictStalest(DeviceSessionState& state, const std::string& keep) const {
    auto stalest = state.lastSeen.end();
    for (auto it = state.lastSeen.begin(); it != state.lastSeen.end(); ++it) {
        if (it->first == keep) {
            continue;
        }
        if (stalest == state.lastSeen.end() || it->second < stalest->second) {
            stalest = it;
        }
    }
    if (stalest != state.lastSeen.end()) {
        state.lastSeen.erase(stalest);
    }
}

} // namespace suntrack
