#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "suntrack/codec.h"
#include "suntrack/daily_log_sink.h"
#include "suntrack/dispatcher.h"
#include "suntrack/gateway.h"
#include "suntrack/history_store.h"
#include "suntrack/report_json.h"
#include "suntrack/session_tracker.h"
#include "suntrack/status_report.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;

namespace {

const char* const kSampleScanHex =
    "aa00851990000910007fffc701010c0102020003190b1317390f02edf43c874f5a2a1a1a1f0201060303e1ff1216e1ffa1"
    "08643c2b5e3f23ac566563696d610201060303e1ff1216e1ffa10864efa7753f23ac566563696d610201061bff3906ca1a"
    "01e2951929ec052b5eca3c2b5ecaefa775c84f4f8167ac233f5e2b3cac233f75a7efc3000040089dbbb5c4";

std::vector<uint8_t> FromHex(const std::string& hex) {
    std::vector<uint8_t> out;
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

void PushU16(std::vector<uint8_t>& out, uint16_t value) {
    uint8_t bytes[2];
    suntrack::detail::StoreU16(value, bytes);
    out.insert(out.end(), bytes, bytes + 2);
}

void PushU32(std::vector<uint8_t>& out, uint32_t value) {
    uint8_t bytes[4];
    suntrack::detail::StoreU32(value, bytes);
    out.insert(out.end(), bytes, bytes + 4);
}

std::vector<uint8_t> MakeFramePrefix(uint8_t header) {
    std::vector<uint8_t> frame{header};
    PushU16(frame, 0x0039);
    frame.insert(frame.end(), {0x19, 0x90, 0x00, 0x09, 0x10, 0x00, 0x7F, 0xFF, 0x37, 0x01, 0x01, 0x0C});
    return frame;
}

struct StatusFields {
    bool ignition{false};
    int32_t latitude{49148988};
    int32_t longitude{-123456789};
    std::optional<uint16_t> voltageMv;
};

std::vector<uint8_t> MakeStatusFrame(const StatusFields& fields) {
    auto frame = MakeFramePrefix(suntrack::kHeaderStatus);
    frame.push_back(0x01);
    frame.insert(frame.end(), {0x25, 0x11, 0x19, 0x23, 0x57, 0x15});
    PushU32(frame, 0x0001E240);
    frame.insert(frame.end(), {0x03, 0x10, 0x02, 0x60});
    PushU16(frame, 0x1A2B);
    frame.push_back(31);
    PushU32(frame, static_cast<uint32_t>(fields.latitude));
    PushU32(frame, static_cast<uint32_t>(fields.longitude));
    PushU16(frame, 0);
    PushU16(frame, 0);
    frame.insert(frame.end(), {9, 1});
    frame.push_back(fields.ignition ? 0x01 : 0x00);
    frame.insert(frame.end(), {0x00, 1, 2});
    PushU16(frame, 1);
    frame.push_back(0x00);
    PushU32(frame, fields.voltageMv ? 0x00000001U : 0U);
    if (fields.voltageMv) {
        PushU16(frame, *fields.voltageMv);
    }
    return frame;
}

// Scan frame with no sensor list and one tag address AC233F0000NN at offset 20
std::vector<uint8_t> MakeSingleTagFrame(uint8_t suffix) {
    auto frame = MakeFramePrefix(suntrack::kHeaderBeaconScan);
    frame.insert(frame.end(), {0x01, 0x01, 0x01, 0x00, 0x00});
    frame.insert(frame.end(), {0xAC, 0x23, 0x3F, 0x00, 0x00, suffix});
    frame.push_back(0xC8);
    return frame;
}

// Structured sensor list: one tag (battery 90, -60 dBm) and one non-target
std::vector<uint8_t> MakeStructuredScanFrame() {
    auto frame = MakeFramePrefix(suntrack::kHeaderBeaconScan);
    frame.insert(frame.end(), {0x01, 0x01, 0x01});
    PushU16(frame, 2);
    frame.insert(frame.end(), {0x25, 0x11, 0x19, 0x10, 0x20, 0x30});
    PushU32(frame, static_cast<uint32_t>(49148988));
    PushU32(frame, static_cast<uint32_t>(-2024842710));
    PushU16(frame, 11);
    frame.insert(frame.end(), {0x02, 0x01, 0x06, 0x07, 0x16, 0xE1, 0xFF, 0xA1, 0x08, 0x5A, 0x00});
    frame.insert(frame.end(), {0x3C, 0x2B, 0x5E, 0x3F, 0x23, 0xAC, 0xC4});
    PushU16(frame, 0);
    frame.insert(frame.end(), {0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0xB0});
    return frame;
}

suntrack::DecodedReport Decode(const std::vector<uint8_t>& frame) {
    static const suntrack::FrameDispatcher dispatcher;
    return dispatcher.Dispatch(frame.data(), frame.size());
}

class RecordingSink : public suntrack::EventSink {
public:
    void Write(const suntrack::BeaconScanEvent& event) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
    }

    std::vector<suntrack::BeaconScanEvent> Events() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<suntrack::BeaconScanEvent> m_events;
};

class ThrowingSink : public suntrack::EventSink {
public:
    void Write(const suntrack::BeaconScanEvent&) override {
        ++calls;
        throw std::runtime_error("disk full");
    }

    std::atomic<int> calls{0};
};

std::string MakeTempDirectory() {
    char pattern[] = "/tmp/suntrack_sink_XXXXXX";
    const char* dir = ::mkdtemp(pattern);
    REQUIRE(dir != nullptr);
    return dir;
}

} // namespace

// ============================================================================
// Session tracker: ignition
// ============================================================================

TEST_CASE("SessionTracker: First status report records ignition without an event") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto now = suntrack::WallClock::now();

    StatusFields fields;
    fields.ignition = true;
    const auto events = tracker.Apply(state, Decode(MakeStatusFrame(fields)), now);

    CHECK(events.empty());
    CHECK(state.currentIgnition == suntrack::IgnitionState::On);
    REQUIRE(state.previousIgnition.has_value());
    CHECK(*state.previousIgnition == suntrack::IgnitionState::On);
    CHECK(*state.latitude == doctest::Approx(49.148988));
    CHECK(*state.longitude == doctest::Approx(-123.456789));
}

TEST_CASE("SessionTracker: Ignition OFF to ON emits one change event") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    StatusFields off;
    off.voltageMv = 12600;
    StatusFields on = off;
    on.ignition = true;

    CHECK(tracker.Apply(state, Decode(MakeStatusFrame(off)), t0).empty());
    const auto events = tracker.Apply(state, Decode(MakeStatusFrame(on)), t0 + 1s);

    REQUIRE(events.size() == 1);
    const auto& event = events[0];
    CHECK(event.macId == "IGNITION_CHANGE");
    CHECK(event.isIgnitionChange);
    CHECK(event.ignitionStatus == suntrack::IgnitionState::On);
    CHECK(*event.previousStatus == suntrack::IgnitionState::Off);
    CHECK(*event.newStatus == suntrack::IgnitionState::On);
    CHECK(*event.inputVoltageMv == 12600);
    CHECK(*event.latitude == doctest::Approx(49.148988));
    CHECK(event.timestamp == t0 + 1s);
    CHECK(state.currentIgnition == suntrack::IgnitionState::On);
}

TEST_CASE("SessionTracker: Repeated ignition state emits nothing") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    StatusFields on;
    on.ignition = true;
    CHECK(tracker.Apply(state, Decode(MakeStatusFrame(on)), t0).empty());
    CHECK(tracker.Apply(state, Decode(MakeStatusFrame(on)), t0 + 1s).empty());
}

TEST_CASE("SessionTracker: Custom ignition marker") {
    suntrack::SessionTrackerConfig config;
    config.ignitionMarker = "IGN";
    suntrack::SessionTracker tracker(config);
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    StatusFields on;
    on.ignition = true;
    tracker.Apply(state, Decode(MakeStatusFrame(on)), t0);
    const auto events = tracker.Apply(state, Decode(MakeStatusFrame(StatusFields{})), t0 + 1s);
    REQUIRE(events.size() == 1);
    CHECK(events[0].macId == "IGN");
    CHECK(*events[0].newStatus == suntrack::IgnitionState::Off);
}

TEST_CASE("SessionTracker: Zero position does not overwrite the cached fix") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    tracker.Apply(state, Decode(MakeStatusFrame(StatusFields{})), t0);

    StatusFields zero;
    zero.latitude = 0;
    zero.longitude = 0;
    tracker.Apply(state, Decode(MakeStatusFrame(zero)), t0 + 1s);

    CHECK(*state.latitude == doctest::Approx(49.148988));
    CHECK(*state.longitude == doctest::Approx(-123.456789));
}

TEST_CASE("SessionTracker: Frame cut inside the longitude keeps the cached fix") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    state.latitude = 10.0;
    state.longitude = 20.0;

    // Latitude and one byte of longitude
    auto frame = MakeStatusFrame(StatusFields{});
    frame.resize(suntrack::kStatusLongitudeIndex + 1);
    REQUIRE(frame.size() == 38);

    const auto report = Decode(frame);
    const auto* status = std::get_if<suntrack::StatusReport>(&report);
    REQUIRE(status != nullptr);
    CHECK(status->gps.latitude == doctest::Approx(49.148988));
    CHECK_FALSE(status->positionPresent);

    tracker.Apply(state, report, suntrack::WallClock::now());
    CHECK(*state.latitude == doctest::Approx(10.0));
    CHECK(*state.longitude == doctest::Approx(20.0));

    // The complete frame does update it
    tracker.Apply(state, Decode(MakeStatusFrame(StatusFields{})), suntrack::WallClock::now());
    CHECK(*state.latitude == doctest::Approx(49.148988));
    CHECK(*state.longitude == doctest::Approx(-123.456789));
}

TEST_CASE("SessionTracker: Out-of-band voltage keeps the previous reading") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    StatusFields fields;
    fields.voltageMv = 13800;
    tracker.Apply(state, Decode(MakeStatusFrame(fields)), t0);
    fields.voltageMv = 30000;
    tracker.Apply(state, Decode(MakeStatusFrame(fields)), t0 + 1s);

    REQUIRE(state.inputVoltageMv.has_value());
    CHECK(*state.inputVoltageMv == 13800);
}

TEST_CASE("SessionTracker: Parse errors and unknown headers leave state alone") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto now = suntrack::WallClock::now();

    CHECK(tracker.Apply(state, Decode({0x81, 0x00}), now).empty());
    CHECK(tracker.Apply(state, Decode({0x42, 0x00, 0x01}), now).empty());
    CHECK_FALSE(state.previousIgnition.has_value());
    CHECK_FALSE(state.latitude.has_value());
    CHECK(state.lastSeen.empty());
}

// ============================================================================
// Session tracker: beacon sightings
// ============================================================================

TEST_CASE("SessionTracker: Sighting frequency is the time since the last sighting") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();
    const auto report = Decode(FromHex(kSampleScanHex));

    const auto first = tracker.Apply(state, report, t0);
    REQUIRE(first.size() == 3);
    for (const auto& event : first) {
        CHECK_FALSE(event.frequencySeconds.has_value());
        CHECK(event.sensorCountInMessage == 3);
        CHECK_FALSE(event.isIgnitionChange);
        CHECK(event.ignitionStatus == suntrack::IgnitionState::Off);
    }
    CHECK(first[0].macId == "AC:23:3F:5E:2B:3C");
    CHECK(first[2].macId == "C3:00:00:40:08:9D");
    CHECK(*first[2].rssi == -69);

    const auto second = tracker.Apply(state, report, t0 + 5s);
    REQUIRE(second.size() == 3);
    for (const auto& event : second) {
        REQUIRE(event.frequencySeconds.has_value());
        CHECK(*event.frequencySeconds == doctest::Approx(5.0));
    }
    CHECK(state.lastSeen.size() == 3);
    CHECK(state.lastSeen.at("AC:23:3F:5E:2B:3C") == t0 + 5s);
}

TEST_CASE("SessionTracker: Clock going backwards leaves frequency absent") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();
    const auto report = Decode(MakeSingleTagFrame(0x01));

    tracker.Apply(state, report, t0);
    const auto events = tracker.Apply(state, report, t0 - 2s);
    REQUIRE(events.size() == 1);
    CHECK_FALSE(events[0].frequencySeconds.has_value());

    CHECK_FALSE(suntrack::ElapsedSeconds(t0, t0).has_value());
    CHECK(*suntrack::ElapsedSeconds(t0, t0 + 1500ms) == doctest::Approx(1.5));
}

TEST_CASE("SessionTracker: Only target sightings become events") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto now = suntrack::WallClock::now();

    const auto events = tracker.Apply(state, Decode(MakeStructuredScanFrame()), now);
    REQUIRE(events.size() == 1);
    CHECK(events[0].macId == "AC:23:3F:5E:2B:3C");
    CHECK(events[0].sensorCountInMessage == 2);
    CHECK(*events[0].rssi == -60);
    CHECK(*events[0].batteryLevel == 90);
    CHECK(state.lastSeen.count("11:22:33:44:55:66") == 0);
}

TEST_CASE("SessionTracker: Sightings carry the cached status") {
    suntrack::SessionTracker tracker;
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    StatusFields fields;
    fields.ignition = true;
    fields.voltageMv = 14100;
    tracker.Apply(state, Decode(MakeStatusFrame(fields)), t0);

    const auto events = tracker.Apply(state, Decode(MakeSingleTagFrame(0x07)), t0 + 1s);
    REQUIRE(events.size() == 1);
    CHECK(events[0].macId == "AC:23:3F:00:00:07");
    CHECK(events[0].ignitionStatus == suntrack::IgnitionState::On);
    CHECK(*events[0].inputVoltageMv == 14100);
    CHECK(*events[0].latitude == doctest::Approx(49.148988));
    CHECK(*events[0].longitude == doctest::Approx(-123.456789));
}

TEST_CASE("SessionTracker: Last-seen map evicts the stalest address") {
    suntrack::SessionTrackerConfig config;
    config.maxTrackedDevices = 2;
    suntrack::SessionTracker tracker(config);
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    tracker.Apply(state, Decode(MakeSingleTagFrame(0x01)), t0);
    tracker.Apply(state, Decode(MakeSingleTagFrame(0x02)), t0 + 1s);
    tracker.Apply(state, Decode(MakeSingleTagFrame(0x01)), t0 + 2s);
    tracker.Apply(state, Decode(MakeSingleTagFrame(0x03)), t0 + 3s);

    CHECK(state.lastSeen.size() == 2);
    CHECK(state.lastSeen.count("AC:23:3F:00:00:01") == 1);
    CHECK(state.lastSeen.count("AC:23:3F:00:00:02") == 0);
    CHECK(state.lastSeen.count("AC:23:3F:00:00:03") == 1);
}

TEST_CASE("SessionTracker: Address added after a clock step back survives eviction") {
    suntrack::SessionTrackerConfig config;
    config.maxTrackedDevices = 2;
    suntrack::SessionTracker tracker(config);
    suntrack::DeviceSessionState state;
    const auto t0 = suntrack::WallClock::now();

    tracker.Apply(state, Decode(MakeSingleTagFrame(0x01)), t0);
    tracker.Apply(state, Decode(MakeSingleTagFrame(0x02)), t0 + 1s);
    tracker.Apply(state, Decode(MakeSingleTagFrame(0x03)), t0 - 10s);

    CHECK(state.lastSeen.size() == 2);
    CHECK(state.lastSeen.count("AC:23:3F:00:00:01") == 0);
    CHECK(state.lastSeen.count("AC:23:3F:00:00:02") == 1);
    CHECK(state.lastSeen.count("AC:23:3F:00:00:03") == 1);

    const auto events = tracker.Apply(state, Decode(MakeSingleTagFrame(0x03)), t0 - 5s);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].frequencySeconds.has_value());
    CHECK(*events[0].frequencySeconds == doctest::Approx(5.0));
}

// ============================================================================
// Bounded history
// ============================================================================

TEST_CASE("BoundedHistory: Oldest entry is evicted past the cap") {
    suntrack::BoundedHistory<int> history(suntrack::kReportHistoryCapacity);
    for (int i = 0; i <= 1000; ++i) {
        history.Append(i);
    }

    const auto snapshot = history.Snapshot();
    REQUIRE(snapshot.size() == 1000);
    CHECK(snapshot.front() == 1);
    CHECK(snapshot.back() == 1000);
    CHECK(history.GetMetrics().appended == 1001);
    CHECK(history.GetMetrics().evicted == 1);
}

TEST_CASE("BoundedHistory: Snapshot is a copy") {
    suntrack::BoundedHistory<std::string> history(3);
    const std::vector<std::string> batch{"a", "b", "c", "d"};
    history.AppendRange(batch.begin(), batch.end());

    auto snapshot = history.Snapshot();
    CHECK(snapshot == std::vector<std::string>{"b", "c", "d"});
    snapshot.clear();
    CHECK(history.Size() == 3);

    history.Clear();
    CHECK(history.Empty());
    CHECK(history.Capacity() == 3);
}

// ============================================================================
// Gateway
// ============================================================================

TEST_CASE("TelemetryGateway: Report, session and events are updated together") {
    suntrack::TelemetryGateway gateway;
    const auto t0 = suntrack::WallClock::now();

    StatusFields fields;
    fields.ignition = true;
    const auto status = MakeStatusFrame(fields);
    const auto scan = FromHex(kSampleScanHex);
    const std::vector<uint8_t> garbage{0x00, 0x01, 0x02};

    gateway.ProcessFrame(status.data(), status.size(), t0);
    const auto decoded = gateway.ProcessFrame(scan.data(), scan.size(), t0 + 1s);
    gateway.ProcessFrame(garbage.data(), garbage.size(), t0 + 2s);

    CHECK(std::holds_alternative<suntrack::BeaconScanReport>(decoded));

    const auto reports = gateway.SnapshotReports();
    REQUIRE(reports.size() == 3);
    CHECK(std::holds_alternative<suntrack::StatusReport>(reports[0].report));
    CHECK(std::holds_alternative<suntrack::BeaconScanReport>(reports[1].report));
    CHECK(std::holds_alternative<suntrack::UnknownHeader>(reports[2].report));
    CHECK(reports[1].receivedAt == t0 + 1s);

    const auto events = gateway.SnapshotEvents();
    REQUIRE(events.size() == 3);
    CHECK(events[0].ignitionStatus == suntrack::IgnitionState::On);

    const auto state = gateway.CurrentSessionState();
    CHECK(state.currentIgnition == suntrack::IgnitionState::On);
    CHECK(state.lastSeen.size() == 3);

    const auto metrics = gateway.GetMetrics();
    CHECK(metrics.framesReceived == 3);
    CHECK(metrics.statusReports == 1);
    CHECK(metrics.beaconScanReports == 1);
    CHECK(metrics.unknownHeaders == 1);
    CHECK(metrics.parseErrors == 0);
    CHECK(metrics.eventsEmitted == 3);
}

TEST_CASE("TelemetryGateway: History capacities are configurable") {
    suntrack::GatewayConfig config;
    config.reportHistoryCapacity = 2;
    config.eventHistoryCapacity = 4;
    suntrack::TelemetryGateway gateway(config);
    const auto scan = FromHex(kSampleScanHex);

    for (int i = 0; i < 3; ++i) {
        gateway.ProcessFrame(scan.data(), scan.size());
    }

    CHECK(gateway.SnapshotReports().size() == 2);
    CHECK(gateway.SnapshotEvents().size() == 4);
    CHECK(gateway.GetMetrics().reportsEvicted == 1);
    CHECK(gateway.GetMetrics().eventsEvicted == 5);
}

TEST_CASE("TelemetryGateway: Events reach the sink in order") {
    auto sink = std::make_shared<RecordingSink>();
    suntrack::TelemetryGateway gateway({}, sink);
    const auto scan = FromHex(kSampleScanHex);

    gateway.ProcessFrame(scan.data(), scan.size());

    const auto forwarded = sink->Events();
    REQUIRE(forwarded.size() == 3);
    CHECK(forwarded[0].macId == "AC:23:3F:5E:2B:3C");
    CHECK(forwarded[1].macId == "AC:23:3F:75:A7:EF");
    CHECK(forwarded[2].macId == "C3:00:00:40:08:9D");
}

TEST_CASE("TelemetryGateway: Failing sink does not lose events") {
    auto sink = std::make_shared<ThrowingSink>();
    suntrack::TelemetryGateway gateway({}, sink);
    const auto scan = FromHex(kSampleScanHex);

    gateway.ProcessFrame(scan.data(), scan.size());

    CHECK(sink->calls.load() == 3);
    CHECK(gateway.SnapshotEvents().size() == 3);
    CHECK(gateway.GetMetrics().sinkFailures == 3);
}

TEST_CASE("TelemetryGateway: Concurrent frames are all recorded") {
    suntrack::TelemetryGateway gateway;
    const auto scan = FromHex(kSampleScanHex);
    constexpr int kThreads = 4;
    constexpr int kFramesPerThread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < kFramesPerThread; ++i) {
                gateway.ProcessFrame(scan.data(), scan.size());
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto metrics = gateway.GetMetrics();
    CHECK(metrics.framesReceived == kThreads * kFramesPerThread);
    CHECK(metrics.eventsEmitted == 3 * kThreads * kFramesPerThread);
    CHECK(gateway.SnapshotReports().size() == kThreads * kFramesPerThread);
    CHECK(gateway.SnapshotEvents().size() == 3 * kThreads * kFramesPerThread);
    CHECK(gateway.CurrentSessionState().lastSeen.size() == 3);
}

// ============================================================================
// Daily log sink and JSON
// ============================================================================

TEST_CASE("DailyLogSink: Writes one JSON line per event to the day file") {
    const std::string dir = MakeTempDirectory();
    suntrack::DailyLogSinkConfig config;
    config.directory = dir;
    config.filePrefix = "scans";
    suntrack::DailyLogSink sink(config);

    suntrack::BeaconScanEvent event;
    event.timestamp = suntrack::WallClock::now();
    event.macId = "AC:23:3F:5E:2B:3C";
    event.rssi = -60;
    event.sensorCountInMessage = 2;
    sink.Write(event);
    event.macId = "AC:23:3F:75:A7:EF";
    event.frequencySeconds = 5.0;
    sink.Write(event);
    CHECK(sink.LinesWritten() == 2);

    const std::string path = sink.PathFor(event.timestamp);
    CHECK(path == dir + "/scans_" + suntrack::FormatCalendarDay(event.timestamp) + ".jsonl");

    std::ifstream in(path);
    REQUIRE(in.is_open());
    std::vector<nlohmann::json> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    in.close();

    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["mac_id"] == "AC:23:3F:5E:2B:3C");
    CHECK(lines[0]["rssi"] == -60);
    CHECK(lines[0]["frequency_seconds"].is_null());
    CHECK(lines[0]["ignition_status"] == "OFF");
    CHECK(lines[1]["frequency_seconds"] == 5.0);
    CHECK(lines[1].contains("is_ignition_change") == false);

    std::remove(path.c_str());
    ::rmdir(dir.c_str());
}

TEST_CASE("DailyLogSink: Unwritable directory is reported to the gateway") {
    suntrack::DailyLogSinkConfig config;
    config.directory = "/nonexistent_suntrack_root/logs";
    auto sink = std::make_shared<suntrack::DailyLogSink>(config);

    suntrack::BeaconScanEvent event;
    event.timestamp = suntrack::WallClock::now();
    event.macId = "AC:23:3F:5E:2B:3C";
    CHECK_THROWS_AS(sink->Write(event), std::runtime_error);

    suntrack::TelemetryGateway gateway({}, sink);
    const auto frame = MakeSingleTagFrame(0x09);
    gateway.ProcessFrame(frame.data(), frame.size());
    CHECK(gateway.GetMetrics().sinkFailures == 1);
    CHECK(gateway.SnapshotEvents().size() == 1);
}

TEST_CASE("DailyLogSink: Failed write is logged without errno") {
    if (::access("/dev/full", W_OK) != 0) {
        MESSAGE("/dev/full not available, skipping");
        return;
    }
    const std::string dir = MakeTempDirectory();
    suntrack::DailyLogSinkConfig config;
    config.directory = dir;
    suntrack::DailyLogSink sink(config);

    suntrack::BeaconScanEvent event;
    event.timestamp = suntrack::WallClock::now();
    event.macId = "AC:23:3F:5E:2B:3C";

    // Day file opens fine but every write hits ENOSPC
    const std::string path = sink.PathFor(event.timestamp);
    REQUIRE(::symlink("/dev/full", path.c_str()) == 0);

    std::ostringstream captured;
    std::streambuf* original = std::cerr.rdbuf(captured.rdbuf());
    bool threw = false;
    try {
        sink.Write(event);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    std::cerr.rdbuf(original);

    CHECK(threw);
    CHECK(sink.LinesWritten() == 0);
    const std::string logged = captured.str();
    CHECK(logged.find("[EventLog] error: write failed") != std::string::npos);
    CHECK(logged.find("errno") == std::string::npos);

    std::remove(path.c_str());
    ::rmdir(dir.c_str());
}

TEST_CASE("ReportJson: Ignition events and session state") {
    suntrack::BeaconScanEvent event;
    event.timestamp = suntrack::WallClock::now();
    event.macId = "IGNITION_CHANGE";
    event.ignitionStatus = suntrack::IgnitionState::On;
    event.isIgnitionChange = true;
    event.previousStatus = suntrack::IgnitionState::Off;
    event.newStatus = suntrack::IgnitionState::On;

    auto json = suntrack::ToJson(event);
    CHECK(json["is_ignition_change"] == true);
    CHECK(json["previous_status"] == "OFF");
    CHECK(json["new_status"] == "ON");
    CHECK(json["timestamp"].get<std::string>().size() == 26);

    suntrack::DeviceSessionState state;
    state.latitude = 49.1;
    state.lastSeen["AC:23:3F:5E:2B:3C"] = event.timestamp;
    json = suntrack::ToJson(state);
    CHECK(json["current_ignition_status"] == "OFF");
    CHECK(json["previous_ignition_status"].is_null());
    CHECK(json["current_latitude"] == 49.1);
    CHECK(json["current_longitude"].is_null());
    CHECK(json["last_seen"].size() == 1);
}
