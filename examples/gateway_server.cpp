#include "suntrack/daily_log_sink.h"
#include "suntrack/gateway.h"
#include "suntrack/transport/gateway_server.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace std::chrono_literals;

std::atomic<bool> g_running{true};

void SignalHandler(int) {
    g_running = false;
}

suntrack::GatewayConfig MakeGatewayConfig() {
    suntrack::GatewayConfig config;
    if (const char* prefixes = std::getenv("SUNTRACK_TARGET_PREFIXES")) {
        config.dispatcher.targets = suntrack::TargetPrefixSet::Parse(prefixes);
    }
    config.session.maxTrackedDevices = 4096;
    config.reportHistoryCapacity = suntrack::kReportHistoryCapacity;
    config.eventHistoryCapacity = suntrack::kEventHistoryCapacity;
    return config;
}

int main() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    const suntrack::GatewayConfig gatewayConfig = MakeGatewayConfig();

    std::cout << "[Server] Suntech telemetry gateway\n";
    std::cout << "[Server] Target prefixes:";
    for (const auto& prefix : gatewayConfig.dispatcher.targets.Prefixes()) {
        std::cout << " " << prefix;
    }
    std::cout << "\n[Server] Press Ctrl+C to stop.\n\n";

    auto sink = std::make_shared<suntrack::DailyLogSink>(suntrack::DailyLogSinkConfig{});
    suntrack::TelemetryGateway gateway(gatewayConfig, sink);

    suntrack::ServerConfig serverConfig;
    suntrack::GatewayServer server(gateway, serverConfig);
    if (!server.IsValid()) {
        std::cerr << "[Server] failed to listen on port " << serverConfig.port << std::endl;
        return 1;
    }

    std::thread acceptor([&server]() { server.Run(); });

    auto lastReport = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(200ms);

        const auto now = std::chrono::steady_clock::now();
        if (now - lastReport >= 30s) {
            lastReport = now;
            const auto metrics = gateway.GetMetrics();
            std::cout << "[Server] frames=" << metrics.framesReceived
                      << " status=" << metrics.statusReports
                      << " scans=" << metrics.beaconScanReports
                      << " parse_errors=" << metrics.parseErrors
                      << " unknown=" << metrics.unknownHeaders
                      << " events=" << metrics.eventsEmitted
                      << " sink_failures=" << metrics.sinkFailures
                      << " workers=" << server.ActiveWorkers() << std::endl;
        }
    }

    std::cout << "\n[Server] Shutting down...\n";
    server.Stop();
    acceptor.join();
    std::cout << "[Server] " << sink->LinesWritten() << " events written to the daily log\n";
    return 0;
}
