#pragma once

#include "suntrack/gateway.h"
#include "suntrack/transport/tcp_posix.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace suntrack {

struct ServerConfig {
    uint16_t port{18160};                              ///< 0 binds an ephemeral port
    int backlog{5};
    std::chrono::milliseconds idleTimeout{std::chrono::seconds(60)};
    std::size_t receiveBufferSize{1024};               ///< Upper bound on one frame
    bool logFrames{true};                              ///< Print each received frame to stdout
};

/**
 * @brief TCP front end: one blocking accept loop, one worker thread per connection.
 *
 * Run() never waits on a worker. Finished workers are joined after each
 * accept. Stop() closes the listener, shuts down every live connection and
 * joins all workers, so no worker is still inside the gateway when Stop()
 * returns.
 *
 * Usage:
 *   TelemetryGateway gateway(MakeGatewayConfig());
 *   GatewayServer server(gateway, ServerConfig{});
 *   std::thread acceptor([&] { server.Run(); });
 *   ...
 *   server.Stop();
 *   acceptor.join();
 */
class GatewayServer {
public:
    GatewayServer(TelemetryGateway& gateway, ServerConfig config = {});
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    bool IsValid() const { return m_listener.IsValid(); }
    uint16_t Port() const { return m_listener.Port(); }

    /// Accept loop; returns after Stop() or if the listener is invalid
    void Run();

    /// Thread-safe; idempotent
    void Stop();

    std::size_t ActiveWorkers() const;
    uint64_t ConnectionsAccepted() const { return m_accepted.load(); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<TcpConnection> connection;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void ReapFinished();

    TelemetryGateway& m_gateway;
    ServerConfig m_config;
    TcpListener m_listener;

    mutable std::mutex m_workersMutex; // Guards m_workers and m_stopping transitions
    std::list<Worker> m_workers;
    std::atomic<bool> m_stopping{false};
    std::atomic<uint64_t> m_accepted{0};
};

} // namespace suntrack
