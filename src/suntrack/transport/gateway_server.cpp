#include "suntrack/transport/gateway_server.h"

#include "suntrack/transport/connection_handler.h"

#include <iostream>
#include <utility>

namespace suntrack {

namespace {
/// Pause after a failed accept that did not come from Stop()
constexpr auto kAcceptRetryDelay = std::chrono::milliseconds(100);
} // namespace

GatewayServer::GatewayServer(TelemetryGateway& gateway, ServerConfig config)
    : m_gateway(gateway),
      m_config(config),
      m_listener(m_config.port, m_config.backlog) {}

GatewayServer::~GatewayServer() {
    Stop();
}

void GatewayServer::Run() {
    if (!m_listener.IsValid()) {
        std::cerr << "[Server] listener on port " << m_config.port << " is not valid" << std::endl;
        return;
    }
    std::cout << "[Server] listening on port " << m_listener.Port() << std::endl;

    while (!m_stopping.load()) {
        std::unique_ptr<TcpConnection> accepted = m_listener.Accept(m_config.idleTimeout);
        if (!accepted) {
            if (m_stopping.load() || m_listener.IsClosed()) {
                break;
            }
            std::this_thread::sleep_for(kAcceptRetryDelay);
            continue;
        }

        std::shared_ptr<TcpConnection> connection = std::move(accepted);
        auto done = std::make_shared<std::atomic<bool>>(false);

        {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            if (m_stopping.load()) {
                connection->Shutdown();
                break;
            }
            ++m_accepted;
            if (m_config.logFrames) {
                std::cout << "[Server] connection from " << connection->PeerAddress() << std::endl;
            }

            Worker worker;
            worker.connection = connection;
            worker.done = done;
            worker.thread = std::thread([this, connection, done]() {
                ConnectionHandler handler(m_gateway, *connection, m_config.receiveBufferSize,
                                          m_config.logFrames);
                handler.Run();
                // The server keeps a reference until reaping; send FIN now
                connection->Shutdown();
                if (m_config.logFrames) {
                    std::cout << "[Server] connection " << connection->PeerAddress() << " closed ("
                              << ToString(connection->State()) << ", " << handler.FramesHandled()
                              << " frames)" << std::endl;
                }
                done->store(true);
            });
            m_workers.push_back(std::move(worker));
        }

        ReapFinished();
    }
}

void GatewayServer::Stop() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        m_stopping.store(true);
        workers.swap(m_workers);
    }

    m_listener.Close();
    for (auto& worker : workers) {
        worker.connection->Shutdown();
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::size_t GatewayServer::ActiveWorkers() const {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    std::size_t active = 0;
    for (const auto& worker : m_workers) {
        if (!worker.done->load()) {
            ++active;
        }
    }
    return active;
}

/**
 * @brief Joins and drops workers whose connection has ended.
 */
void GatewayServer::ReapFinished() {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace suntrack
