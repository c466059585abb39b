#pragma once

#include "suntrack/transport/adapter.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <netinet/in.h>
#include <string>

namespace suntrack {

/// Why a connection stopped delivering bytes
enum class ConnectionState {
    Open,
    PeerClosed,
    TimedOut,
    Error,
};

const char* ToString(ConnectionState state);

/**
 * @brief One accepted (or connected) TCP stream with blocking reads.
 *
 * Reads block for at most the idle timeout; a read that times out ends the
 * stream with ConnectionState::TimedOut. The socket is closed on destruction.
 *
 * Shutdown() may be called from another thread to unblock a pending read.
 */
class TcpConnection : public DuplexAdapter {
public:
    TcpConnection(int socket, const sockaddr_in& peer, std::chrono::milliseconds idleTimeout);
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    /// Client side: connect to ip:port. Returns nullptr on failure.
    static std::unique_ptr<TcpConnection> Connect(const char* ip, uint16_t port,
                                                  std::chrono::milliseconds idleTimeout);

    bool SendBytes(const uint8_t* data, std::size_t length) override;
    std::size_t ReceiveChunk(uint8_t* buffer, std::size_t maxLength) override;

    ConnectionState State() const { return m_state.load(); }
    bool IsOpen() const { return m_state.load() == ConnectionState::Open; }

    /// Shut down both directions; pending and future reads return 0
    void Shutdown();

    /// "a.b.c.d:port"
    const std::string& PeerAddress() const { return m_peerAddress; }

private:
    void LogError(const char* message);

    int m_socket{-1};
    std::string m_peerAddress;
    std::atomic<ConnectionState> m_state{ConnectionState::Open};
    std::chrono::steady_clock::time_point m_lastErrorLog{};
};

/**
 * @brief Listening TCP socket with a blocking Accept.
 *
 * Port 0 binds an ephemeral port; Port() reports the bound port.
 * Close() may be called from another thread to unblock Accept().
 */
class TcpListener {
public:
    explicit TcpListener(uint16_t port, int backlog = 5);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    bool IsValid() const { return m_socket >= 0; }
    uint16_t Port() const { return m_port; }

    /**
     * @brief Block until a client connects.
     * @param idleTimeout Read timeout applied to the accepted connection
     * @return The connection, or nullptr once the listener is closed or on error
     */
    std::unique_ptr<TcpConnection> Accept(std::chrono::milliseconds idleTimeout);

    void Close();
    bool IsClosed() const { return m_closed.load(); }

private:
    void LogError(const char* message);

    int m_socket{-1};
    uint16_t m_port{0};
    std::atomic<bool> m_closed{false};
    std::chrono::steady_clock::time_point m_lastErrorLog{};
};

} // namespace suntrack
