/**
 * @file tcp_posix.cpp
 * @brief TCP listener and connection implementation for POSIX systems.
 *
 * The gateway runs one blocking worker per accepted connection, so sockets
 * stay in blocking mode; SO_RCVTIMEO provides the idle timeout.
 *
 * @note This implementation is for Linux/POSIX systems only.
 */
#include "suntrack/transport/tcp_posix.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace suntrack {

namespace {
/// @brief Minimum interval between error log messages to prevent spam.
constexpr auto kLogThrottle = std::chrono::seconds(1);

std::string FormatPeer(const sockaddr_in& peer) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip))) {
        return "unknown";
    }
    return std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));
}

/**
 * @brief Applies the idle timeout as the socket receive timeout.
 *
 * A zero timeout leaves reads blocking indefinitely.
 */
bool ApplyReceiveTimeout(int sock, std::chrono::milliseconds idleTimeout) {
    if (idleTimeout.count() <= 0) {
        return true;
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(idleTimeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((idleTimeout.count() % 1000) * 1000);
    return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}
} // namespace

const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Open: return "open";
        case ConnectionState::PeerClosed: return "peer_closed";
        case ConnectionState::TimedOut: return "timed_out";
        case ConnectionState::Error: return "error";
    }
    return "unknown";
}

// ============================================================================
// TcpConnection
// ============================================================================

TcpConnection::TcpConnection(int socket, const sockaddr_in& peer, std::chrono::milliseconds idleTimeout)
    : m_socket(socket), m_peerAddress(FormatPeer(peer)) {
    int yes = 1;
    if (setsockopt(m_socket, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) < 0) {
        LogError("setsockopt(TCP_NODELAY)");
    }
    if (!ApplyReceiveTimeout(m_socket, idleTimeout)) {
        LogError("setsockopt(SO_RCVTIMEO)");
    }
}

TcpConnection::~TcpConnection() {
    if (m_socket >= 0) {
        ::close(m_socket);
    }
}

std::unique_ptr<TcpConnection> TcpConnection::Connect(const char* ip, uint16_t port,
                                                      std::chrono::milliseconds idleTimeout) {
    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(port);
    if (inet_pton(AF_INET, ip, &target.sin_addr) <= 0) {
        std::cerr << "TCP connection error: inet_pton (invalid target IP) " << ip << std::endl;
        return nullptr;
    }

    const int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        std::cerr << "TCP connection error: socket errno=" << errno << std::endl;
        return nullptr;
    }
    if (::connect(sock, reinterpret_cast<sockaddr*>(&target), sizeof(target)) < 0) {
        std::cerr << "TCP connection error: connect errno=" << errno << std::endl;
        ::close(sock);
        return nullptr;
    }
    return std::make_unique<TcpConnection>(sock, target, idleTimeout);
}

/**
 * @brief Sends every byte, retrying on partial writes.
 *
 * MSG_NOSIGNAL keeps a vanished peer from raising SIGPIPE.
 */
bool TcpConnection::SendBytes(const uint8_t* data, std::size_t length) {
    if (m_socket < 0 || !IsOpen()) {
        return false;
    }

    std::size_t sent = 0;
    while (sent < length) {
        const ssize_t result = ::send(m_socket, data + sent, length - sent, MSG_NOSIGNAL);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            LogError("send");
            m_state.store(ConnectionState::Error);
            return false;
        }
        sent += static_cast<std::size_t>(result);
    }
    return true;
}

/**
 * @brief Blocks for the next chunk, up to the idle timeout.
 *
 * Returns 0 and updates State() when the peer closes, the timeout expires,
 * or recv fails.
 */
std::size_t TcpConnection::ReceiveChunk(uint8_t* buffer, std::size_t maxLength) {
    if (m_socket < 0 || !IsOpen() || maxLength == 0) {
        return 0;
    }

    for (;;) {
        const ssize_t result = ::recv(m_socket, buffer, maxLength, 0);
        if (result > 0) {
            return static_cast<std::size_t>(result);
        }
        if (result == 0) {
            m_state.store(ConnectionState::PeerClosed);
            return 0;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            m_state.store(ConnectionState::TimedOut);
            return 0;
        }
        LogError("recv");
        m_state.store(ConnectionState::Error);
        return 0;
    }
}

void TcpConnection::Shutdown() {
    if (m_socket >= 0) {
        ::shutdown(m_socket, SHUT_RDWR);
    }
}

/**
 * @brief Logs an error message with throttling.
 *
 * Only logs once per kLogThrottle interval.
 */
void TcpConnection::LogError(const char* message) {
    const auto now = std::chrono::steady_clock::now();
    if (now - m_lastErrorLog < kLogThrottle) {
        return;
    }
    m_lastErrorLog = now;
    std::cerr << "TCP connection error (" << m_peerAddress << "): " << message
              << " errno=" << errno << std::endl;
}

// ============================================================================
// TcpListener
// ============================================================================

/**
 * @brief Binds and listens on all interfaces.
 *
 * On failure the listener is left invalid (IsValid() == false).
 */
TcpListener::TcpListener(uint16_t port, int backlog) {
    m_socket = ::socket(AF_INET, SOCK_STREAM, 0);
    if (m_socket < 0) {
        LogError("socket");
        return;
    }

    int yes = 1;
    if (setsockopt(m_socket, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        LogError("setsockopt(SO_REUSEADDR)");
    }

    sockaddr_in bindAddr{};
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_port = htons(port);
    bindAddr.sin_addr.s_addr = INADDR_ANY;

    if (bind(m_socket, reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) < 0) {
        LogError("bind");
        ::close(m_socket);
        m_socket = -1;
        return;
    }

    if (listen(m_socket, backlog) < 0) {
        LogError("listen");
        ::close(m_socket);
        m_socket = -1;
        return;
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(m_socket, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        m_port = ntohs(bound.sin_port);
    } else {
        LogError("getsockname");
        m_port = port;
    }
}

TcpListener::~TcpListener() {
    Close();
    if (m_socket >= 0) {
        ::close(m_socket);
    }
}

std::unique_ptr<TcpConnection> TcpListener::Accept(std::chrono::milliseconds idleTimeout) {
    while (m_socket >= 0 && !m_closed.load()) {
        sockaddr_in peer{};
        socklen_t peerLen = sizeof(peer);
        const int client = ::accept(m_socket, reinterpret_cast<sockaddr*>(&peer), &peerLen);
        if (client >= 0) {
            if (m_closed.load()) {
                ::close(client);
                return nullptr;
            }
            return std::make_unique<TcpConnection>(client, peer, idleTimeout);
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (!m_closed.load()) {
            LogError("accept");
        }
        return nullptr;
    }
    return nullptr;
}

/**
 * @brief Stops accepting.
 *
 * shutdown() wakes a thread blocked in accept(); the descriptor itself is
 * released by the destructor so it cannot be reused under that thread.
 */
void TcpListener::Close() {
    if (m_closed.exchange(true)) {
        return;
    }
    if (m_socket >= 0) {
        ::shutdown(m_socket, SHUT_RDWR);
    }
}

void TcpListener::LogError(const char* message) {
    const auto now = std::chrono::steady_clock::now();
    if (now - m_lastErrorLog < kLogThrottle) {
        return;
    }
    m_lastErrorLog = now;
    std::cerr << "TCP listener error: " << message << " errno=" << errno << std::endl;
}

} // namespace suntrack
