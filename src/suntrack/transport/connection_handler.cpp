#include "suntrack/transport/connection_handler.h"

#include "suntrack/codec.h"

#include <algorithm>
#include <iostream>

namespace suntrack {

namespace {
/// Bytes of each frame echoed to the console
constexpr std::size_t kLoggedPrefixBytes = 20;
} // namespace

ConnectionHandler::ConnectionHandler(TelemetryGateway& gateway, DuplexAdapter& adapter,
                                     std::size_t receiveBufferSize, bool logFrames)
    : m_gateway(gateway), m_adapter(adapter), m_logFrames(logFrames) {
    m_rxScratch.resize(receiveBufferSize > 0 ? receiveBufferSize : 1);
}

bool ConnectionHandler::PollOnce() {
    const std::size_t received = m_adapter.ReceiveChunk(m_rxScratch.data(), m_rxScratch.size());
    if (received == 0) {
        return false;
    }

    const DecodedReport report = m_gateway.ProcessFrame(m_rxScratch.data(), received);
    ++m_framesHandled;
    if (m_logFrames) {
        LogFrame(report, received);
    }

    return m_adapter.SendBytes(m_rxScratch.data(), received);
}

void ConnectionHandler::Run() {
    while (PollOnce()) {
    }
}

void ConnectionHandler::LogFrame(const DecodedReport& report, std::size_t length) const {
    const std::size_t shown = std::min(length, kLoggedPrefixBytes);
    std::cout << "[Server] received " << length << " bytes: "
              << ToHex(m_rxScratch.data(), shown) << (length > shown ? "..." : "")
              << " -> " << ReportKind(report) << std::endl;
}

} // namespace suntrack
