#pragma once

#include "suntrack/gateway.h"
#include "suntrack/transport/adapter.h"

#include <cstdint>
#include <vector>

namespace suntrack {

/**
 * @brief Drives a TelemetryGateway from one transport connection.
 *
 * Each chunk read from the adapter is treated as one frame: it is handed
 * to the gateway and then echoed back unmodified, whatever the decode
 * outcome. No bytes are carried from one read to the next.
 *
 * Usage:
 *   TelemetryGateway gateway;
 *   auto connection = listener.Accept(std::chrono::seconds(60));
 *   ConnectionHandler handler(gateway, *connection);
 *   handler.Run();   // returns on disconnect, error or idle timeout
 */
class ConnectionHandler {
public:
    ConnectionHandler(TelemetryGateway& gateway, DuplexAdapter& adapter,
                      std::size_t receiveBufferSize = 1024, bool logFrames = false);

    /**
     * @brief Read, ingest and echo one frame.
     * @return false once the stream has ended or the echo failed
     */
    bool PollOnce();

    /// Poll until the stream ends
    void Run();

    uint64_t FramesHandled() const { return m_framesHandled; }

private:
    void LogFrame(const DecodedReport& report, std::size_t length) const;

    TelemetryGateway& m_gateway;
    DuplexAdapter& m_adapter;
    std::vector<uint8_t> m_rxScratch;
    bool m_logFrames;
    uint64_t m_framesHandled{0};
};

} // namespace suntrack
