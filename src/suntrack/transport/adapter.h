#pragma once

#include <cstddef>
#include <cstdint>

namespace suntrack {

/**
 * @brief Interface for sending raw bytes over a transport.
 */
class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    /**
     * @brief Send bytes over the transport.
     * @param data Pointer to data buffer
     * @param length Number of bytes to send
     * @return true if every byte was sent, false on error
     */
    virtual bool SendBytes(const uint8_t* data, std::size_t length) = 0;
};

/**
 * @brief Interface for receiving raw bytes from a transport.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Receive the next chunk (one read) from the transport.
     *
     * May block up to the transport's idle timeout.
     *
     * @param buffer Destination buffer
     * @param maxLength Maximum bytes to read
     * @return Number of bytes read; 0 once the stream has ended (peer
     *         closed, timed out or failed)
     */
    virtual std::size_t ReceiveChunk(uint8_t* buffer, std::size_t maxLength) = 0;
};

/**
 * @brief Combined send/receive interface for bidirectional transports.
 */
class DuplexAdapter : public ByteWriter, public ByteStream {
public:
    ~DuplexAdapter() override = default;
};

} // namespace suntrack
