#pragma once

#include <optional>
#include <string>

namespace sf_boost {

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Implementations move newline-delimited JSON-RPC text. Framing lives here,
 * JSON handling lives in MessageCodec.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next line from the transport
     * @return Line without its terminator, or std::nullopt on end of input
     */
    virtual std::optional<std::string> read_line() = 0;

    /**
     * @brief Write one line and flush it to the peer
     * @param line Serialized message without trailing newline
     */
    virtual void write_line(const std::string& line) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace sf_boost
