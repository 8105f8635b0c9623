#pragma once

#include "ITransport.hpp"
#include "RequestDispatcher.hpp"
#include "ToolRegistry.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace sf_boost {

using json = nlohmann::json;

/**
 * @brief MCP Server implementing JSON-RPC 2.0 over a line transport
 *
 * Owns the transport and the (read-only) tool registry. Each input line is
 * decoded, dispatched and answered with exactly one response line; blank
 * lines are skipped. Failures on one line never end the loop, only end of
 * input or stop() does.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server
     * @param transport Unique pointer to transport implementation
     * @param registry Fully populated tool registry
     * @param identity Values reported by initialize
     */
    MCPServer(std::unique_ptr<ITransport> transport, ToolRegistry registry,
              ServerIdentity identity);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the input ends.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     */
    void stop();

    /**
     * @brief Decode and dispatch one input line
     * @return Response envelope; never throws
     */
    json handle_line(const std::string& line) const;

    const ToolRegistry& registry() const { return registry_; }

private:
    /**
     * @brief Encode and write a response
     *
     * Falls back to an internal-error envelope when the response cannot be
     * serialized.
     */
    void send(const json& response);

    std::unique_ptr<ITransport> transport_;
    const ToolRegistry registry_;
    RequestDispatcher dispatcher_;
    std::atomic<bool> running_{false};
};

} // namespace sf_boost
