#pragma once

#include "MessageCodec.hpp"
#include "ToolRegistry.hpp"
#include <string>

namespace sf_boost {

/**
 * @brief Identity reported by initialize, fixed for the process lifetime
 */
struct ServerIdentity {
    std::string name;
    std::string version;
    std::string protocol_version;
};

/**
 * @brief Routes decoded requests to the MCP protocol methods
 *
 * Supports initialize, tools/list, tools/call and ping. Holds no state of its
 * own: every response is a function of the request and the registry.
 */
class RequestDispatcher {
public:
    /**
     * @param registry Tool registry; must outlive the dispatcher
     * @param identity Server name, version and protocol version
     */
    RequestDispatcher(const ToolRegistry& registry, ServerIdentity identity);

    /**
     * @brief Produce the response envelope for a request
     *
     * Never throws for tool failures: they become -32603 error envelopes.
     */
    json dispatch(const Request& request) const;

    /**
     * @brief Convert a tool's return value into MCP content items
     *
     * - string: one text item
     * - object with a "content" list: that list as-is
     * - anything else: pretty-printed JSON in one text item
     */
    static json normalize_tool_result(const json& result);

    const ServerIdentity& identity() const { return identity_; }

private:
    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info, only logged
     */
    json handle_initialize(const json& params) const;

    /**
     * @brief Handle tools/list method
     */
    json handle_tools_list() const;

    /**
     * @brief Handle tools/call method
     * @throws ProtocolError with kInvalidParams when the tool is unknown
     */
    json handle_tools_call(const json& id, const json& params) const;

    const ToolRegistry& registry_;
    ServerIdentity identity_;
};

} // namespace sf_boost
