#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace sf_boost {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool, as published by tools/list
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return Plain string or structured JSON result
 * @throws std::exception (usually ToolError) when the call fails
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief Registered tool: published metadata plus its handler
 */
struct ToolDescriptor {
    ToolInfo info;
    ToolHandler invoke;
};

/**
 * @brief Ordered name -> tool mapping
 *
 * Filled once at startup and handed to the server by value; the server only
 * reads it afterwards. Registering an existing name replaces that tool but
 * keeps the position of its first registration.
 */
class ToolRegistry {
public:
    /**
     * @brief Register (or replace) a tool
     * @throws std::invalid_argument on empty name or empty handler
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Convenience overload taking the metadata fields separately
     */
    void register_tool(const std::string& name, const std::string& description,
                       const json& input_schema, ToolHandler handler);

    /**
     * @brief All tools in registration order, without handlers
     */
    std::vector<ToolInfo> list() const;

    /**
     * @brief Find a tool by name
     * @return Descriptor or nullptr when the name is not registered
     */
    const ToolDescriptor* lookup(const std::string& name) const;

    std::size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }

private:
    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace sf_boost
