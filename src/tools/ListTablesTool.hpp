#pragma once

#include "core/DatabaseSession.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace sf_boost {

/**
 * @brief MCP tool: lists all database tables
 */
class ListTablesTool {
public:
    explicit ListTablesTool(std::shared_ptr<DatabaseSession> database);

    static ToolInfo get_info();
    json execute(const json& args);

private:
    std::shared_ptr<DatabaseSession> database_;
};

} // namespace sf_boost
