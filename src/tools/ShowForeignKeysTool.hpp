#pragma once

#include "core/DatabaseSession.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace sf_boost {

/**
 * @brief MCP tool: shows all foreign keys
 */
class ShowForeignKeysTool {
public:
    explicit ShowForeignKeysTool(std::shared_ptr<DatabaseSession> database);

    static ToolInfo get_info();

    /**
     * @return foreign keys of one table ("table_name") or of all tables
     */
    json execute(const json& args);

private:
    std::shared_ptr<DatabaseSession> database_;
};

} // namespace sf_boost
