#pragma once

#include "core/DatabaseSession.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace sf_boost {

/**
 * @brief MCP tool: shows number of rows per table
 *
 * Runs one COUNT(*) per table.
 */
class GetTableSizesTool {
public:
    explicit GetTableSizesTool(std::shared_ptr<DatabaseSession> database);

    static ToolInfo get_info();

    /**
     * @return [{"table", "rows"}] sorted by rows, largest first
     */
    json execute(const json& args);

private:
    std::shared_ptr<DatabaseSession> database_;
};

} // namespace sf_boost
