#pragma once

#include "core/DatabaseSession.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace sf_boost {

/**
 * @brief MCP tool: shows the structure of a table
 *
 * Column types are reported with Doctrine type names so the output reads
 * the same as Doctrine's own schema tools. Views are accepted too.
 */
class DescribeTableTool {
public:
    explicit DescribeTableTool(std::shared_ptr<DatabaseSession> database);

    static ToolInfo get_info();

    /**
     * @param args {"table_name": string}
     * @return {"table", "columns": [{name, type, nullable, default}],
     *          "indexes": [{name, columns, unique, primary}]}
     * @throws ToolError when the table does not exist
     */
    json execute(const json& args);

private:
    std::shared_ptr<DatabaseSession> database_;
};

} // namespace sf_boost
