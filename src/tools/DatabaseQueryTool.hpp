#pragma once

#include "core/DatabaseSession.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>
#include <string>

namespace sf_boost {

/**
 * @brief MCP tool running read-only SQL against the project database
 *
 * Only statements starting with SELECT, SHOW, EXPLAIN, DESCRIBE or DESC are
 * accepted. A SELECT without LIMIT gets one appended.
 */
class DatabaseQueryTool {
public:
    explicit DatabaseQueryTool(std::shared_ptr<DatabaseSession> database);

    static ToolInfo get_info();

    /**
     * @param args {"query": string, "limit": integer = 100}
     * @return {"rows": [...], "count": n}
     * @throws ToolError for statements that are not read-only
     */
    json execute(const json& args);

    /**
     * @brief Validate the statement and apply the row limit
     * @throws ToolError when the first keyword is not read-only
     */
    static std::string prepare_query(const std::string& query, long long limit);

private:
    std::shared_ptr<DatabaseSession> database_;
};

} // namespace sf_boost
