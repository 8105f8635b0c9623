#include "DatabaseQueryTool.hpp"
#include "ToolSupport.hpp"
#include "core/StringUtil.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>

namespace sf_boost {

DatabaseQueryTool::DatabaseQueryTool(std::shared_ptr<DatabaseSession> database)
    : database_(std::move(database)) {
    if (!database_) {
        throw std::invalid_argument("Database session cannot be null");
    }
}

ToolInfo DatabaseQueryTool::get_info() {
    return {
        "database_query",
        "Executes READ-ONLY SQL queries (SELECT, SHOW, EXPLAIN, DESCRIBE)",
        {
            {"type", "object"},
            {"properties", {
                {"query", {
                    {"type", "string"},
                    {"description", "SQL Query"}
                }},
                {"limit", {
                    {"type", "integer"},
                    {"description", "Max rows"},
                    {"default", 100}
                }}
            }},
            {"required", json::array({"query"})}
        }
    };
}

std::string DatabaseQueryTool::prepare_query(const std::string& query, long long limit) {
    static const std::array<const char*, 5> allowed = {"SELECT", "SHOW", "EXPLAIN", "DESCRIBE", "DESC"};

    std::string sql = trim(query);
    std::string first_word = to_upper(sql.substr(0, sql.find_first_of(" \t\r\n")));

    bool read_only = std::any_of(allowed.begin(), allowed.end(),
                                 [&first_word](const char* keyword) { return first_word == keyword; });
    if (!read_only) {
        throw ToolError("Only READ-ONLY queries allowed");
    }

    if (first_word == "SELECT" && to_upper(sql).find("LIMIT") == std::string::npos) {
        sql += " LIMIT " + std::to_string(limit);
    }
    return sql;
}

json DatabaseQueryTool::execute(const json& args) {
    std::string query = require_string(args, "query");
    long long limit = optional_integer(args, "limit", 100);
    if (limit < 0) {
        throw ToolError("Parameter limit must not be negative");
    }

    std::string sql = prepare_query(query, limit);
    spdlog::debug("DatabaseQueryTool: {}", sql);

    json rows = database_->connection().fetch_all(sql);
    std::size_t count = rows.size();
    return {
        {"rows", std::move(rows)},
        {"count", count}
    };
}

} // namespace sf_boost
