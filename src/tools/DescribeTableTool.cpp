#include "DescribeTableTool.hpp"
#include "ToolSupport.hpp"
#include "core/SchemaInspector.hpp"
#include <spdlog/spdlog.h>

namespace sf_boost {

DescribeTableTool::DescribeTableTool(std::shared_ptr<DatabaseSession> database)
    : database_(std::move(database)) {
    if (!database_) {
        throw std::invalid_argument("Database session cannot be null");
    }
}

ToolInfo DescribeTableTool::get_info() {
    return {
        "describe_table",
        "Shows the structure of a table",
        {
            {"type", "object"},
            {"properties", {
                {"table_name", {
                    {"type", "string"},
                    {"description", "Table name"}
                }}
            }},
            {"required", json::array({"table_name"})}
        }
    };
}

json DescribeTableTool::execute(const json& args) {
    std::string table_name = require_string(args, "table_name");
    SchemaInspector schema(database_->connection());

    if (!schema.table_exists(table_name)) {
        throw ToolError("Table \"" + table_name + "\" does not exist");
    }

    json columns = json::array();
    for (const auto& column : schema.columns(table_name)) {
        columns.push_back({
            {"name", column.name},
            {"type", column.type},
            {"nullable", column.nullable},
            {"default", column.default_value}
        });
    }

    json indexes = json::array();
    for (const auto& index : schema.indexes(table_name)) {
        indexes.push_back({
            {"name", index.name},
            {"columns", index.columns},
            {"unique", index.unique},
            {"primary", index.primary}
        });
    }

    spdlog::debug("DescribeTableTool: {} has {} columns, {} indexes",
                  table_name, columns.size(), indexes.size());
    return {
        {"table", table_name},
        {"columns", columns},
        {"indexes", indexes}
    };
}

} // namespace sf_boost
