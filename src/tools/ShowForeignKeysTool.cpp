#include "ShowForeignKeysTool.hpp"
#include "ToolSupport.hpp"
#include "core/SchemaInspector.hpp"
#include <vector>

namespace sf_boost {

ShowForeignKeysTool::ShowForeignKeysTool(std::shared_ptr<DatabaseSession> database)
    : database_(std::move(database)) {
    if (!database_) {
        throw std::invalid_argument("Database session cannot be null");
    }
}

ToolInfo ShowForeignKeysTool::get_info() {
    return {
        "show_foreign_keys",
        "Shows all foreign keys",
        {
            {"type", "object"},
            {"properties", {
                {"table_name", {
                    {"type", "string"},
                    {"description", "Optional: Table name"}
                }}
            }}
        }
    };
}

json ShowForeignKeysTool::execute(const json& args) {
    SchemaInspector schema(database_->connection());

    std::vector<std::string> tables;
    std::string table_name = optional_string(args, "table_name", "");
    if (!table_name.empty()) {
        tables.push_back(table_name);
    } else {
        tables = schema.table_names();
    }

    json result = json::array();
    for (const auto& table : tables) {
        for (const auto& fk : schema.foreign_keys(table)) {
            result.push_back({
                {"table", table},
                {"name", fk.name},
                {"local_columns", fk.local_columns},
                {"foreign_table", fk.foreign_table},
                {"foreign_columns", fk.foreign_columns}
            });
        }
    }
    return result;
}

} // namespace sf_boost
