#include "ListTablesTool.hpp"
#include "core/SchemaInspector.hpp"
#include <spdlog/spdlog.h>

namespace sf_boost {

ListTablesTool::ListTablesTool(std::shared_ptr<DatabaseSession> database)
    : database_(std::move(database)) {
    if (!database_) {
        throw std::invalid_argument("Database session cannot be null");
    }
}

ToolInfo ListTablesTool::get_info() {
    return {
        "list_tables",
        "Lists all database tables",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json ListTablesTool::execute(const json&) {
    SchemaInspector schema(database_->connection());
    auto tables = schema.table_names();

    spdlog::debug("ListTablesTool: {} tables", tables.size());
    return {
        {"tables", tables},
        {"count", tables.size()}
    };
}

} // namespace sf_boost
