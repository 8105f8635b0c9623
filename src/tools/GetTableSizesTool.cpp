#include "GetTableSizesTool.hpp"
#include "core/SchemaInspector.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace sf_boost {

GetTableSizesTool::GetTableSizesTool(std::shared_ptr<DatabaseSession> database)
    : database_(std::move(database)) {
    if (!database_) {
        throw std::invalid_argument("Database session cannot be null");
    }
}

ToolInfo GetTableSizesTool::get_info() {
    return {
        "get_table_sizes",
        "Shows number of rows per table",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json GetTableSizesTool::execute(const json&) {
    SchemaInspector schema(database_->connection());

    std::vector<std::pair<std::string, std::int64_t>> sizes;
    for (const auto& table : schema.table_names()) {
        sizes.emplace_back(table, schema.count_rows(table));
    }

    std::stable_sort(sizes.begin(), sizes.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    json result = json::array();
    for (const auto& [table, rows] : sizes) {
        result.push_back({{"table", table}, {"rows", rows}});
    }
    return result;
}

} // namespace sf_boost
