#include "SchemaInspector.hpp"
#include "StringUtil.hpp"
#include <spdlog/spdlog.h>
#include <map>

namespace sf_boost {

namespace {

std::string quote_literal(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string string_field(const json& row, const char* key) {
    auto it = row.find(key);
    return (it != row.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

std::int64_t int_field(const json& row, const char* key) {
    auto it = row.find(key);
    return (it != row.end() && it->is_number_integer()) ? it->get<std::int64_t>() : 0;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

SchemaInspector::SchemaInspector(Database& db) : db_(db) {}

std::vector<std::string> SchemaInspector::table_names() const {
    json rows = db_.fetch_all(
        "SELECT name FROM sqlite_master WHERE type = 'table' "
        "AND name NOT LIKE 'sqlite_%' ORDER BY name");

    std::vector<std::string> names;
    for (const auto& row : rows) {
        names.push_back(string_field(row, "name"));
    }
    return names;
}

bool SchemaInspector::table_exists(const std::string& table) const {
    json count = db_.fetch_one(
        "SELECT COUNT(*) FROM sqlite_master WHERE type IN ('table', 'view') AND name = " +
        quote_literal(table));
    return count.is_number_integer() && count.get<std::int64_t>() > 0;
}

std::vector<ColumnInfo> SchemaInspector::columns(const std::string& table) const {
    json rows = db_.fetch_all("PRAGMA table_info(" + Database::quote_identifier(table) + ")");

    std::vector<ColumnInfo> columns;
    for (const auto& row : rows) {
        ColumnInfo column;
        column.name = string_field(row, "name");
        column.type = doctrine_type_name(string_field(row, "type"));
        column.nullable = int_field(row, "notnull") == 0;
        column.default_value = row.value("dflt_value", json());
        column.primary_key = int_field(row, "pk") > 0;
        columns.push_back(std::move(column));
    }
    return columns;
}

std::vector<IndexInfo> SchemaInspector::indexes(const std::string& table) const {
    json rows = db_.fetch_all("PRAGMA index_list(" + Database::quote_identifier(table) + ")");

    std::vector<IndexInfo> indexes;
    bool has_primary = false;
    for (const auto& row : rows) {
        IndexInfo index;
        index.name = string_field(row, "name");
        index.unique = int_field(row, "unique") != 0;
        index.primary = string_field(row, "origin") == "pk";
        has_primary = has_primary || index.primary;

        json parts = db_.fetch_all("PRAGMA index_info(" + Database::quote_identifier(index.name) + ")");
        for (const auto& part : parts) {
            index.columns.push_back(string_field(part, "name"));
        }
        indexes.push_back(std::move(index));
    }

    // INTEGER PRIMARY KEY columns alias the rowid and get no index entry
    if (!has_primary) {
        json info = db_.fetch_all("PRAGMA table_info(" + Database::quote_identifier(table) + ")");
        std::map<std::int64_t, std::string> key_columns;
        for (const auto& row : info) {
            std::int64_t position = int_field(row, "pk");
            if (position > 0) {
                key_columns[position] = string_field(row, "name");
            }
        }
        if (!key_columns.empty()) {
            IndexInfo primary;
            primary.name = "primary";
            primary.unique = true;
            primary.primary = true;
            for (const auto& entry : key_columns) {
                primary.columns.push_back(entry.second);
            }
            indexes.insert(indexes.begin(), std::move(primary));
        }
    }
    return indexes;
}

std::vector<ForeignKeyInfo> SchemaInspector::foreign_keys(const std::string& table) const {
    json rows = db_.fetch_all("PRAGMA foreign_key_list(" + Database::quote_identifier(table) + ")");

    std::map<std::int64_t, ForeignKeyInfo> by_id;
    for (const auto& row : rows) {
        std::int64_t id = int_field(row, "id");
        ForeignKeyInfo& fk = by_id[id];
        if (fk.name.empty()) {
            fk.name = "fk_" + table + "_" + std::to_string(id);
            fk.foreign_table = string_field(row, "table");
        }
        fk.local_columns.push_back(string_field(row, "from"));
        fk.foreign_columns.push_back(string_field(row, "to"));
    }

    std::vector<ForeignKeyInfo> keys;
    for (auto& entry : by_id) {
        keys.push_back(std::move(entry.second));
    }
    spdlog::debug("Table {} has {} foreign keys", table, keys.size());
    return keys;
}

std::int64_t SchemaInspector::count_rows(const std::string& table) const {
    json count = db_.fetch_one("SELECT COUNT(*) FROM " + Database::quote_identifier(table));
    return count.is_number_integer() ? count.get<std::int64_t>() : 0;
}

std::string SchemaInspector::doctrine_type_name(const std::string& declared_type) {
    std::string upper = to_upper(declared_type);

    if (upper.empty()) return "String";
    if (contains(upper, "BOOL")) return "Boolean";
    if (contains(upper, "DATETIME") || contains(upper, "TIMESTAMP")) return "DateTime";
    if (contains(upper, "DATE")) return "Date";
    if (contains(upper, "TIME")) return "Time";
    if (contains(upper, "BIGINT")) return "BigInt";
    if (contains(upper, "SMALLINT")) return "SmallInt";
    if (contains(upper, "INT")) return "Integer";
    if (contains(upper, "JSON")) return "Json";
    if (contains(upper, "CHAR")) return "String";
    if (contains(upper, "CLOB") || contains(upper, "TEXT")) return "Text";
    if (contains(upper, "BLOB")) return "Blob";
    if (contains(upper, "REAL") || contains(upper, "FLOA") || contains(upper, "DOUB")) return "Float";
    if (contains(upper, "NUMERIC") || contains(upper, "DECIMAL")) return "Decimal";
    return declared_type;
}

} // namespace sf_boost
