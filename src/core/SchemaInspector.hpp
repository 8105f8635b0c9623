#pragma once

#include "Database.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sf_boost {

struct ColumnInfo {
    std::string name;
    std::string type;  // Doctrine-style type name, e.g. "Integer", "String"
    bool nullable = true;
    json default_value;
    bool primary_key = false;
};

struct IndexInfo {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    bool primary = false;
};

struct ForeignKeyInfo {
    std::string name;
    std::vector<std::string> local_columns;
    std::string foreign_table;
    std::vector<std::string> foreign_columns;
};

/**
 * @brief Reads table metadata from SQLite catalog pragmas
 */
class SchemaInspector {
public:
    explicit SchemaInspector(Database& db);

    /**
     * @brief User tables sorted by name (sqlite_* internals excluded)
     */
    std::vector<std::string> table_names() const;

    bool table_exists(const std::string& table) const;

    std::vector<ColumnInfo> columns(const std::string& table) const;

    /**
     * @brief Indexes, including a synthetic "primary" entry for rowid keys
     */
    std::vector<IndexInfo> indexes(const std::string& table) const;

    /**
     * @brief Foreign keys, named fk_<table>_<n> since SQLite keeps no names
     */
    std::vector<ForeignKeyInfo> foreign_keys(const std::string& table) const;

    std::int64_t count_rows(const std::string& table) const;

    /**
     * @brief Map a declared SQLite column type to a Doctrine type name
     */
    static std::string doctrine_type_name(const std::string& declared_type);

private:
    Database& db_;
};

} // namespace sf_boost
