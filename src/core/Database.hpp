#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

// Forward declare sqlite3 to keep the SQLite header out of the interface
struct sqlite3;
struct sqlite3_stmt;

namespace sf_boost {

using json = nlohmann::json;

/**
 * @brief Failure reported by the database layer
 */
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief SQLite connection
 *
 * RAII owner of a sqlite3 handle. Rows come back as JSON so tools can hand
 * them straight to the client.
 */
class Database {
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    /**
     * @brief Adopt an open handle; only open() can supply the key
     */
    Database(OpenKey, sqlite3* db);

    /**
     * @brief Open a database file
     * @param path File path or ":memory:"
     * @param read_only Open without write access; the file must exist
     * @throws DatabaseError when the file cannot be opened
     */
    static std::unique_ptr<Database> open(const std::string& path, bool read_only = true);

    ~Database() = default;

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&&) = delete;
    Database& operator=(Database&&) = delete;

    /**
     * @brief Run a query and collect every row
     * @return JSON array of {column: value} objects
     * @throws DatabaseError on prepare or step failure
     */
    json fetch_all(const std::string& sql);

    /**
     * @brief First column of the first row, or null when there is no row
     */
    json fetch_one(const std::string& sql);

    /**
     * @brief Execute statements that return no rows
     */
    void exec(const std::string& sql);

    sqlite3* connection() const { return db_.get(); }

    /**
     * @brief Quote an identifier for use in SQL text ("name")
     */
    static std::string quote_identifier(const std::string& name);

private:
    struct SqliteDeleter {
        void operator()(sqlite3* db) const;
    };

    std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

/**
 * @brief RAII wrapper for prepared statements
 */
class PreparedStatement {
public:
    /**
     * @throws DatabaseError when the SQL does not compile
     */
    PreparedStatement(sqlite3* db, const std::string& sql);

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    /**
     * @brief Advance to the next row
     * @return true while a row is available
     * @throws DatabaseError on execution failure
     */
    bool step();

    int column_count() const;
    std::string column_name(int index) const;

    /**
     * @brief Current row value as JSON (integer, real, text or null)
     */
    json column_value(int index) const;

    /**
     * @brief Current row as a {column: value} object
     */
    json row() const;

private:
    struct StmtDeleter {
        void operator()(sqlite3_stmt* stmt) const;
    };

    sqlite3* db_;
    std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
};

} // namespace sf_boost
