#include "Database.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cstdint>

namespace sf_boost {

void Database::SqliteDeleter::operator()(sqlite3* db) const {
    if (db != nullptr) {
        sqlite3_close(db);
    }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
    if (stmt != nullptr) {
        sqlite3_finalize(stmt);
    }
}

Database::Database(OpenKey, sqlite3* db) : db_(db) {}

std::unique_ptr<Database> Database::open(const std::string& path, bool read_only) {
    int flags = read_only && path != ":memory:"
        ? SQLITE_OPEN_READONLY
        : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = raw != nullptr ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        if (raw != nullptr) {
            sqlite3_close(raw);
        }
        throw DatabaseError("Cannot open SQLite database " + path + ": " + message);
    }

    sqlite3_busy_timeout(raw, 5000);
    spdlog::info("Opened SQLite database {}{}", path, read_only ? " (read-only)" : "");
    return std::make_unique<Database>(OpenKey{}, raw);
}

json Database::fetch_all(const std::string& sql) {
    spdlog::debug("SQL: {}", sql);
    PreparedStatement stmt(db_.get(), sql);

    json rows = json::array();
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    return rows;
}

json Database::fetch_one(const std::string& sql) {
    spdlog::debug("SQL: {}", sql);
    PreparedStatement stmt(db_.get(), sql);

    if (!stmt.step() || stmt.column_count() == 0) {
        return nullptr;
    }
    return stmt.column_value(0);
}

void Database::exec(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error != nullptr ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        throw DatabaseError(message);
    }
}

std::string Database::quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) : db_(db) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        if (raw != nullptr) {
            sqlite3_finalize(raw);
        }
        throw DatabaseError(sqlite3_errmsg(db));
    }
    if (raw == nullptr) {
        throw DatabaseError("Empty SQL statement");
    }
    stmt_.reset(raw);
}

bool PreparedStatement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw DatabaseError(sqlite3_errmsg(db_));
}

int PreparedStatement::column_count() const {
    return sqlite3_column_count(stmt_.get());
}

std::string PreparedStatement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_.get(), index);
    return name != nullptr ? name : "";
}

json PreparedStatement::column_value(int index) const {
    switch (sqlite3_column_type(stmt_.get(), index)) {
    case SQLITE_INTEGER:
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), index));
    case SQLITE_FLOAT:
        return sqlite3_column_double(stmt_.get(), index);
    case SQLITE_TEXT:
    case SQLITE_BLOB: {
        const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_.get(), index));
        int size = sqlite3_column_bytes(stmt_.get(), index);
        return data != nullptr ? std::string(data, static_cast<std::size_t>(size)) : std::string();
    }
    default:
        return nullptr;
    }
}

json PreparedStatement::row() const {
    json row = json::object();
    int count = column_count();
    for (int i = 0; i < count; ++i) {
        row[column_name(i)] = column_value(i);
    }
    return row;
}

} // namespace sf_boost
