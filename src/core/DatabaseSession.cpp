#include "DatabaseSession.hpp"
#include <spdlog/spdlog.h>

namespace sf_boost {

DatabaseSession::DatabaseSession(std::optional<DatabaseConfig> config)
    : config_(std::move(config)),
      database_([this]() { return open(); }) {}

Database& DatabaseSession::connection() {
    return database_.get();
}

std::string DatabaseSession::platform_name() const {
    return config_ ? config_->platform_name() : "unknown";
}

std::unique_ptr<Database> DatabaseSession::open() const {
    if (!config_) {
        throw DatabaseError("DATABASE_URL is not configured");
    }
    if (!config_->is_sqlite()) {
        throw DatabaseError("Database driver " + config_->driver +
                            " is not supported by this build, only SQLite databases can be inspected");
    }

    spdlog::info("Connecting to database on first use");
    return Database::open(config_->path);
}

} // namespace sf_boost
