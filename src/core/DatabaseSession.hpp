#pragma once

#include "Database.hpp"
#include "DatabaseUrl.hpp"
#include "Lazy.hpp"
#include <optional>
#include <string>

namespace sf_boost {

/**
 * @brief Database handle shared by the database tools
 *
 * The connection is opened on the first call to connection() and reused
 * afterwards, so server startup never waits on the database. A failed open
 * is not cached.
 */
class DatabaseSession {
public:
    /**
     * @param config Parsed DATABASE_URL, or std::nullopt when none is configured
     */
    explicit DatabaseSession(std::optional<DatabaseConfig> config);

    DatabaseSession(const DatabaseSession&) = delete;
    DatabaseSession& operator=(const DatabaseSession&) = delete;

    /**
     * @brief Open (once) and return the connection
     * @throws DatabaseError when no URL is configured, the driver is not
     *         supported or the database cannot be opened
     */
    Database& connection();

    bool is_connected() const { return database_.initialized(); }

    /**
     * @brief Doctrine platform name of the configured driver ("unknown" if none)
     */
    std::string platform_name() const;

    const std::optional<DatabaseConfig>& config() const { return config_; }

private:
    std::unique_ptr<Database> open() const;

    std::optional<DatabaseConfig> config_;
    Lazy<Database> database_;
};

} // namespace sf_boost
