#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sf_boost {

constexpr const char* kServerName = "symfony-boost";
constexpr const char* kServerVersion = "1.0.0-beta.5";
constexpr const char* kProtocolVersion = "2024-11-05";

/**
 * @brief Runtime settings gathered from the command line and environment
 */
struct ServerConfig {
    std::filesystem::path project_root;
    std::string database_url;  // empty when not configured
    std::string php_binary = "php";

    /**
     * @brief Resolve settings
     *
     * DATABASE_URL precedence: @p database_url_option, the DATABASE_URL
     * environment variable, then .env.local and .env in the project root.
     *
     * @param project_option Project directory ("" means current directory)
     * @param database_url_option Explicit URL from the command line
     * @param php_option PHP interpreter
     * @throws std::runtime_error when the project directory does not exist
     */
    static ServerConfig resolve(const std::string& project_option,
                                const std::string& database_url_option,
                                const std::string& php_option);
};

/**
 * @brief Look up DATABASE_URL in the project's .env.local, then .env
 */
std::optional<std::string> database_url_from_env_files(const std::filesystem::path& project_root);

} // namespace sf_boost
