#include "ServerConfig.hpp"
#include "EnvFile.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace sf_boost {

std::optional<std::string> database_url_from_env_files(const std::filesystem::path& project_root) {
    for (const char* name : {".env.local", ".env"}) {
        auto value = EnvFile::lookup(project_root / name, "DATABASE_URL");
        if (value && !value->empty()) {
            spdlog::debug("DATABASE_URL taken from {}", name);
            return value;
        }
    }
    return std::nullopt;
}

ServerConfig ServerConfig::resolve(const std::string& project_option,
                                   const std::string& database_url_option,
                                   const std::string& php_option) {
    ServerConfig config;

    std::filesystem::path project = project_option.empty()
        ? std::filesystem::current_path()
        : std::filesystem::path(project_option);
    if (!std::filesystem::is_directory(project)) {
        throw std::runtime_error("Project directory does not exist: " + project.string());
    }
    config.project_root = std::filesystem::canonical(project);

    if (!database_url_option.empty()) {
        config.database_url = database_url_option;
    } else if (const char* env = std::getenv("DATABASE_URL"); env != nullptr && *env != '\0') {
        config.database_url = env;
    } else if (auto from_file = database_url_from_env_files(config.project_root)) {
        config.database_url = *from_file;
    }

    if (!php_option.empty()) {
        config.php_binary = php_option;
    }

    spdlog::info("Project root: {}", config.project_root.string());
    if (config.database_url.empty()) {
        spdlog::warn("DATABASE_URL is not configured, database tools will fail");
    }
    return config;
}

} // namespace sf_boost
