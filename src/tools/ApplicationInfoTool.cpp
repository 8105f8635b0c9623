#include "ApplicationInfoTool.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace sf_boost {

ApplicationInfoTool::ApplicationInfoTool(std::shared_ptr<DatabaseSession> database,
                                         std::shared_ptr<SymfonyConsole> console)
    : database_(std::move(database)), console_(std::move(console)) {
    if (!database_ || !console_) {
        throw std::invalid_argument("Database session and console cannot be null");
    }
}

ToolInfo ApplicationInfoTool::get_info() {
    return {
        "application_info",
        "Returns information about the Symfony application",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

std::string ApplicationInfoTool::symfony_version(const std::filesystem::path& project_root) {
    std::ifstream in(project_root / "composer.lock");
    if (!in) {
        return "unknown";
    }

    json lock = json::parse(in, nullptr, false);
    if (lock.is_discarded() || !lock.contains("packages") || !lock["packages"].is_array()) {
        spdlog::warn("composer.lock is not readable JSON");
        return "unknown";
    }

    for (const auto& package : lock["packages"]) {
        if (package.is_object() && package.value("name", "") == "symfony/framework-bundle") {
            return package.value("version", "unknown");
        }
    }
    return "unknown";
}

json ApplicationInfoTool::execute(const json&) {
    const auto& root = console_->project_root();
    return {
        {"php_version", console_->php_version()},
        {"symfony_version", symfony_version(root)},
        {"project_path", root.string()},
        {"database_platform", database_->platform_name()}
    };
}

} // namespace sf_boost
