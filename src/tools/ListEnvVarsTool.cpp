#include "ListEnvVarsTool.hpp"
#include "core/EnvFile.hpp"
#include <algorithm>

namespace sf_boost {

ListEnvVarsTool::ListEnvVarsTool(std::filesystem::path project_root)
    : project_root_(std::move(project_root)) {}

ToolInfo ListEnvVarsTool::get_info() {
    return {
        "list_env_vars",
        "Lists all available environment variables from .env files",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json ListEnvVarsTool::execute(const json&) {
    std::vector<std::string> names;
    for (const char* file : {".env", ".env.local"}) {
        auto found = EnvFile::variable_names(project_root_ / file);
        names.insert(names.end(), found.begin(), found.end());
    }

    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());

    return {
        {"env_vars", names},
        {"count", names.size()}
    };
}

} // namespace sf_boost
