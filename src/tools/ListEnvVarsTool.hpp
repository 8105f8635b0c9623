#pragma once

#include "mcp/ToolRegistry.hpp"
#include <filesystem>

namespace sf_boost {

/**
 * @brief MCP tool listing variable names defined in .env and .env.local
 *
 * Values are never reported.
 */
class ListEnvVarsTool {
public:
    explicit ListEnvVarsTool(std::filesystem::path project_root);

    static ToolInfo get_info();

    /**
     * @return {"env_vars": [sorted unique names], "count": n}
     */
    json execute(const json& args);

private:
    std::filesystem::path project_root_;
};

} // namespace sf_boost
