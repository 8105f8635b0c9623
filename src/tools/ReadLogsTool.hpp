#pragma once

#include "mcp/ToolRegistry.hpp"
#include <filesystem>

namespace sf_boost {

/**
 * @brief MCP tool returning the last N lines of var/log/<env>.log
 */
class ReadLogsTool {
public:
    explicit ReadLogsTool(std::filesystem::path project_root);

    static ToolInfo get_info();

    /**
     * @param args {"entries": integer = 50, "env": string = "dev"}
     * @return Log text, or a message when the file is missing or empty
     */
    json execute(const json& args);

private:
    std::filesystem::path project_root_;
};

} // namespace sf_boost
