#pragma once

#include "mcp/ToolRegistry.hpp"
#include <cstddef>
#include <filesystem>

namespace sf_boost {

/**
 * @brief MCP tool: the most recent ERROR/CRITICAL/EMERGENCY log lines
 *
 * Looks at the last kScannedLines lines of var/log/<env>.log and returns
 * at most kReportedLines matches.
 */
class LastErrorTool {
public:
    static constexpr std::size_t kScannedLines = 200;
    static constexpr std::size_t kReportedLines = 10;

    explicit LastErrorTool(std::filesystem::path project_root);

    static ToolInfo get_info();
    json execute(const json& args);

private:
    std::filesystem::path project_root_;
};

} // namespace sf_boost
