#pragma once

#include "core/SymfonyConsole.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace sf_boost {

/**
 * @brief MCP tool: `php bin/console debug:config <key>`
 */
class GetConfigTool {
public:
    explicit GetConfigTool(std::shared_ptr<SymfonyConsole> console);

    static ToolInfo get_info();
    json execute(const json& args);

private:
    std::shared_ptr<SymfonyConsole> console_;
};

} // namespace sf_boost
