#pragma once

#include "core/SymfonyConsole.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace sf_boost {

/**
 * @brief MCP tool running `php bin/console <command>` in the project
 *
 * The command text is handed to /bin/sh unchanged: the client is trusted
 * the same way a developer shell is.
 */
class ConsoleCommandTool {
public:
    explicit ConsoleCommandTool(std::shared_ptr<SymfonyConsole> console);

    static ToolInfo get_info();

    /**
     * @param args {"command": string} without the "php bin/console" prefix
     * @return Command output, or "No output"
     */
    json execute(const json& args);

private:
    std::shared_ptr<SymfonyConsole> console_;
};

} // namespace sf_boost
