#pragma once

#include "core/SymfonyConsole.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace sf_boost {

/**
 * @brief MCP tool: routes as reported by `debug:router --format=json`
 */
class ListRoutesTool {
public:
    explicit ListRoutesTool(std::shared_ptr<SymfonyConsole> console);

    static ToolInfo get_info();
    json execute(const json& args);

private:
    std::shared_ptr<SymfonyConsole> console_;
};

} // namespace sf_boost
