#pragma once

#include "core/DatabaseSession.hpp"
#include "core/SymfonyConsole.hpp"
#include "mcp/ToolRegistry.hpp"
#include <filesystem>
#include <memory>

namespace sf_boost {

/**
 * @brief Shared dependencies of the Symfony tools
 */
struct ToolContext {
    std::filesystem::path project_root;
    std::shared_ptr<DatabaseSession> database;
    std::shared_ptr<SymfonyConsole> console;
};

/**
 * @brief Register every Symfony tool, in the order tools/list reports them
 * @throws std::invalid_argument when the context lacks the database or console
 */
void register_symfony_tools(ToolRegistry& registry, const ToolContext& context);

} // namespace sf_boost
