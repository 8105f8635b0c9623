#pragma once

#include "core/DatabaseSession.hpp"
#include "core/SymfonyConsole.hpp"
#include "mcp/ToolRegistry.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace sf_boost {

/**
 * @brief MCP tool describing the Symfony application
 *
 * Reports the PHP version, the symfony/framework-bundle version pinned in
 * composer.lock, the project path and the database platform.
 */
class ApplicationInfoTool {
public:
    ApplicationInfoTool(std::shared_ptr<DatabaseSession> database,
                        std::shared_ptr<SymfonyConsole> console);

    static ToolInfo get_info();

    json execute(const json& args);

    /**
     * @brief Version of symfony/framework-bundle from composer.lock
     * @return Version string or "unknown"
     */
    static std::string symfony_version(const std::filesystem::path& project_root);

private:
    std::shared_ptr<DatabaseSession> database_;
    std::shared_ptr<SymfonyConsole> console_;
};

} // namespace sf_boost
