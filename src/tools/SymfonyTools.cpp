#include "SymfonyTools.hpp"
#include "ApplicationInfoTool.hpp"
#include "ConsoleCommandTool.hpp"
#include "DatabaseQueryTool.hpp"
#include "DescribeTableTool.hpp"
#include "GetConfigTool.hpp"
#include "GetTableSizesTool.hpp"
#include "LastErrorTool.hpp"
#include "ListBundlesTool.hpp"
#include "ListEntitiesTool.hpp"
#include "ListEnvVarsTool.hpp"
#include "ListRoutesTool.hpp"
#include "ListTablesTool.hpp"
#include "ReadLogsTool.hpp"
#include "ShowForeignKeysTool.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sf_boost {

namespace {

template <typename Tool>
void add(ToolRegistry& registry, std::shared_ptr<Tool> tool) {
    registry.register_tool(
        Tool::get_info(),
        [tool](const json& args) {
            return tool->execute(args);
        }
    );
}

} // namespace

void register_symfony_tools(ToolRegistry& registry, const ToolContext& context) {
    if (!context.database || !context.console) {
        throw std::invalid_argument("Tool context requires a database session and a console");
    }
    const auto& root = context.project_root;

    add(registry, std::make_shared<ApplicationInfoTool>(context.database, context.console));
    add(registry, std::make_shared<DatabaseQueryTool>(context.database));
    add(registry, std::make_shared<ListTablesTool>(context.database));
    add(registry, std::make_shared<DescribeTableTool>(context.database));
    add(registry, std::make_shared<ListEntitiesTool>(root));
    add(registry, std::make_shared<ReadLogsTool>(root));
    add(registry, std::make_shared<ListRoutesTool>(context.console));
    add(registry, std::make_shared<GetTableSizesTool>(context.database));
    add(registry, std::make_shared<ShowForeignKeysTool>(context.database));
    add(registry, std::make_shared<ConsoleCommandTool>(context.console));
    add(registry, std::make_shared<GetConfigTool>(context.console));
    add(registry, std::make_shared<ListEnvVarsTool>(root));
    add(registry, std::make_shared<LastErrorTool>(root));
    add(registry, std::make_shared<ListBundlesTool>(root));

    spdlog::debug("Registered {} Symfony tools", registry.size());
}

} // namespace sf_boost
