#include "ConsoleCommandTool.hpp"
#include "ToolSupport.hpp"

namespace sf_boost {

ConsoleCommandTool::ConsoleCommandTool(std::shared_ptr<SymfonyConsole> console)
    : console_(std::move(console)) {
    if (!console_) {
        throw std::invalid_argument("Console cannot be null");
    }
}

ToolInfo ConsoleCommandTool::get_info() {
    return {
        "console_command",
        "Executes Symfony console commands",
        {
            {"type", "object"},
            {"properties", {
                {"command", {
                    {"type", "string"},
                    {"description", "Command (without php bin/console)"}
                }}
            }},
            {"required", json::array({"command"})}
        }
    };
}

json ConsoleCommandTool::execute(const json& args) {
    std::string command = require_string(args, "command");
    std::string output = console_->run_command_line(command);
    if (output.empty()) {
        return "No output";
    }
    return output;
}

} // namespace sf_boost
