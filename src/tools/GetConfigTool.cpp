#include "GetConfigTool.hpp"
#include "ToolSupport.hpp"

namespace sf_boost {

GetConfigTool::GetConfigTool(std::shared_ptr<SymfonyConsole> console)
    : console_(std::move(console)) {
    if (!console_) {
        throw std::invalid_argument("Console cannot be null");
    }
}

ToolInfo GetConfigTool::get_info() {
    return {
        "get_config",
        "Get configuration value using dot notation (e.g., \"app.secret\")",
        {
            {"type", "object"},
            {"properties", {
                {"key", {
                    {"type", "string"},
                    {"description", "Configuration key in dot notation"}
                }}
            }},
            {"required", json::array({"key"})}
        }
    };
}

json GetConfigTool::execute(const json& args) {
    std::string key = require_string(args, "key");

    // The key travels as one argv entry, never through a shell
    std::string output = console_->run({"debug:config", key});
    if (output.empty()) {
        return "Configuration key '" + key + "' not found";
    }
    return output;
}

} // namespace sf_boost
