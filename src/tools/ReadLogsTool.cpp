#include "ReadLogsTool.hpp"
#include "ToolSupport.hpp"
#include "core/LogReader.hpp"
#include <spdlog/spdlog.h>

namespace sf_boost {

ReadLogsTool::ReadLogsTool(std::filesystem::path project_root)
    : project_root_(std::move(project_root)) {}

ToolInfo ReadLogsTool::get_info() {
    return {
        "read_logs",
        "Reads the last N log entries",
        {
            {"type", "object"},
            {"properties", {
                {"entries", {
                    {"type", "integer"},
                    {"description", "Number of entries"},
                    {"default", 50}
                }},
                {"env", {
                    {"type", "string"},
                    {"description", "Environment (dev/prod)"},
                    {"default", "dev"}
                }}
            }},
            {"required", json::array({"entries"})}
        }
    };
}

json ReadLogsTool::execute(const json& args) {
    long long entries = optional_integer(args, "entries", 50);
    if (entries < 0) {
        throw ToolError("Parameter entries must not be negative");
    }
    auto log_path = symfony_log_path(project_root_, optional_string(args, "env", "dev"));

    if (!std::filesystem::exists(log_path)) {
        return "Log file not found: " + log_path.string();
    }

    spdlog::debug("ReadLogsTool: last {} lines of {}", entries, log_path.string());
    std::string output = LogReader::join(LogReader::tail(log_path, static_cast<std::size_t>(entries)));
    if (output.empty()) {
        return "No log entries";
    }
    return output;
}

} // namespace sf_boost
