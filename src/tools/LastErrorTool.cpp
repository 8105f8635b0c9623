#include "LastErrorTool.hpp"
#include "ToolSupport.hpp"
#include "core/LogReader.hpp"

namespace sf_boost {

LastErrorTool::LastErrorTool(std::filesystem::path project_root)
    : project_root_(std::move(project_root)) {}

ToolInfo LastErrorTool::get_info() {
    return {
        "last_error",
        "Reads the last error from application logs",
        {
            {"type", "object"},
            {"properties", {
                {"env", {
                    {"type", "string"},
                    {"description", "Environment (dev/prod)"},
                    {"default", "dev"}
                }}
            }}
        }
    };
}

json LastErrorTool::execute(const json& args) {
    auto log_path = symfony_log_path(project_root_, optional_string(args, "env", "dev"));

    if (!std::filesystem::exists(log_path)) {
        return "Log file not found: " + log_path.string();
    }

    auto errors = LogReader::error_lines(LogReader::tail(log_path, kScannedLines));
    if (errors.empty()) {
        return "No errors found in recent logs";
    }
    if (errors.size() > kReportedLines) {
        errors.erase(errors.begin(), errors.end() - static_cast<std::ptrdiff_t>(kReportedLines));
    }
    return LogReader::join(errors);
}

} // namespace sf_boost
