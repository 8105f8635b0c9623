#include "SymfonyConsole.hpp"
#include "Process.hpp"
#include "StringUtil.hpp"
#include <spdlog/spdlog.h>

namespace sf_boost {

SymfonyConsole::SymfonyConsole(std::filesystem::path project_root, std::string php_binary)
    : project_root_(std::move(project_root)), php_binary_(std::move(php_binary)) {}

std::string SymfonyConsole::run(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {php_binary_, "bin/console"};
    argv.insert(argv.end(), args.begin(), args.end());
    return run_process(argv, project_root_).output;
}

std::string SymfonyConsole::run_command_line(const std::string& command_line) const {
    std::string script = shell_quote(php_binary_) + " bin/console " + command_line + " 2>&1";
    spdlog::info("Console command: {}", command_line);
    return run_process({"/bin/sh", "-c", script}, project_root_).output;
}

std::string SymfonyConsole::php_version() const {
    try {
        ProcessResult result = run_process({php_binary_, "-r", "echo PHP_VERSION;"}, project_root_);
        std::string version = trim(result.output);
        if (result.exit_code == 0 && !version.empty()) {
            return version;
        }
        spdlog::warn("{} exited with {} while reading PHP_VERSION", php_binary_, result.exit_code);
    } catch (const std::exception& e) {
        spdlog::warn("Cannot determine PHP version: {}", e.what());
    }
    return "unknown";
}

} // namespace sf_boost
