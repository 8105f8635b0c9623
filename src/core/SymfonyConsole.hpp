#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sf_boost {

/**
 * @brief Runs `php bin/console ...` inside a Symfony project
 */
class SymfonyConsole {
public:
    /**
     * @param project_root Symfony project directory (contains bin/console)
     * @param php_binary PHP interpreter, looked up in PATH when not absolute
     */
    SymfonyConsole(std::filesystem::path project_root, std::string php_binary = "php");

    /**
     * @brief Run a console command with literal arguments
     * @return Combined stdout/stderr
     */
    std::string run(const std::vector<std::string>& args) const;

    /**
     * @brief Run a console command line through /bin/sh
     *
     * The text after "bin/console" is passed to the shell unchanged.
     */
    std::string run_command_line(const std::string& command_line) const;

    /**
     * @brief PHP_VERSION of the configured interpreter, "unknown" on failure
     */
    std::string php_version() const;

    const std::filesystem::path& project_root() const { return project_root_; }

private:
    std::filesystem::path project_root_;
    std::string php_binary_;
};

} // namespace sf_boost
