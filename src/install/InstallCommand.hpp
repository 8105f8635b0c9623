#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sf_boost {

using json = nlohmann::json;

/**
 * @brief Options of `symfony-boost install`
 */
struct InstallOptions {
    std::filesystem::path project_root;
    std::string binary_path;   // --path, empty means auto-detect
    bool force = false;        // overwrite without asking
    bool assume_yes = false;   // answer every question with yes
};

/**
 * @brief Writes the MCP client configuration into a Symfony project
 *
 * Creates .mcp.json (server command) and .claude/settings.local.json (tool
 * permissions), and optionally adds both to .gitignore. Questions are read
 * from @p in, progress is written to @p out as "[OK]", "[WARNING]",
 * "[ERROR]" and "[NOTE]" lines.
 */
class InstallCommand {
public:
    InstallCommand(InstallOptions options, std::vector<std::string> tool_names,
                   std::istream& in, std::ostream& out);

    /**
     * @brief Run the installation
     * @return Process exit code (0 on success or when cancelled, 1 on error)
     */
    int run();

    /**
     * @brief Absolute path of the server binary, if one can be found
     *
     * Tries --path, vendor/bin/symfony-boost, ~/.local/bin,
     * /usr/local/bin, PATH and finally the running executable.
     */
    std::optional<std::filesystem::path> locate_binary() const;

    /**
     * @brief Command written to .mcp.json
     *
     * A binary inside the project's vendor/ directory is written relative
     * to the project so the configuration stays portable.
     */
    static std::string config_command(const std::filesystem::path& binary,
                                      const std::filesystem::path& project_root);

    static json mcp_config(const std::string& command,
                           const std::filesystem::path& project_root,
                           const std::optional<std::string>& database_url);

    static json settings_config(const std::vector<std::string>& tool_names);

private:
    bool confirm(const std::string& question, bool default_answer);
    bool write_file(const std::filesystem::path& file, const std::string& content);
    void update_gitignore();

    void ok(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void note(const std::string& message);

    InstallOptions options_;
    std::vector<std::string> tool_names_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace sf_boost
