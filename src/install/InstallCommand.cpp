#include "InstallCommand.hpp"
#include "core/EnvFile.hpp"
#include "core/ServerConfig.hpp"
#include "core/StringUtil.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sf_boost {

namespace {

constexpr const char* kBinaryName = "symfony-boost";

bool is_executable(const fs::path& file) {
    std::error_code ec;
    return fs::is_regular_file(file, ec) && ::access(file.c_str(), X_OK) == 0;
}

std::optional<fs::path> search_path(const std::string& name) {
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string read_file(const fs::path& file) {
    std::ifstream in(file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

InstallCommand::InstallCommand(InstallOptions options, std::vector<std::string> tool_names,
                               std::istream& in, std::ostream& out)
    : options_(std::move(options)), tool_names_(std::move(tool_names)), in_(in), out_(out) {}

std::optional<fs::path> InstallCommand::locate_binary() const {
    std::error_code ec;
    if (!options_.binary_path.empty()) {
        fs::path given = fs::absolute(options_.binary_path, ec);
        if (ec || !fs::exists(given, ec)) {
            return std::nullopt;
        }
        return given.lexically_normal();
    }

    std::vector<fs::path> candidates{options_.project_root / "vendor" / "bin" / kBinaryName};
    if (const char* home = std::getenv("HOME")) {
        candidates.push_back(fs::path(home) / ".local" / "bin" / kBinaryName);
    }
    candidates.push_back(fs::path("/usr/local/bin") / kBinaryName);

    for (const auto& candidate : candidates) {
        if (is_executable(candidate)) {
            return candidate;
        }
    }
    if (auto found = search_path(kBinaryName)) {
        return fs::absolute(*found, ec).lexically_normal();
    }

    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self;
    }
    return std::nullopt;
}

std::string InstallCommand::config_command(const fs::path& binary, const fs::path& project_root) {
    std::string vendor_prefix = (project_root / "vendor").string() + "/";
    if (binary.string().rfind(vendor_prefix, 0) == 0) {
        return "vendor/bin/" + std::string(kBinaryName);
    }
    return binary.string();
}

json InstallCommand::mcp_config(const std::string& command, const fs::path& project_root,
                                const std::optional<std::string>& database_url) {
    json server = {
        {"command", command},
        {"args", json::array()},
        {"cwd", project_root.string()}
    };
    if (database_url && !database_url->empty()) {
        server["env"] = {
            {"DATABASE_URL", *database_url},
            {"APP_ENV", "dev"}
        };
    }
    return {{"mcpServers", {{kServerName, server}}}};
}

json InstallCommand::settings_config(const std::vector<std::string>& tool_names) {
    json allow = json::array();
    for (const auto& name : tool_names) {
        allow.push_back("mcp__" + std::string(kServerName) + "__" + name);
    }
    allow.push_back("Bash(php bin/console:*)");
    allow.push_back("Bash(php bin/console cache:clear:*)");
    allow.push_back("Bash(php bin/console debug:*)");

    return {
        {"permissions", {{"allow", allow}}},
        {"enableAllProjectMcpServers", true},
        {"enabledMcpjsonServers", json::array({kServerName})}
    };
}

int InstallCommand::run() {
    const fs::path& root = options_.project_root;
    out_ << "Symfony Boost installation" << std::endl;

    std::error_code ec;
    if (!fs::exists(root / "bin" / "console", ec)) {
        error("This does not appear to be a Symfony project. bin/console not found.");
        note("Run this command in the root directory of your Symfony project.");
        return 1;
    }
    ok("Symfony project detected: " + root.filename().string());

    fs::path env_file = root / ".env";
    std::optional<std::string> database_url;
    if (!fs::exists(env_file, ec)) {
        warning(".env file not found. Make sure DATABASE_URL is configured.");
    } else {
        database_url = EnvFile::lookup(env_file, "DATABASE_URL");
        if (database_url) {
            ok("DATABASE_URL found in .env");
        } else {
            warning("DATABASE_URL not found in .env. Add this variable.");
        }
    }

    auto binary = locate_binary();
    if (!binary) {
        if (!options_.binary_path.empty()) {
            error("symfony-boost binary not found: " + options_.binary_path);
        } else {
            error("symfony-boost binary not found!");
            note("Specify the path manually: symfony-boost install --path=/path/to/binary");
        }
        return 1;
    }
    ok("Symfony Boost binary found: " + binary->string());

    std::string command = config_command(*binary, root);
    if (command != binary->string()) {
        note("Using relative path for local installation: " + command);
    }

    fs::path claude_dir = root / ".claude";
    if (!fs::is_directory(claude_dir, ec)) {
        if (!fs::create_directories(claude_dir, ec) || ec) {
            error("Could not create .claude directory: " + ec.message());
            return 1;
        }
        ok(".claude directory created");
    }

    fs::path mcp_json_path = root / ".mcp.json";
    fs::path settings_path = claude_dir / "settings.local.json";
    if ((fs::exists(mcp_json_path, ec) || fs::exists(settings_path, ec)) && !options_.force) {
        warning("Configuration files already exist!");
        if (!confirm("Do you want to overwrite the existing files?", false)) {
            note("Installation cancelled. Use --force to overwrite.");
            return 0;
        }
    }

    std::string mcp_json = mcp_config(command, root, database_url).dump(4);
    if (!write_file(mcp_json_path, mcp_json)) {
        return 1;
    }
    ok(".mcp.json successfully created!");

    std::string settings_json = settings_config(tool_names_).dump(4);
    if (!write_file(settings_path, settings_json)) {
        return 1;
    }
    ok(".claude/settings.local.json successfully created!");

    update_gitignore();

    out_ << "\n.mcp.json:\n" << mcp_json << "\n";
    out_ << "\n.claude/settings.local.json:\n" << settings_json << "\n\n";
    ok("Installation complete!");
    out_ << "Next steps:\n"
         << "  * Make sure DATABASE_URL is configured in .env\n"
         << "  * Open the project in your MCP client; it picks up .mcp.json\n"
         << "  * Try: \"List all tables\"" << std::endl;
    note("Binary path: " + binary->string());
    return 0;
}

bool InstallCommand::confirm(const std::string& question, bool default_answer) {
    out_ << question << (default_answer ? " [Y/n] " : " [y/N] ");
    if (options_.assume_yes) {
        out_ << "yes" << std::endl;
        return true;
    }
    out_.flush();

    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << std::endl;
        return default_answer;
    }
    answer = to_lower(trim(answer));
    if (answer.empty()) {
        return default_answer;
    }
    return answer == "y" || answer == "yes";
}

bool InstallCommand::write_file(const fs::path& file, const std::string& content) {
    std::ofstream outfile(file, std::ios::trunc);
    if (outfile) {
        outfile << content;
    }
    if (!outfile) {
        error("Could not create " + file.filename().string());
        return false;
    }
    spdlog::debug("Wrote {}", file.string());
    return true;
}

void InstallCommand::update_gitignore() {
    fs::path gitignore = options_.project_root / ".gitignore";
    std::error_code ec;
    if (!fs::exists(gitignore, ec)) {
        return;
    }

    std::string content = read_file(gitignore);
    std::vector<std::string> entries;
    for (const char* entry : {".mcp.json", ".claude/"}) {
        if (content.find(entry) == std::string::npos) {
            entries.push_back(entry);
        }
    }
    if (entries.empty() || !confirm("Do you want to add .mcp.json and .claude/ to .gitignore?", true)) {
        return;
    }

    std::ofstream out(gitignore, std::ios::app);
    out << "\n# Claude Code MCP Config\n";
    for (const auto& entry : entries) {
        out << entry << "\n";
    }
    if (!out) {
        warning("Could not update .gitignore");
        return;
    }
    ok("Entries added to .gitignore");
}

void InstallCommand::ok(const std::string& message) {
    out_ << "[OK] " << message << std::endl;
}

void InstallCommand::warning(const std::string& message) {
    out_ << "[WARNING] " << message << std::endl;
}

void InstallCommand::error(const std::string& message) {
    out_ << "[ERROR] " << message << std::endl;
}

void InstallCommand::note(const std::string& message) {
    out_ << "[NOTE] " << message << std::endl;
}

} // namespace sf_boost
