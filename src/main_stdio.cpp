#include "core/DatabaseSession.hpp"
#include "core/DatabaseUrl.hpp"
#include "core/Logging.hpp"
#include "core/ServerConfig.hpp"
#include "core/SymfonyConsole.hpp"
#include "install/InstallCommand.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/SymfonyTools.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

namespace {
    sf_boost::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    std::optional<sf_boost::DatabaseConfig> database_config(const sf_boost::ServerConfig& config) {
        if (config.database_url.empty()) {
            spdlog::info("DATABASE_URL not configured, database tools are unavailable");
            return std::nullopt;
        }
        try {
            auto parsed = sf_boost::parse_database_url(config.database_url, config.project_root);
            spdlog::info("Database driver: {}", parsed.driver);
            return parsed;
        } catch (const std::invalid_argument& e) {
            spdlog::error("Ignoring invalid DATABASE_URL: {}", e.what());
            return std::nullopt;
        }
    }

    sf_boost::ToolRegistry build_registry(const sf_boost::ServerConfig& config) {
        sf_boost::ToolContext context{
            config.project_root,
            std::make_shared<sf_boost::DatabaseSession>(database_config(config)),
            std::make_shared<sf_boost::SymfonyConsole>(config.project_root, config.php_binary)
        };
        sf_boost::ToolRegistry registry;
        sf_boost::register_symfony_tools(registry, context);
        return registry;
    }
}

int main(int argc, char** argv) {
    CLI::App app{"Symfony Boost - MCP server exposing a Symfony project to AI assistants"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string log_file;
    app.add_option("--log-file", log_file, "Also append log records to this file");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    std::string project;
    app.add_option("-p,--project", project, "Symfony project root (default: current directory)");

    std::string database_url;
    app.add_option("--database-url", database_url, "Database URL (default: DATABASE_URL from environment or .env)");

    std::string php_binary = "php";
    app.add_option("--php", php_binary, "PHP interpreter used for console commands")
        ->default_val("php");

    auto* install = app.add_subcommand("install",
        "Install Symfony Boost in a Symfony project (creates .mcp.json and .claude/settings.local.json)");
    sf_boost::InstallOptions install_options;
    install->add_option("--path", install_options.binary_path, "Path to symfony-boost binary (if not in PATH)");
    install->add_flag("-f,--force", install_options.force, "Overwrite existing configuration");
    install->add_flag("-y,--yes", install_options.assume_yes, "Answer yes to every question");
    // Global options are also accepted after "install"
    install->fallthrough();

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << sf_boost::kServerName << " version " << sf_boost::kServerVersion << std::endl;
        return 0;
    }

    try {
        sf_boost::configure_logging(log_level, log_file);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    try {
        auto config = sf_boost::ServerConfig::resolve(project, database_url, php_binary);

        if (*install) {
            std::vector<std::string> tool_names;
            for (const auto& info : build_registry(config).list()) {
                tool_names.push_back(info.name);
            }
            install_options.project_root = config.project_root;
            sf_boost::InstallCommand command(install_options, tool_names, std::cin, std::cout);
            return command.run();
        }

        spdlog::info("Starting {} {}", sf_boost::kServerName, sf_boost::kServerVersion);
        spdlog::info("Project root: {}", config.project_root.string());

        setup_signal_handlers();

        auto registry = build_registry(config);
        spdlog::info("{} tools registered, starting server", registry.size());

        auto transport = std::make_unique<sf_boost::StdioTransport>();
        auto server = std::make_unique<sf_boost::MCPServer>(
            std::move(transport),
            std::move(registry),
            sf_boost::ServerIdentity{sf_boost::kServerName, sf_boost::kServerVersion,
                                     sf_boost::kProtocolVersion});

        global_server = server.get();

        // Blocks until end of input or a stop signal
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
