#include "ListEntitiesTool.hpp"
#include "core/PathResolver.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <regex>
#include <sstream>

namespace sf_boost {

ListEntitiesTool::ListEntitiesTool(std::filesystem::path project_root)
    : project_root_(std::move(project_root)) {}

ToolInfo ListEntitiesTool::get_info() {
    return {
        "list_entities",
        "Lists all Doctrine entities",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

bool ListEntitiesTool::is_entity(const std::string& source) {
    static const std::regex entity_marker(R"((#\[ORM\\Entity|@ORM\\Entity)\b)");
    return std::regex_search(source, entity_marker);
}

std::optional<std::string> ListEntitiesTool::table_name(const std::string& source) {
    static const std::regex table_attribute(R"re(#\[ORM\\Table\(name:\s*["']([^"']+)["'])re");
    std::smatch match;
    if (std::regex_search(source, match, table_attribute)) {
        return match[1].str();
    }
    return std::nullopt;
}

json ListEntitiesTool::execute(const json&) {
    auto entity_dir = project_root_ / "src" / "Entity";
    if (!std::filesystem::is_directory(entity_dir)) {
        return {{"error", "Entity directory not found"}};
    }

    json entities = json::array();
    for (const auto& file : PathResolver::find_files(entity_dir, {"*.php"})) {
        std::ifstream in(file);
        if (!in) {
            spdlog::warn("Cannot read {}", file.string());
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        std::string source = buffer.str();

        if (!is_entity(source)) {
            continue;
        }

        auto table = table_name(source);
        entities.push_back({
            {"class", file.stem().string()},
            {"table", table ? json(*table) : json()},
            {"file", file.filename().string()}
        });
    }

    std::size_t count = entities.size();
    return {
        {"entities", std::move(entities)},
        {"count", count}
    };
}

} // namespace sf_boost
