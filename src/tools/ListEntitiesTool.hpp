#pragma once

#include "mcp/ToolRegistry.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace sf_boost {

/**
 * @brief MCP tool listing Doctrine entities under src/Entity
 *
 * A class counts as an entity when its file carries the #[ORM\Entity]
 * attribute (with or without arguments) or the @ORM\Entity annotation.
 * Subdirectories are not scanned.
 */
class ListEntitiesTool {
public:
    explicit ListEntitiesTool(std::filesystem::path project_root);

    static ToolInfo get_info();

    /**
     * @return {"entities": [{"class", "table", "file"}], "count": n}
     */
    json execute(const json& args);

    /**
     * @brief Table name from #[ORM\Table(name: "...")], if present
     */
    static std::optional<std::string> table_name(const std::string& source);

    static bool is_entity(const std::string& source);

private:
    std::filesystem::path project_root_;
};

} // namespace sf_boost
