#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sf_boost {

/**
 * @brief Minimal reader for dotenv files (.env, .env.local)
 *
 * Understands KEY=value lines, "#" comments and blank lines. Values may be
 * wrapped in single or double quotes. No variable interpolation.
 */
class EnvFile {
public:
    /**
     * @brief Variable names defined in the file, in file order
     *
     * Only upper-case names ([A-Z_][A-Z0-9_]*) are reported. A missing file
     * yields an empty list.
     */
    static std::vector<std::string> variable_names(const std::filesystem::path& file);

    /**
     * @brief Value of a variable, quotes stripped (last definition wins)
     */
    static std::optional<std::string> lookup(const std::filesystem::path& file,
                                             const std::string& name);
};

} // namespace sf_boost
