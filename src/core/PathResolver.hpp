#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sf_boost {

/**
 * @brief Finds project files by glob pattern
 *
 * Used to scan Symfony source directories (src/Entity, config, ...).
 */
class PathResolver {
public:
    /**
     * @brief Files in a directory whose names match any pattern
     *
     * @param dir Directory to scan; a missing directory yields no files
     * @param patterns Glob patterns on the file name (e.g., "*.php")
     * @param recursive If true, scan subdirectories too
     * @return Matching regular files, sorted by path
     */
    static std::vector<std::filesystem::path> find_files(
        const std::filesystem::path& dir,
        const std::vector<std::string>& patterns = {"*.php"},
        bool recursive = false
    );

    /**
     * @brief Check if filename matches glob pattern
     *
     * Supports simple wildcards: *.php, *Repository.php, Entity?.php
     */
    static bool matches_pattern(const std::filesystem::path& path, const std::string& pattern);

private:
    static bool matches_any(const std::filesystem::path& path, const std::vector<std::string>& patterns);
};

} // namespace sf_boost
