#include "PathResolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>

namespace sf_boost {

bool PathResolver::matches_pattern(const std::filesystem::path& path, const std::string& pattern) {
    // Convert glob pattern to regex
    // Example: "*.php" -> ".*\.php"
    std::string escaped;
    for (char c : pattern) {
        if (c == '*') {
            escaped += ".*";
        } else if (c == '?') {
            escaped += ".";
        } else if (std::string(".^$+()[]{}|\\").find(c) != std::string::npos) {
            escaped += '\\';
            escaped += c;
        } else {
            escaped += c;
        }
    }

    std::regex re("^" + escaped + "$");
    return std::regex_match(path.filename().string(), re);
}

bool PathResolver::matches_any(const std::filesystem::path& path,
                               const std::vector<std::string>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&path](const std::string& pattern) { return matches_pattern(path, pattern); });
}

std::vector<std::filesystem::path> PathResolver::find_files(
    const std::filesystem::path& dir,
    const std::vector<std::string>& patterns,
    bool recursive
) {
    std::vector<std::filesystem::path> results;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        spdlog::debug("Path is not a directory: {}", dir.string());
        return results;
    }

    try {
        if (recursive) {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
                if (entry.is_regular_file() && matches_any(entry.path(), patterns)) {
                    results.push_back(entry.path());
                }
            }
        } else {
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_regular_file() && matches_any(entry.path(), patterns)) {
                    results.push_back(entry.path());
                }
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Error scanning directory {}: {}", dir.string(), e.what());
    }

    std::sort(results.begin(), results.end());
    spdlog::debug("Found {} files in {}", results.size(), dir.string());
    return results;
}

} // namespace sf_boost
