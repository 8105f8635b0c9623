#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sf_boost {

/**
 * @brief Reads the end of (possibly large) log files
 */
class LogReader {
public:
    /**
     * @brief Last @p count lines of a file, oldest first
     *
     * Reads backwards in blocks so the cost depends on the lines returned,
     * not on the file size.
     *
     * @throws std::runtime_error when the file cannot be opened
     */
    static std::vector<std::string> tail(const std::filesystem::path& file, std::size_t count);

    /**
     * @brief Keep lines mentioning ERROR, CRITICAL or EMERGENCY (any case)
     */
    static std::vector<std::string> error_lines(const std::vector<std::string>& lines);

    /**
     * @brief Join lines with '\n', with a trailing newline when non-empty
     */
    static std::string join(const std::vector<std::string>& lines);
};

} // namespace sf_boost
