#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace sf_boost {

/**
 * @brief Exception thrown when a subprocess cannot be started or read
 */
class ProcessError : public std::runtime_error {
public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Captured result of a finished subprocess
 */
struct ProcessResult {
    int exit_code = -1;
    std::string output;  // stdout and stderr, interleaved
};

/**
 * @brief Run a program to completion and capture its output
 *
 * The child gets /dev/null as stdin so it can never consume protocol input
 * from the server's own stdin. The executable is looked up in PATH.
 *
 * @param argv Program followed by its arguments
 * @param working_directory Directory to run in (empty keeps the current one)
 * @throws ProcessError when the process cannot be spawned
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::filesystem::path& working_directory = {});

/**
 * @brief Quote a string for /bin/sh
 */
std::string shell_quote(const std::string& text);

} // namespace sf_boost
