#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace sf_boost {

/**
 * @brief Parse a level name (trace, debug, info, warn, error, critical)
 * @throws std::invalid_argument for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Install the process-wide logger
 *
 * Logs go to stderr, never stdout, which carries the protocol. When
 * @p log_file is set, records are also appended to that file.
 */
void configure_logging(const std::string& level, const std::string& log_file = "");

} // namespace sf_boost
