#include "Logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <stdexcept>
#include <vector>

namespace sf_boost {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace") {
        return spdlog::level::trace;
    } else if (name == "debug") {
        return spdlog::level::debug;
    } else if (name == "info") {
        return spdlog::level::info;
    } else if (name == "warn") {
        return spdlog::level::warn;
    } else if (name == "error") {
        return spdlog::level::err;
    } else if (name == "critical") {
        return spdlog::level::critical;
    }
    throw std::invalid_argument("Invalid log level: " + name);
}

void configure_logging(const std::string& level, const std::string& log_file) {
    auto parsed = parse_log_level(level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
    }

    auto logger = std::make_shared<spdlog::logger>("symfony-boost", sinks.begin(), sinks.end());
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace sf_boost
