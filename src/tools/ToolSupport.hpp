#pragma once

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <regex>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace sf_boost {

using json = nlohmann::json;

/**
 * @brief Failure of a tool call, reported to the client as an error response
 */
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Required string argument
 * @throws ToolError when missing or not a string
 */
inline std::string require_string(const json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        throw ToolError("Missing required parameter: " + key);
    }
    return args[key].get<std::string>();
}

/**
 * @brief Optional string argument with default
 */
inline std::string optional_string(const json& args, const std::string& key,
                                   const std::string& fallback) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return fallback;
    }
    if (!args[key].is_string()) {
        throw ToolError("Parameter " + key + " must be a string");
    }
    return args[key].get<std::string>();
}

/**
 * @brief Optional integer argument with default; numeric strings are accepted
 */
inline long long optional_integer(const json& args, const std::string& key, long long fallback) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return fallback;
    }
    const json& value = args[key];
    constexpr auto lowest = std::numeric_limits<long long>::min();
    constexpr auto highest = std::numeric_limits<long long>::max();
    if (value.is_number_unsigned()) {
        if (value.get<unsigned long long>() > static_cast<unsigned long long>(highest)) {
            throw ToolError("Parameter " + key + " is out of range");
        }
        return value.get<long long>();
    }
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number()) {
        // -(double)lowest is 2^63, one past the largest long long
        double number = value.get<double>();
        if (!(number >= static_cast<double>(lowest) && number < -static_cast<double>(lowest))) {
            throw ToolError("Parameter " + key + " is out of range");
        }
        return static_cast<long long>(number);
    }
    if (value.is_string()) {
        const std::string& text = value.get_ref<const std::string&>();
        char* end = nullptr;
        errno = 0;
        long long parsed = std::strtoll(text.c_str(), &end, 10);
        if (!text.empty() && end != nullptr && *end == '\0') {
            if (errno == ERANGE) {
                throw ToolError("Parameter " + key + " is out of range");
            }
            return parsed;
        }
    }
    throw ToolError("Parameter " + key + " must be an integer");
}

/**
 * @brief var/log/<env>.log of a Symfony project
 * @throws ToolError when env is not a plain environment name
 */
inline std::filesystem::path symfony_log_path(const std::filesystem::path& project_root,
                                              const std::string& env) {
    static const std::regex env_name(R"([A-Za-z0-9_-]+)");
    if (!std::regex_match(env, env_name)) {
        throw ToolError("Invalid environment name: " + env);
    }
    return project_root / "var" / "log" / (env + ".log");
}

} // namespace sf_boost
