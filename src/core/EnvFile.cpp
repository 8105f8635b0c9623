#include "EnvFile.hpp"
#include "StringUtil.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <regex>

namespace sf_boost {

namespace {

const std::regex& assignment_regex() {
    static const std::regex re(R"(^(?:export\s+)?([A-Z_][A-Z0-9_]*)=(.*)$)");
    return re;
}

std::string unquote(std::string value) {
    value = trim(value);
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

template <typename Visitor>
void for_each_assignment(const std::filesystem::path& file, Visitor visit) {
    std::ifstream in(file);
    if (!in) {
        spdlog::debug("Env file not readable: {}", file.string());
        return;
    }

    std::string line;
    std::smatch match;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (std::regex_match(line, match, assignment_regex())) {
            visit(match[1].str(), match[2].str());
        }
    }
}

} // namespace

std::vector<std::string> EnvFile::variable_names(const std::filesystem::path& file) {
    std::vector<std::string> names;
    for_each_assignment(file, [&names](const std::string& name, const std::string&) {
        names.push_back(name);
    });
    return names;
}

std::optional<std::string> EnvFile::lookup(const std::filesystem::path& file,
                                           const std::string& name) {
    std::optional<std::string> value;
    for_each_assignment(file, [&](const std::string& key, const std::string& raw) {
        if (key == name) {
            value = unquote(raw);
        }
    });
    return value;
}

} // namespace sf_boost
