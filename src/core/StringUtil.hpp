#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace sf_boost {

inline std::string trim(const std::string& text, const char* chars = " \t\r\n") {
    auto begin = text.find_first_not_of(chars);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(chars);
    return text.substr(begin, end - begin + 1);
}

inline std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

inline std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace sf_boost
