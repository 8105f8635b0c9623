#include "LogReader.hpp"
#include "StringUtil.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace sf_boost {

namespace {

constexpr std::streamoff kBlockSize = 8192;

} // namespace

std::vector<std::string> LogReader::tail(const std::filesystem::path& file, std::size_t count) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open log file: " + file.string());
    }
    if (count == 0) {
        return {};
    }

    in.seekg(0, std::ios::end);
    std::streamoff position = in.tellg();

    // Collect blocks from the end until there are more newlines than lines wanted
    std::string buffer;
    std::size_t newlines = 0;
    while (position > 0 && newlines <= count) {
        std::streamoff size = std::min(kBlockSize, position);
        position -= size;

        std::string block(static_cast<std::size_t>(size), '\0');
        in.seekg(position);
        in.read(&block[0], size);

        newlines += static_cast<std::size_t>(std::count(block.begin(), block.end(), '\n'));
        buffer.insert(0, block);
    }

    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < buffer.size()) {
        std::size_t end = buffer.find('\n', start);
        if (end == std::string::npos) {
            end = buffer.size();
        }
        std::string line = buffer.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }

    // The first line may be a partial one when we stopped mid-file
    if (lines.size() > count) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
    }

    spdlog::debug("Read {} trailing lines from {}", lines.size(), file.string());
    return lines;
}

std::vector<std::string> LogReader::error_lines(const std::vector<std::string>& lines) {
    std::vector<std::string> errors;
    for (const auto& line : lines) {
        std::string upper = to_upper(line);
        if (upper.find("ERROR") != std::string::npos ||
            upper.find("CRITICAL") != std::string::npos ||
            upper.find("EMERGENCY") != std::string::npos) {
            errors.push_back(line);
        }
    }
    return errors;
}

std::string LogReader::join(const std::vector<std::string>& lines) {
    std::string text;
    for (const auto& line : lines) {
        text += line;
        text += '\n';
    }
    return text;
}

} // namespace sf_boost
