#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace sf_boost {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_line() {
    std::string line;

    if (!std::getline(in_, line)) {
        if (in_.eof()) {
            spdlog::debug("Reached end of input stream");
        } else {
            spdlog::error("Error reading from input stream");
        }
        return std::nullopt;
    }

    // Clients on Windows may send CRLF
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    spdlog::trace("Read line: {}", line);
    return line;
}

void StdioTransport::write_line(const std::string& line) {
    out_ << line << std::endl;  // std::endl flushes automatically
    if (!out_) {
        throw std::runtime_error("Failed to write to output stream");
    }
    spdlog::trace("Wrote line: {}", line);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace sf_boost
