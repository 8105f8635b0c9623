#include "MockTransport.hpp"
#include <stdexcept>

namespace sf_boost {

std::optional<std::string> MockTransport::read_line() {
    if (!open_ || requests_.empty()) {
        return std::nullopt;  // EOF
    }

    std::string line = requests_.front();
    requests_.pop();
    return line;
}

void MockTransport::write_line(const std::string& line) {
    if (fail_writes_) {
        throw std::runtime_error("Broken pipe");
    }
    if (open_) {
        responses_.push(line);
    }
}

bool MockTransport::is_open() const {
    return open_;
}

void MockTransport::push_line(const std::string& line) {
    requests_.push(line);
}

void MockTransport::push_request(const json& request) {
    requests_.push(request.dump());
}

std::string MockTransport::pop_line() {
    if (responses_.empty()) {
        return "";
    }

    std::string line = responses_.front();
    responses_.pop();
    return line;
}

json MockTransport::pop_response() {
    if (responses_.empty()) {
        return json();
    }
    return json::parse(pop_line());
}

bool MockTransport::has_responses() const {
    return !responses_.empty();
}

void MockTransport::close() {
    open_ = false;
}

} // namespace sf_boost
