#include "MessageCodec.hpp"
#include <spdlog/spdlog.h>

namespace sf_boost {

std::string Request::method_name() const {
    if (method.is_string()) {
        return method.get<std::string>();
    }
    if (method.is_null()) {
        return "";
    }
    return method.dump();
}

Request MessageCodec::decode(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::error("JSON parse error: {}", e.what());
        throw ProtocolError(error_code::kParseError, std::string("Parse error: ") + e.what());
    }

    if (!message.is_object()) {
        throw ProtocolError(error_code::kInternalError,
                            "Internal error: request must be a JSON object");
    }

    Request request;
    request.id = message.value("id", json());
    request.method = message.value("method", json());
    request.params = message.value("params", json::object());
    if (request.params.is_null()) {
        request.params = json::object();
    }
    return request;
}

std::string MessageCodec::encode(const json& response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace sf_boost
