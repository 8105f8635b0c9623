#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace sf_boost {

using json = nlohmann::json;

/**
 * @brief JSON-RPC 2.0 error codes used by the server
 */
namespace error_code {
constexpr int kParseError = -32700;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
} // namespace error_code

constexpr const char* kJsonRpcVersion = "2.0";

/**
 * @brief Failure that already knows its JSON-RPC error code
 *
 * Raised by the codec when a line cannot be turned into a request.
 * Carries the best request id recovered so far (null when unknown).
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, json id = nullptr)
        : std::runtime_error(message), code_(code), id_(std::move(id)) {}

    int code() const { return code_; }
    const json& id() const { return id_; }

private:
    int code_;
    json id_;
};

/**
 * @brief Build a success response envelope
 */
inline json make_result_response(const json& id, json result) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", std::move(result)}
    };
}

/**
 * @brief Build an error response envelope
 * @param data Optional supplementary data, omitted when null
 */
inline json make_error_response(const json& id, int code, const std::string& message,
                                const json& data = nullptr) {
    json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", error}
    };
}

} // namespace sf_boost
