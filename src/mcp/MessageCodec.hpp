#pragma once

#include "JsonRpc.hpp"
#include <string>

namespace sf_boost {

/**
 * @brief Decoded JSON-RPC request
 *
 * Fields are kept as raw JSON so the dispatcher can report a missing or
 * mistyped method itself instead of failing in the codec.
 */
struct Request {
    json id;      // null when absent
    json method;  // null when absent, may be any JSON type
    json params;  // empty object when absent or null

    /**
     * @brief Method as text for logging and error messages
     */
    std::string method_name() const;
};

/**
 * @brief Converts between wire lines and JSON-RPC messages
 */
class MessageCodec {
public:
    /**
     * @brief Parse one input line into a request
     * @throws ProtocolError with kParseError for malformed JSON,
     *         kInternalError when the document is not an object
     */
    static Request decode(const std::string& line);

    /**
     * @brief Serialize a response envelope as one compact line (no newline)
     *
     * Slashes and non-ASCII text are written as-is; invalid UTF-8 is replaced
     * with U+FFFD rather than failing.
     */
    static std::string encode(const json& response);
};

} // namespace sf_boost
