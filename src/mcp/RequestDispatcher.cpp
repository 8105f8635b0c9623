#include "RequestDispatcher.hpp"
#include <spdlog/spdlog.h>

namespace sf_boost {

RequestDispatcher::RequestDispatcher(const ToolRegistry& registry, ServerIdentity identity)
    : registry_(registry), identity_(std::move(identity)) {}

json RequestDispatcher::dispatch(const Request& request) const {
    const json& id = request.id;
    std::string method = request.method_name();

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    try {
        if (!request.method.is_string()) {
            return make_error_response(id, error_code::kMethodNotFound,
                                       "Method not found: " + method);
        }

        if (method == "initialize") {
            return make_result_response(id, handle_initialize(request.params));
        } else if (method == "tools/list") {
            return make_result_response(id, handle_tools_list());
        } else if (method == "tools/call") {
            return make_result_response(id, handle_tools_call(id, request.params));
        } else if (method == "ping") {
            return make_result_response(id, json::object());
        }
        return make_error_response(id, error_code::kMethodNotFound, "Method not found: " + method);
    } catch (const ProtocolError& e) {
        spdlog::warn("Request {} rejected: {}", method, e.what());
        return make_error_response(id, e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return make_error_response(id, error_code::kInternalError, e.what());
    } catch (...) {
        spdlog::error("Unknown failure handling method {}", method);
        return make_error_response(id, error_code::kInternalError, "Unknown error");
    }
}

json RequestDispatcher::normalize_tool_result(const json& result) {
    if (result.is_string()) {
        return json::array({
            {{"type", "text"}, {"text", result.get<std::string>()}}
        });
    }

    if (result.is_object()) {
        auto it = result.find("content");
        if (it != result.end() && it->is_array()) {
            return *it;
        }
    }

    return json::array({
        {{"type", "text"}, {"text", result.dump(4, ' ', false, json::error_handler_t::replace)}}
    });
}

json RequestDispatcher::handle_initialize(const json& params) const {
    spdlog::info("Handling initialize request");

    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const json& client = params["clientInfo"];
        auto field = [&client](const char* key) {
            auto it = client.find(key);
            return (it != client.end() && it->is_string()) ? it->get<std::string>()
                                                           : std::string("unknown");
        };
        spdlog::info("Client: {} version {}", field("name"), field("version"));
    }

    return {
        {"protocolVersion", identity_.protocol_version},
        {"serverInfo", {
            {"name", identity_.name},
            {"version", identity_.version}
        }},
        {"capabilities", {
            {"tools", json::object()}
        }}
    };
}

json RequestDispatcher::handle_tools_list() const {
    json tools_array = json::array();

    for (const auto& info : registry_.list()) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json RequestDispatcher::handle_tools_call(const json& id, const json& params) const {
    std::string tool_name;
    if (params.is_object() && params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    }

    const ToolDescriptor* tool = registry_.lookup(tool_name);
    if (tool == nullptr) {
        throw ProtocolError(error_code::kInvalidParams, "Tool not found: " + tool_name, id);
    }

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    json result = tool->invoke(arguments);

    return {{"content", normalize_tool_result(result)}};
}

} // namespace sf_boost
