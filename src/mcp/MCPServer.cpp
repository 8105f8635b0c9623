#include "MCPServer.hpp"
#include "MessageCodec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sf_boost {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ToolRegistry registry,
                     ServerIdentity identity)
    : transport_(std::move(transport)),
      registry_(std::move(registry)),
      dispatcher_(registry_, std::move(identity)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized with {} tools", registry_.size());
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        auto line = transport_->read_line();
        if (!line) {
            spdlog::info("Input closed, stopping server");
            break;
        }

        if (is_blank(*line)) {
            continue;
        }

        json response = handle_line(*line);

        try {
            send(response);
        } catch (const std::exception& e) {
            spdlog::error("Failed to send response, stopping server: {}", e.what());
            break;
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

json MCPServer::handle_line(const std::string& line) const {
    json id;
    try {
        Request request = MessageCodec::decode(line);
        id = request.id;
        return dispatcher_.dispatch(request);
    } catch (const ProtocolError& e) {
        return make_error_response(e.id(), e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error in main loop: {}", e.what());
        return make_error_response(id, error_code::kInternalError,
                                   std::string("Internal error: ") + e.what());
    }
}

void MCPServer::send(const json& response) {
    std::string line;
    try {
        line = MessageCodec::encode(response);
    } catch (const std::exception& e) {
        spdlog::error("Failed to serialize response: {}", e.what());
        json id = response.is_object() ? response.value("id", json()) : json();
        line = MessageCodec::encode(make_error_response(
            id, error_code::kInternalError, std::string("Internal error: ") + e.what()));
    }
    transport_->write_line(line);
}

} // namespace sf_boost
