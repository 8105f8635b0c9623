#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sf_boost {

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    auto it = index_.find(info.name);
    if (it != index_.end()) {
        spdlog::warn("Tool {} registered twice, replacing previous definition", info.name);
        tools_[it->second] = ToolDescriptor{info, std::move(handler)};
        return;
    }

    index_.emplace(info.name, tools_.size());
    tools_.push_back(ToolDescriptor{info, std::move(handler)});
    spdlog::info("Registered tool: {}", info.name);
}

void ToolRegistry::register_tool(const std::string& name, const std::string& description,
                                 const json& input_schema, ToolHandler handler) {
    register_tool(ToolInfo{name, description, input_schema}, std::move(handler));
}

std::vector<ToolInfo> ToolRegistry::list() const {
    std::vector<ToolInfo> infos;
    infos.reserve(tools_.size());
    for (const auto& tool : tools_) {
        infos.push_back(tool.info);
    }
    return infos;
}

const ToolDescriptor* ToolRegistry::lookup(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

} // namespace sf_boost
