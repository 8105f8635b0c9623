#include "ListRoutesTool.hpp"
#include <stdexcept>

namespace sf_boost {

ListRoutesTool::ListRoutesTool(std::shared_ptr<SymfonyConsole> console)
    : console_(std::move(console)) {
    if (!console_) {
        throw std::invalid_argument("Console cannot be null");
    }
}

ToolInfo ListRoutesTool::get_info() {
    return {
        "list_routes",
        "Lists all Symfony routes",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json ListRoutesTool::execute(const json&) {
    std::string output = console_->run({"debug:router", "--format=json"});
    if (output.empty()) {
        return "Could not retrieve routes";
    }
    return output;
}

} // namespace sf_boost
