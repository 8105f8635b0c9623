#include "ListBundlesTool.hpp"
#include <fstream>
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace sf_boost {

ListBundlesTool::ListBundlesTool(std::filesystem::path project_root)
    : project_root_(std::move(project_root)) {}

ToolInfo ListBundlesTool::get_info() {
    return {
        "list_bundles",
        "Lists all installed Symfony bundles",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

std::vector<BundleInfo> ListBundlesTool::parse_bundles(const std::string& source) {
    static const std::regex entry_re(R"(([\w\\]+)::class\s*=>\s*\[([^\]]*)\])");
    static const std::regex env_re(R"(['"](\w+)['"]\s*=>\s*true)");

    std::vector<BundleInfo> bundles;
    for (auto it = std::sregex_iterator(source.begin(), source.end(), entry_re);
         it != std::sregex_iterator(); ++it) {
        BundleInfo info;
        info.class_name = (*it)[1].str();
        if (!info.class_name.empty() && info.class_name.front() == '\\') {
            info.class_name.erase(0, 1);
        }
        auto pos = info.class_name.rfind('\\');
        info.name = pos == std::string::npos ? info.class_name : info.class_name.substr(pos + 1);

        std::string envs = (*it)[2].str();
        for (auto env = std::sregex_iterator(envs.begin(), envs.end(), env_re);
             env != std::sregex_iterator(); ++env) {
            info.environments.push_back((*env)[1].str());
        }
        bundles.push_back(std::move(info));
    }
    return bundles;
}

json ListBundlesTool::execute(const json&) {
    auto bundles_file = project_root_ / "config" / "bundles.php";

    std::ifstream in(bundles_file);
    if (!in) {
        return {{"error", "bundles.php not found"}};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto bundles = parse_bundles(buffer.str());
    spdlog::debug("ListBundlesTool: {} bundles in {}", bundles.size(), bundles_file.string());

    json list = json::array();
    for (const auto& bundle : bundles) {
        list.push_back({
            {"name", bundle.name},
            {"class", bundle.class_name},
            {"environments", bundle.environments}
        });
    }

    return {
        {"bundles", list},
        {"count", list.size()}
    };
}

} // namespace sf_boost
