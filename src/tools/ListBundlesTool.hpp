#pragma once

#include "mcp/ToolRegistry.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace sf_boost {

/**
 * @brief A bundle entry of config/bundles.php
 */
struct BundleInfo {
    std::string name;                       ///< Short class name
    std::string class_name;                 ///< Fully qualified class
    std::vector<std::string> environments;  ///< Environments mapped to true
};

/**
 * @brief MCP tool listing the bundles enabled in config/bundles.php
 *
 * The file is scanned textually for `Foo\BarBundle::class => [...]`
 * entries; PHP is not executed.
 */
class ListBundlesTool {
public:
    explicit ListBundlesTool(std::filesystem::path project_root);

    static ToolInfo get_info();
    json execute(const json& args);

    /**
     * @brief Bundle entries of a bundles.php source, in file order
     */
    static std::vector<BundleInfo> parse_bundles(const std::string& source);

private:
    std::filesystem::path project_root_;
};

} // namespace sf_boost
