#include "DatabaseUrl.hpp"
#include "StringUtil.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sf_boost {

namespace {

std::string driver_for_scheme(const std::string& scheme) {
    if (scheme == "mysql" || scheme == "mysqli") {
        return "pdo_mysql";
    }
    if (scheme == "pgsql" || scheme == "postgres" || scheme == "postgresql") {
        return "pdo_pgsql";
    }
    if (scheme == "sqlite" || scheme == "sqlite3") {
        return "pdo_sqlite";
    }
    return "pdo_mysql";
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string sqlite_path(std::string path, const std::filesystem::path& project_root) {
    // "sqlite:///relative.db" and "sqlite:////absolute.db": drop the separator slash
    if (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    if (path.empty() || path == ":memory:") {
        return ":memory:";
    }

    static const std::string kProjectDir = "%kernel.project_dir%";
    auto pos = path.find(kProjectDir);
    if (pos != std::string::npos) {
        path.replace(pos, kProjectDir.size(), project_root.string());
    }

    std::filesystem::path file(path);
    if (file.is_relative()) {
        file = project_root / file;
    }
    return file.lexically_normal().string();
}

} // namespace

std::string DatabaseConfig::platform_name() const {
    if (driver == "pdo_sqlite") {
        return "SQLitePlatform";
    }
    if (driver == "pdo_pgsql") {
        return "PostgreSQLPlatform";
    }
    return "MySQLPlatform";
}

std::string percent_decode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hex_value(text[i + 1]);
            int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

DatabaseConfig parse_database_url(const std::string& url,
                                  const std::filesystem::path& project_root) {
    DatabaseConfig config;
    std::string rest = trim(url, " \t\r\n\"'");

    std::string scheme;
    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        scheme = to_lower(rest.substr(0, scheme_end));
        rest = rest.substr(scheme_end + 3);
    }
    config.driver = driver_for_scheme(scheme);

    // Query string and fragment carry driver options we do not use
    auto query = rest.find_first_of("?#");
    if (query != std::string::npos) {
        rest = rest.substr(0, query);
    }

    std::string authority;
    std::string path;
    if (scheme.empty()) {
        path = rest;
    } else {
        auto slash = rest.find('/');
        authority = rest.substr(0, slash);
        if (slash != std::string::npos) {
            path = rest.substr(slash);
        }
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        auto colon = userinfo.find(':');
        config.user = percent_decode(userinfo.substr(0, colon));
        if (colon != std::string::npos) {
            config.password = percent_decode(userinfo.substr(colon + 1));
        }
    }

    std::string host = authority;
    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host in DATABASE_URL");
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (!host.empty()) {
        config.host = host;
    }
    if (!port.empty()) {
        if (!std::all_of(port.begin(), port.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw std::invalid_argument("Invalid port in DATABASE_URL: " + port);
        }
        config.port = std::stoi(port);
    }

    std::string decoded_path = percent_decode(path);
    config.dbname = trim(decoded_path, "/");
    if (config.is_sqlite()) {
        config.path = sqlite_path(decoded_path, project_root);
    }

    spdlog::debug("Parsed DATABASE_URL: driver={}, host={}, port={}, dbname={}",
                  config.driver, config.host, config.port, config.dbname);
    return config;
}

} // namespace sf_boost
