#include <charconv>
#include <fstream>
#include <gmcp/config/config_helpers.h>

namespace gmcp::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Dotted form "section.key" is accepted anywhere
        bool matches = in_target_section && k == key;
        if (!matches && !section.empty() && k == section + "." + key) {
            matches = true;
        }
        if (!matches) {
            continue;
        }

        // Inline comments only outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }
        return unquote(v);
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (auto env = get_env_nonempty("GMCP_CONFIG")) {
        return expand_tilde(*env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }

    return configHome / "gmcp" / "config.toml";
}

std::optional<std::string> resolve_setting(const char* envKey, const std::string& section,
                                           const std::string& key) {
    if (envKey) {
        if (auto env = get_env_nonempty(envKey)) {
            return env;
        }
    }

    auto path = get_config_path();
    if (path.empty()) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    auto value = parse_config_value(path, section, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> parse_port(std::string_view raw) {
    auto s = trimmed(raw);
    if (s.empty()) {
        return std::nullopt;
    }
    int port = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

} // namespace gmcp::config
