#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gmcp::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

inline std::string trimmed(std::string_view in) {
    std::string s{in};
    trim(s);
    return s;
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 2 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

inline std::string to_lower(std::string_view in) {
    std::string out{in};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Environment lookup distinguishing "unset" (nullopt) from "set but empty" ("").
inline std::optional<std::string> get_env(const char* key) {
    if (const char* v = std::getenv(key)) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Environment lookup that treats empty or whitespace-only values as unset.
inline std::optional<std::string> get_env_nonempty(const char* key) {
    auto v = get_env(key);
    if (!v) {
        return std::nullopt;
    }
    auto t = trimmed(*v);
    if (t.empty()) {
        return std::nullopt;
    }
    return t;
}

// Parse a value from an ini/TOML-style config file. Returns "" when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Get standard config path ($GMCP_CONFIG, else $XDG_CONFIG_HOME/gmcp/config.toml)
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Resolution order: env → config file [section] key → std::nullopt.
std::optional<std::string> resolve_setting(const char* envKey, const std::string& section,
                                           const std::string& key);

/// Parses a TCP port (1..65535). Returns nullopt for anything else.
std::optional<int> parse_port(std::string_view raw);

// Project-relative paths and defaults for the editor bridge
inline constexpr std::string_view kProjectDescriptor = "project.godot";
inline constexpr std::string_view kBridgePluginId = "godot_mcp_bridge";
inline constexpr std::string_view kAddonDir = "addons/godot_mcp_bridge";
inline constexpr std::string_view kAddonMarker = "addons/godot_mcp_bridge/plugin.cfg";
inline constexpr std::string_view kTokenFile = ".godot_mcp_token";
inline constexpr std::string_view kPortFile = ".godot_mcp_port";
inline constexpr std::string_view kHostFile = ".godot_mcp_host";
inline constexpr std::string_view kLockFile = ".godot_mcp/bridge.lock";
inline constexpr std::string_view kSelfTestDir = ".godot_mcp/selftest";
inline constexpr std::string_view kDefaultReportPath = ".godot_mcp/reports/doctor_report.md";
inline constexpr std::string_view kDefaultBridgeHost = "127.0.0.1";
inline constexpr int kDefaultBridgePort = 8765;

} // namespace gmcp::config
