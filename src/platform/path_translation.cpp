#include <gmcp/config/config_helpers.h>
#include <gmcp/platform/path_translation.h>

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gmcp::platform {

namespace {

bool isDriveLetter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isHex(std::string_view s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

} // namespace

std::optional<std::string> windowsDriveToWslPath(std::string_view p) {
    auto t = config::trimmed(p);
    if (t.size() < 3 || !isDriveLetter(t[0]) || t[1] != ':' || (t[2] != '\\' && t[2] != '/')) {
        return std::nullopt;
    }
    std::string rest = t.substr(3);
    for (auto& c : rest) {
        if (c == '\\')
            c = '/';
    }
    std::string out = "/mnt/";
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(t[0]))));
    out.push_back('/');
    out += rest;
    return out;
}

std::optional<std::string> wslPathToWindowsDrive(std::string_view p) {
    auto t = config::trimmed(p);
    if (t.size() < 7 || !t.starts_with("/mnt/") || !isDriveLetter(t[5]) || t[6] != '/') {
        return std::nullopt;
    }
    std::string rest = t.substr(7);
    for (auto& c : rest) {
        if (c == '/')
            c = '\\';
    }
    std::string out;
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(t[5]))));
    out += ":\\";
    out += rest;
    return out;
}

bool isWindowsExePath(std::string_view p) {
    return config::to_lower(config::trimmed(p)).ends_with(".exe");
}

bool isWslEnvironment() {
#if defined(__linux__)
    return config::get_env("WSL_DISTRO_NAME").has_value() ||
           config::get_env("WSL_INTEROP").has_value();
#else
    return false;
#endif
}

bool shouldTranslatePathsForWindowsExe(std::string_view exe) {
#ifdef _WIN32
    (void)exe;
    return false;
#else
    return isWindowsExePath(exe);
#endif
}

std::vector<std::string> translateArgsForWindowsExe(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    out.reserve(args.size());
    bool translateNext = false;
    for (const auto& arg : args) {
        if (translateNext) {
            translateNext = false;
            if (!arg.starts_with("res://") && !arg.starts_with("user://")) {
                if (auto win = wslPathToWindowsDrive(arg)) {
                    out.push_back(*win);
                    continue;
                }
            }
            out.push_back(arg);
            continue;
        }
        if (arg == "--path" || arg == "--script") {
            translateNext = true;
        }
        out.push_back(arg);
    }
    return out;
}

std::string normalizeProjectPathForCompare(std::string_view p) {
    auto t = config::trimmed(p);
    if (t.empty()) {
        return {};
    }

    bool caseInsensitive = false;
    if (auto mnt = windowsDriveToWslPath(t)) {
        t = *mnt;
        caseInsensitive = true;
    } else if (t.find('\\') != std::string::npos) {
        for (auto& c : t) {
            if (c == '\\')
                c = '/';
        }
        caseInsensitive = true;
    }
    if (t.starts_with("/mnt/") && t.size() >= 7 && isDriveLetter(t[5]) && t[6] == '/') {
        caseInsensitive = true;
    }
#if defined(_WIN32) || defined(__APPLE__)
    caseInsensitive = true;
#endif

    std::filesystem::path path(t);
    if (path.is_relative()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            path = cwd / path;
        }
    }
    auto normalized = path.lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return caseInsensitive ? config::to_lower(normalized) : normalized;
}

std::optional<std::string> parseDefaultGatewayFromRouteTable(std::string_view routeTable) {
    std::istringstream in{std::string(routeTable)};
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        std::istringstream cols(line);
        std::string iface, destination, gateway;
        if (!(cols >> iface >> destination >> gateway)) {
            continue;
        }
        if (destination != "00000000" || !isHex(gateway) || gateway.size() > 8) {
            continue;
        }
        // The kernel prints the raw network-order word as a host integer
        in_addr addr{};
        addr.s_addr = static_cast<in_addr_t>(std::stoul(gateway, nullptr, 16));
        char buf[INET_ADDRSTRLEN] = {};
        if (addr.s_addr == 0 || ::inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
            continue;
        }
        return std::string(buf);
    }
    return std::nullopt;
}

std::optional<std::string> readWslGatewayIp() {
    if (!isWslEnvironment()) {
        return std::nullopt;
    }
    std::ifstream f("/proc/net/route");
    if (!f) {
        spdlog::debug("path_translation: /proc/net/route not readable");
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return parseDefaultGatewayFromRouteTable(buffer.str());
}

} // namespace gmcp::platform
