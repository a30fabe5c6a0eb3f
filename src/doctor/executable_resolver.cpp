#include <gmcp/config/config_helpers.h>
#include <gmcp/core/format.h>
#include <gmcp/doctor/executable_resolver.h>
#include <gmcp/platform/path_translation.h>
#include <gmcp/process/child_process.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <regex>
#include <set>

namespace gmcp::doctor {

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kLinuxBinaryPatterns = {
    R"(^Godot_v.*_linux\.(x86_64|x86_32|arm64|arm32)(_console)?$)",
    R"(^Godot(\.x86_64|\.x86_32|\.arm64|\.arm32)?$)",
};

const std::vector<std::string> kWindowsExePatterns = {
    R"(^Godot_v.*_win(64|32)(_console)?\.exe$)",
    R"(^Godot(_console)?\.exe$)",
};

const std::vector<std::string> kWindowsPortablePatterns = {
    R"(^Godot_v.*_win(64|32)(_console)?\.exe$)",
    R"(^Godot.*(_console)?\.exe$)",
};

const char* platformName(HostPlatform p) {
    switch (p) {
        case HostPlatform::Linux:
            return "linux";
        case HostPlatform::MacOS:
            return "darwin";
        case HostPlatform::Windows:
            return "win32";
    }
    return "unknown";
}

std::string normalizeCandidate(const std::string& raw) {
    if (raw.empty() || raw == "godot") {
        return raw;
    }
    // Windows-style strings are kept verbatim on POSIX hosts
    if (raw.find('\\') != std::string::npos) {
        return raw;
    }
    return fs::path(raw).lexically_normal().string();
}

void scanDir(const fs::path& dir, const std::regex& pattern, int depth, int maxDepth,
             std::vector<fs::path>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return;
    }
    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    for (const auto& entry : entries) {
        std::error_code typeEc;
        if (entry.is_regular_file(typeEc)) {
            if (std::regex_match(entry.path().filename().string(), pattern)) {
                out.push_back(entry.path());
            }
            continue;
        }
        if (entry.is_directory(typeEc) && depth < maxDepth) {
            scanDir(entry.path(), pattern, depth + 1, maxDepth, out);
        }
    }
}

} // namespace

HostPlatform currentPlatform() noexcept {
#if defined(_WIN32)
    return HostPlatform::Windows;
#elif defined(__APPLE__)
    return HostPlatform::MacOS;
#else
    return HostPlatform::Linux;
#endif
}

// ============================================================================
// ValidityCache
// ============================================================================

std::optional<bool> ValidityCache::lookup(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ValidityCache::store(const std::string& path, bool valid) {
    entries_[path] = valid;
}

// ============================================================================
// Free helpers
// ============================================================================

std::string disabledSentinelPath(HostPlatform platform) {
    switch (platform) {
        case HostPlatform::Windows:
            return R"(C:\__godot_disabled__\Godot.exe)";
        case HostPlatform::MacOS:
            return "/__godot_disabled__/Godot.app/Contents/MacOS/Godot";
        case HostPlatform::Linux:
            break;
    }
    return "/__godot_disabled__/godot";
}

std::string defaultExecutablePath(HostPlatform platform) {
    switch (platform) {
        case HostPlatform::Windows:
            return R"(C:\Program Files\Godot\Godot.exe)";
        case HostPlatform::MacOS:
            return "/Applications/Godot.app/Contents/MacOS/Godot";
        case HostPlatform::Linux:
            break;
    }
    return "/usr/bin/godot";
}

std::string normalizeExecutablePathForHost(const std::string& path, HostPlatform platform) {
    auto t = config::trimmed(path);
    if (t.empty() || t == "godot" || platform == HostPlatform::Windows) {
        return t;
    }
    return platform::windowsDriveToWslPath(t).value_or(t);
}

bool probeExecutableVersion(const std::string& path, std::chrono::milliseconds timeout) {
    auto resolved = normalizeExecutablePathForHost(path, currentPlatform());
    if (resolved.empty()) {
        return false;
    }
    std::error_code ec;
    if (resolved != "godot" && !fs::exists(resolved, ec)) {
        spdlog::debug("ExecutableResolver: {} does not exist", resolved);
        return false;
    }
    try {
        auto out = process::runCommand(
            process::ChildProcessConfig{.executable = resolved, .args = {"--version"}}, timeout);
        if (out.timedOut) {
            spdlog::debug("ExecutableResolver: '{} --version' timed out", resolved);
            return false;
        }
        bool ok = out.exitCode && *out.exitCode == 0;
        spdlog::debug("ExecutableResolver: '{} --version' exit={} -> {}", resolved,
                      out.exitCode.value_or(-1), ok ? "valid" : "invalid");
        return ok;
    } catch (const std::exception& e) {
        spdlog::debug("ExecutableResolver: cannot run {}: {}", resolved, e.what());
        return false;
    }
}

std::vector<fs::path> scanForExecutables(const fs::path& root,
                                         const std::vector<std::string>& patterns, int maxDepth) {
    std::vector<fs::path> found;
    for (const auto& p : patterns) {
        std::regex re(p, std::regex::ECMAScript | std::regex::icase);
        scanDir(root, re, 0, maxDepth, found);
    }
    return found;
}

DiscoveryContext
DiscoveryContext::fromEnvironment(const std::optional<fs::path>& dispatcherDir) {
    DiscoveryContext ctx;
    ctx.wsl = platform::isWslEnvironment();
    std::error_code ec;
    ctx.cwd = fs::current_path(ec);
    if (auto home = config::get_env_nonempty("HOME")) {
        ctx.home = *home;
    } else if (auto profile = config::get_env_nonempty("USERPROFILE")) {
        ctx.home = *profile;
    }
    if (auto profile = config::get_env_nonempty("USERPROFILE")) {
        ctx.userProfile = *profile;
    }
    if (auto local = config::get_env_nonempty("LOCALAPPDATA")) {
        ctx.localAppData = *local;
    }
    if (dispatcherDir && !dispatcherDir->empty()) {
        ctx.bundleRoots.push_back(*dispatcherDir);
    }
    if (!ctx.cwd.empty()) {
        ctx.bundleRoots.push_back(ctx.cwd);
        auto parent = ctx.cwd.parent_path();
        if (!parent.empty() && parent != ctx.cwd) {
            ctx.bundleRoots.push_back(parent);
        }
    }
    return ctx;
}

std::vector<std::pair<std::string, std::string>> discoverCandidates(const DiscoveryContext& ctx) {
    std::vector<std::pair<std::string, std::string>> out;
    std::set<std::string> seen;
    auto push = [&](const std::string& origin, const std::string& candidate) {
        if (candidate.empty()) {
            return;
        }
        auto normalized = normalizeCandidate(candidate);
        if (!seen.insert(normalized).second) {
            return;
        }
        out.emplace_back(origin, normalized);
    };
    auto pushScan = [&](const std::string& origin, const fs::path& root,
                        const std::vector<std::string>& patterns, int depth) {
        for (const auto& p : scanForExecutables(root, patterns, depth)) {
            push(origin, p.string());
        }
    };

    // 1) Bare name resolved through the search path
    push("auto:path", "godot");

    // 2) Well-known install locations, 3) portable download directories
    switch (ctx.platform) {
        case HostPlatform::Linux: {
            push("auto:platform", "/usr/bin/godot");
            push("auto:platform", "/usr/local/bin/godot");
            push("auto:platform", "/snap/bin/godot");
            if (!ctx.home.empty()) {
                push("auto:platform", (ctx.home / ".local" / "bin" / "godot").string());
                for (const auto& dir : {ctx.home / "Downloads", ctx.home / "Desktop",
                                        ctx.home / "godot", ctx.home / ".local" / "share" / "godot"}) {
                    pushScan("auto:portable", dir, kLinuxBinaryPatterns, 1);
                }
            }
            break;
        }
        case HostPlatform::MacOS: {
            push("auto:platform", "/Applications/Godot.app/Contents/MacOS/Godot");
            push("auto:platform", "/Applications/Godot_4.app/Contents/MacOS/Godot");
            if (!ctx.home.empty()) {
                auto h = ctx.home.string();
                push("auto:platform", h + "/Applications/Godot.app/Contents/MacOS/Godot");
                push("auto:platform", h + "/Applications/Godot_4.app/Contents/MacOS/Godot");
                push("auto:platform", h + "/Library/Application Support/Steam/steamapps/common/"
                                          "Godot Engine/Godot.app/Contents/MacOS/Godot");
                push("auto:portable", h + "/Downloads/Godot.app/Contents/MacOS/Godot");
            }
            break;
        }
        case HostPlatform::Windows: {
            push("auto:platform", R"(C:\Program Files\Godot\Godot.exe)");
            push("auto:platform", R"(C:\Program Files (x86)\Godot\Godot.exe)");
            push("auto:platform", R"(C:\Program Files\Godot_4\Godot.exe)");
            push("auto:platform", R"(C:\Program Files (x86)\Godot_4\Godot.exe)");
            if (!ctx.userProfile.empty()) {
                auto u = ctx.userProfile.string();
                push("auto:user", u + R"(\Godot\Godot.exe)");
                push("auto:user", u + R"(\AppData\Local\Programs\Godot\Godot.exe)");
                push("auto:user", u + R"(\AppData\Local\Programs\Godot Engine\Godot.exe)");
                push("auto:user", u + R"(\AppData\Local\Godot\Godot.exe)");
                push("auto:user", u + R"(\AppData\Local\Godot Engine\Godot.exe)");
            }
            if (!ctx.localAppData.empty()) {
                auto l = ctx.localAppData.string();
                push("auto:user", l + R"(\Programs\Godot\Godot.exe)");
                push("auto:user", l + R"(\Programs\Godot Engine\Godot.exe)");
                push("auto:user", l + R"(\Godot\Godot.exe)");
                push("auto:user", l + R"(\Godot Engine\Godot.exe)");
            }
            if (!ctx.userProfile.empty()) {
                for (const auto& dir :
                     {ctx.userProfile / "Downloads", ctx.userProfile / "Desktop",
                      ctx.userProfile / "Documents", ctx.userProfile / "Godot"}) {
                    pushScan("auto:portable", dir, kWindowsPortablePatterns, 1);
                }
            }
            break;
        }
    }

    // 4) Bundled next to the dispatcher or the working directory
    std::vector<std::string> bundlePatterns;
    if (ctx.platform == HostPlatform::Windows) {
        bundlePatterns = kWindowsExePatterns;
    } else if (ctx.platform == HostPlatform::Linux) {
        bundlePatterns = kLinuxBinaryPatterns;
        if (ctx.wsl) {
            bundlePatterns.insert(bundlePatterns.end(), kWindowsExePatterns.begin(),
                                  kWindowsExePatterns.end());
        }
    }
    if (bundlePatterns.empty()) {
        return out;
    }

    if (!ctx.cwd.empty()) {
        for (const auto& pattern : bundlePatterns) {
            pushScan("auto:cwd:.tmp", ctx.cwd / ".tmp" / "godot", {pattern}, 1);
            pushScan("auto:cwd:.tools", ctx.cwd / ".tools" / "godot", {pattern}, 2);
        }
    }

    for (const auto& root : ctx.bundleRoots) {
        std::error_code ec;
        fs::directory_iterator it(root, ec);
        if (ec) {
            continue;
        }
        std::vector<fs::path> bundleDirs;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            std::error_code typeEc;
            auto name = it->path().filename().string();
            if (it->is_directory(typeEc) && name.starts_with("Godot_")) {
                bundleDirs.push_back(it->path());
            }
        }
        std::sort(bundleDirs.begin(), bundleDirs.end());
        for (const auto& dir : bundleDirs) {
            pushScan("auto:bundle", dir, bundlePatterns, 2);
        }
    }

    return out;
}

// ============================================================================
// ExecutableResolver
// ============================================================================

ExecutableResolver::ExecutableResolver(ValidityCache& cache, ExecutableValidator validator,
                                       DiscoveryContext context)
    : cache_(cache), validator_(std::move(validator)), context_(std::move(context)) {}

bool ExecutableResolver::isValid(const std::string& path) {
    if (auto cached = cache_.lookup(path)) {
        return *cached;
    }
    bool valid = validator_ ? validator_(path) : false;
    cache_.store(path, valid);
    return valid;
}

ExecutableCandidate ExecutableResolver::tryCandidate(const std::string& origin,
                                                     const std::string& raw) {
    ExecutableCandidate c;
    c.origin = origin;
    c.rawCandidate = raw;
    c.normalizedPath = normalizeCandidate(raw);
    c.valid = isValid(c.normalizedPath);
    return c;
}

ExecutableResolution ExecutableResolver::resolve(const ResolverOptions& options) {
    ExecutableResolution res;
    const auto platform = context_.platform;

    // 1) Explicit path is authoritative
    if (options.explicitPath) {
        auto raw = config::trimmed(*options.explicitPath);
        if (!raw.empty()) {
            auto c = tryCandidate("cli", raw);
            res.candidates.push_back(c);
            res.origin = "cli";
            res.path = c.normalizedPath;
            if (c.valid) {
                res.validated = true;
                return res;
            }
            res.error = Error{ErrorCode::InvalidArgument,
                              gmcp::format("Godot executable is not valid: {}", raw)};
            res.suggestions.push_back(gmcp::format(
                "Fix the provided --godot-path (expected '{} --version' to succeed).", raw));
            return res;
        }
    }

    // 2) Environment. Set-but-empty disables discovery entirely.
    if (auto env = config::get_env("GODOT_PATH")) {
        auto raw = config::trimmed(*env);
        if (raw.empty()) {
            auto sentinel = disabledSentinelPath(platform);
            spdlog::debug("ExecutableResolver: GODOT_PATH is set but empty; auto-detection "
                          "disabled");
            res.candidates.push_back(ExecutableCandidate{"env", "", sentinel, false});
            res.origin = "env";
            res.path = sentinel;
            res.error = Error{ErrorCode::InvalidArgument,
                              "GODOT_PATH is set but empty; auto-detection is disabled"};
            res.suggestions.push_back(
                "Set GODOT_PATH to a working Godot binary, or pass --godot-path <path>.");
            return res;
        }
        auto c = tryCandidate("env", raw);
        res.candidates.push_back(c);
        if (c.valid) {
            res.origin = "env";
            res.path = c.normalizedPath;
            res.validated = true;
            return res;
        }
        res.suggestions.push_back(
            gmcp::format("Godot path from GODOT_PATH is invalid: {} (expected '{} --version' to "
                         "succeed)",
                         raw, raw));
    }

    // 2b) Config file ([godot] path); an invalid value falls through like GODOT_PATH
    if (options.configuredPath && !config::get_env("GODOT_PATH")) {
        auto raw = config::trimmed(*options.configuredPath);
        if (!raw.empty()) {
            auto c = tryCandidate("config", raw);
            res.candidates.push_back(c);
            if (c.valid) {
                res.origin = "config";
                res.path = c.normalizedPath;
                res.validated = true;
                return res;
            }
            res.suggestions.push_back(gmcp::format(
                "Godot path from the config file ([godot] path) is invalid: {}", raw));
        }
    }

    // 3) Auto-discovery
    spdlog::debug("ExecutableResolver: auto-detecting for platform {}", platformName(platform));
    for (const auto& [origin, candidate] : discoverCandidates(context_)) {
        auto c = tryCandidate(origin, candidate);
        res.candidates.push_back(c);
        if (c.valid) {
            res.origin = "auto";
            res.path = c.normalizedPath;
            res.validated = true;
            return res;
        }
    }

    auto message = gmcp::format("Could not find a valid Godot executable for {}. Set the "
                                "GODOT_PATH environment variable (or pass --godot-path) to "
                                "continue.",
                                platformName(platform));

    if (options.strictPathValidation) {
        res.origin = "none";
        res.error = Error{ErrorCode::NotFound, message};
        res.suggestions.push_back(
            "Set GODOT_PATH to a working Godot binary, or pass --godot-path <path>.");
        res.suggestions.push_back("Verify it works by running: <godot> --version");
        return res;
    }

    spdlog::warn("{}", message);
    auto fallback = defaultExecutablePath(platform);
    res.origin = "auto";
    res.path = fallback;
    if (isValid(fallback)) {
        res.validated = true;
        return res;
    }
    res.error = Error{ErrorCode::NotFound,
                      gmcp::format("Godot executable is not valid: {}", fallback)};
    res.suggestions.push_back(gmcp::format(
        "Auto-detected Godot path is invalid: {} (expected '{} --version' to succeed)", fallback,
        fallback));
    res.suggestions.push_back(
        "Set GODOT_PATH to a working Godot binary, or pass --godot-path <path>.");
    res.suggestions.push_back("Verify it works by running: <godot> --version");
    return res;
}

} // namespace gmcp::doctor
