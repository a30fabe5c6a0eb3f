#pragma once

#include <gmcp/core/types.h>
#include <gmcp/doctor/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gmcp::doctor {

enum class HostPlatform { Linux, MacOS, Windows };

HostPlatform currentPlatform() noexcept;

/**
 * Per-invocation memo of "does `<path> --version` succeed". Owned by whoever drives one doctor
 * run and handed to every resolver call of that run; never shared between runs.
 */
class ValidityCache {
public:
    std::optional<bool> lookup(const std::string& path) const;
    void store(const std::string& path, bool valid);
    size_t size() const noexcept { return entries_.size(); }

private:
    std::unordered_map<std::string, bool> entries_;
};

/// Decides whether a candidate path is a working executable.
using ExecutableValidator = std::function<bool(const std::string& path)>;

/// Default validator: file exists (bare name "godot" is looked up on PATH) and
/// `--version` exits 0 within @p timeout.
bool probeExecutableVersion(const std::string& path,
                            std::chrono::milliseconds timeout = std::chrono::seconds{10});

/// Inputs for auto-discovery, captured from the process by default.
struct DiscoveryContext {
    HostPlatform platform{currentPlatform()};
    bool wsl{false};
    std::filesystem::path cwd;
    std::filesystem::path home;
    std::filesystem::path userProfile;  ///< Windows only
    std::filesystem::path localAppData; ///< Windows only
    std::vector<std::filesystem::path> bundleRoots; ///< next to the dispatcher, cwd, cwd parent

    static DiscoveryContext fromEnvironment(
        const std::optional<std::filesystem::path>& dispatcherDir = std::nullopt);
};

struct ResolverOptions {
    std::optional<std::string> explicitPath;
    /// `[godot] path` from the config file; consulted only when GODOT_PATH is unset
    std::optional<std::string> configuredPath;
    bool strictPathValidation{false};
};

struct ExecutableResolution {
    std::optional<std::string> path;
    std::string origin{"none"}; ///< cli | env | config | auto | none
    bool validated{false};
    std::vector<ExecutableCandidate> candidates;
    /// Set on failure; candidates then hold every attempt with its validity
    std::optional<Error> error;
    std::vector<std::string> suggestions;

    bool ok() const noexcept { return path.has_value() && validated && !error; }
};

/// Path that can never resolve; used when GODOT_PATH is set but empty.
std::string disabledSentinelPath(HostPlatform platform);

/// Unvalidated fallback returned by lenient resolution.
std::string defaultExecutablePath(HostPlatform platform);

/// Maps a Windows drive path to its WSL mount on POSIX hosts; everything else is unchanged.
std::string normalizeExecutablePathForHost(const std::string& path, HostPlatform platform);

/// Ordered, de-duplicated auto-discovery candidates (origin, path).
std::vector<std::pair<std::string, std::string>> discoverCandidates(const DiscoveryContext& ctx);

/// Recursively lists regular files under @p root (to @p maxDepth levels) whose name matches
/// one of @p patterns (case-insensitive ECMAScript). Results are sorted per directory.
std::vector<std::filesystem::path> scanForExecutables(const std::filesystem::path& root,
                                                      const std::vector<std::string>& patterns,
                                                      int maxDepth);

/**
 * Resolves the host application executable:
 * explicit path → GODOT_PATH → config file → auto-discovery (PATH name, per-OS install
 * locations, portable download directories, bundled directories).
 */
class ExecutableResolver {
public:
    ExecutableResolver(ValidityCache& cache, ExecutableValidator validator,
                       DiscoveryContext context);

    ExecutableResolution resolve(const ResolverOptions& options);

    /// Validates through the cache; spawns at most once per path.
    bool isValid(const std::string& path);

private:
    ExecutableCandidate tryCandidate(const std::string& origin, const std::string& raw);

    ValidityCache& cache_;
    ExecutableValidator validator_;
    DiscoveryContext context_;
};

} // namespace gmcp::doctor
