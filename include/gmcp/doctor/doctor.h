#pragma once

#include <gmcp/doctor/bridge_probe.h>
#include <gmcp/doctor/executable_resolver.h>
#include <gmcp/doctor/types.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace gmcp::doctor {

struct DoctorOptions {
    std::optional<std::string> godotPath;
    std::optional<std::filesystem::path> projectPath;
    bool strictPathValidation{false};
    bool readOnly{false};
    /// Dispatcher entry point for the self-test
    std::optional<std::filesystem::path> serverPath;
    /// Bridge addon to copy into the project
    std::optional<std::filesystem::path> addonSourceDir;
    std::chrono::milliseconds launchTimeout{std::chrono::seconds{30}};
    std::chrono::milliseconds probeAttemptTimeout{std::chrono::milliseconds{800}};
    std::chrono::milliseconds pollInterval{std::chrono::milliseconds{250}};
    std::chrono::milliseconds terminateGrace{std::chrono::seconds{2}};
    bool skipSelfTest{false};
};

/// Replaceable collaborators; empty members use the real implementations.
struct DoctorHooks {
    ExecutableValidator validator;
    std::optional<DiscoveryContext> discovery;
    BridgeAttempt bridgeAttempt;
    std::optional<BridgeEndpoint> defaultBridgeEndpoint;
};

/// Option, then GODOT_MCP_SERVER / `[selftest] server`, then ./build/index.js.
std::optional<std::filesystem::path> resolveServerPath(const DoctorOptions& options);

/// Option, then GODOT_MCP_ADDON_DIR / `[bridge] addon_dir`, then addons/godot_mcp_bridge next
/// to the dispatcher or under the working directory. Only directories holding plugin.cfg count.
std::optional<std::filesystem::path> resolveAddonSourceDir(const DoctorOptions& options);

/**
 * Runs every stage in order (executable, project setup, self-test, bridge) and merges the
 * results. A failing stage never prevents later stages from running.
 */
DoctorResult runDoctor(const DoctorOptions& options, const DoctorHooks& hooks = {});

/// Human-readable multi-line rendering of @p result.
std::string formatDoctorReport(const DoctorResult& result);

} // namespace gmcp::doctor
