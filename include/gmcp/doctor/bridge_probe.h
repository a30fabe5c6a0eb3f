#pragma once

#include <gmcp/core/types.h>
#include <gmcp/doctor/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gmcp::doctor {

struct BridgeEndpoint {
    std::string host;
    int port{0};
    std::string origin; ///< env | file | default | launch

    bool operator==(const BridgeEndpoint& o) const { return host == o.host && port == o.port; }
};

/// What a successful authenticated health round trip reported.
struct BridgeHealth {
    std::optional<std::string> projectRoot;
};

/**
 * One connect + hello + health round trip. Failures carry a `[bridge:<kind>]` message prefix.
 */
using BridgeAttempt = std::function<Result<BridgeHealth>(
    const BridgeEndpoint& endpoint, const std::string& token, std::chrono::milliseconds timeout)>;

/// Default BridgeAttempt backed by BridgeClient.
Result<BridgeHealth> attemptBridgeHealth(const BridgeEndpoint& endpoint, const std::string& token,
                                         std::chrono::milliseconds timeout);

/// Binds an ephemeral localhost port and releases it.
Result<int> pickFreeLocalPort();

struct BridgeProbeOptions {
    std::optional<std::filesystem::path> projectPath;
    /// Validated host executable; auto-launch is impossible without one
    std::optional<std::string> godotPath;
    bool readOnly{false};
    std::chrono::milliseconds launchTimeout{std::chrono::seconds{30}};
    std::chrono::milliseconds attemptTimeout{std::chrono::milliseconds{800}};
    std::chrono::milliseconds pollInterval{std::chrono::milliseconds{250}};
    std::chrono::milliseconds terminateGrace{std::chrono::seconds{2}};
    /// Last-resort probe target
    BridgeEndpoint defaultEndpoint{"127.0.0.1", 8765, "default"};
};

/**
 * Editor bridge connectivity check with stale-lock recovery and auto-launch.
 *
 * States, in order:
 *   CheckProject  -> no project: skipped
 *   CheckPlugin   -> plugin not enabled in project.godot: fail
 *   ResolveToken  -> no token (env or file): fail
 *   InspectLock   -> lock absent: AutoLaunch; lock present: ProbeExisting
 *   ProbeExisting -> live bridge for this project: pass; only refused/connect_timeout
 *                    failures: stale lock removed, AutoLaunch; anything else: fail
 *   AutoLaunch    -> headless editor on a free port, host/port override files, poll until healthy
 */
class BridgeProber {
public:
    enum class State { CheckProject, CheckPlugin, ResolveToken, InspectLock, ProbeExisting, AutoLaunch };

    /// Data handed from one state to the next.
    struct Context {
        std::filesystem::path projectRoot;
        std::string token;
        bool lockPresent{false};
        bool staleLockRemoved{false};
        std::vector<BridgeEndpoint> candidates;
        json attempts = json::array();
    };

    using Transition = std::variant<DoctorCheckResult, State>;

    explicit BridgeProber(BridgeProbeOptions options, BridgeAttempt attempt = attemptBridgeHealth);

    /// Drives the state machine to a terminal result.
    DoctorCheckResult run();

    Transition checkProject(Context& ctx);
    Transition checkPlugin(Context& ctx);
    Transition resolveToken(Context& ctx);
    Transition inspectLock(Context& ctx);
    Transition probeExisting(Context& ctx);
    Transition autoLaunch(Context& ctx);

    /// Explicit (env/config), file-declared, then default endpoint; duplicates dropped.
    std::vector<BridgeEndpoint> candidateEndpoints(const std::filesystem::path& projectRoot) const;

private:
    /// Runs one attempt and verifies the reported project root.
    Result<BridgeHealth> attemptAndVerify(Context& ctx, const BridgeEndpoint& endpoint,
                                          std::chrono::milliseconds timeout);

    BridgeProbeOptions options_;
    BridgeAttempt attempt_;
};

const char* to_string(BridgeProber::State state) noexcept;

/// Connect host for a launched Windows editor seen from WSL: default-route gateway, then
/// GODOT_MCP_WSL_HOST, then 127.0.0.1.
std::string resolveWslConnectHost();

} // namespace gmcp::doctor
