#include <gmcp/bridge/bridge_client.h>
#include <gmcp/config/config_helpers.h>
#include <gmcp/core/format.h>
#include <gmcp/core/scope_guard.h>
#include <gmcp/doctor/bridge_probe.h>
#include <gmcp/doctor/executable_resolver.h>
#include <gmcp/doctor/project_setup.h>
#include <gmcp/doctor/scoped_file_override.h>
#include <gmcp/platform/path_translation.h>
#include <gmcp/process/child_process.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <thread>

namespace gmcp::doctor {

namespace fs = std::filesystem;
using bridge::BridgeFailureKind;

namespace {

bool isBindAllHost(std::string_view host) {
    return host == "0.0.0.0" || host == "::" || host == "[::]";
}

std::optional<std::string> readTrimmedFile(const fs::path& path) {
    auto text = readWholeFile(path);
    if (!text) {
        return std::nullopt;
    }
    auto value = config::trimmed(text.value());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

bool fileExists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

BridgeFailureKind failureKind(const Error& error) {
    return bridge::parseBridgeFailureKind(error.message).value_or(BridgeFailureKind::Other);
}

bool isHardFailure(BridgeFailureKind kind) {
    return kind == BridgeFailureKind::AuthRejected || kind == BridgeFailureKind::ProjectMismatch;
}

std::string hardFailureSuggestion(BridgeFailureKind kind) {
    if (kind == BridgeFailureKind::AuthRejected) {
        return "The editor bridge rejected the token: make .godot_mcp_token (or GODOT_MCP_TOKEN) "
               "match the token the running editor uses, then restart the editor.";
    }
    if (kind == BridgeFailureKind::ProjectMismatch) {
        return "The bridge answering on this port belongs to a different project: close that "
               "editor or configure a different port via .godot_mcp_port / GODOT_MCP_PORT.";
    }
    return "Check the Godot editor output for bridge errors, or close the editor and remove "
           ".godot_mcp/bridge.lock manually if it is not running.";
}

} // namespace

const char* to_string(BridgeProber::State state) noexcept {
    switch (state) {
        case BridgeProber::State::CheckProject:
            return "CheckProject";
        case BridgeProber::State::CheckPlugin:
            return "CheckPlugin";
        case BridgeProber::State::ResolveToken:
            return "ResolveToken";
        case BridgeProber::State::InspectLock:
            return "InspectLock";
        case BridgeProber::State::ProbeExisting:
            return "ProbeExisting";
        case BridgeProber::State::AutoLaunch:
            return "AutoLaunch";
    }
    return "Unknown";
}

Result<BridgeHealth> attemptBridgeHealth(const BridgeEndpoint& endpoint, const std::string& token,
                                         std::chrono::milliseconds timeout) {
    // connect, hello and health share one budget
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bridge::BridgeClient client;
    auto hello = client.connect(
        {.host = endpoint.host, .port = endpoint.port, .token = token, .timeout = timeout});
    if (!hello) {
        return hello.error();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto health = client.request("health", json::object(),
                                 std::max(left, std::chrono::milliseconds{1}));
    if (!health) {
        return health.error();
    }
    const auto& response = health.value();
    if (!response.ok) {
        return Error{ErrorCode::NetworkError,
                     bridge::formatBridgeFailure(BridgeFailureKind::Other,
                                                 gmcp::format("health failed: {}",
                                                              response.error.dump()))};
    }
    BridgeHealth out;
    if (response.result.is_object()) {
        if (auto it = response.result.find("project_root");
            it != response.result.end() && it->is_string()) {
            out.projectRoot = it->get<std::string>();
        }
    }
    return out;
}

Result<int> pickFreeLocalPort() {
    try {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor acceptor(
            io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        int port = acceptor.local_endpoint().port();
        boost::system::error_code ec;
        acceptor.close(ec);
        return port;
    } catch (const boost::system::system_error& e) {
        return Error{ErrorCode::NetworkError, gmcp::format("cannot pick a free port: {}", e.what())};
    }
}

std::string resolveWslConnectHost() {
    if (auto gateway = platform::readWslGatewayIp()) {
        return *gateway;
    }
    if (auto hint = config::get_env_nonempty("GODOT_MCP_WSL_HOST")) {
        return *hint;
    }
    return std::string(config::kDefaultBridgeHost);
}

BridgeProber::BridgeProber(BridgeProbeOptions options, BridgeAttempt attempt)
    : options_(std::move(options)), attempt_(std::move(attempt)) {}

DoctorCheckResult BridgeProber::run() {
    Context ctx;
    State state = State::CheckProject;
    try {
        while (true) {
            spdlog::debug("bridge probe: state {}", to_string(state));
            Transition next;
            switch (state) {
                case State::CheckProject:
                    next = checkProject(ctx);
                    break;
                case State::CheckPlugin:
                    next = checkPlugin(ctx);
                    break;
                case State::ResolveToken:
                    next = resolveToken(ctx);
                    break;
                case State::InspectLock:
                    next = inspectLock(ctx);
                    break;
                case State::ProbeExisting:
                    next = probeExisting(ctx);
                    break;
                case State::AutoLaunch:
                    next = autoLaunch(ctx);
                    break;
            }
            if (auto* done = std::get_if<DoctorCheckResult>(&next)) {
                spdlog::info("bridge probe: {} in state {}", done->ok ? "ok" : "failed",
                             to_string(state));
                return std::move(*done);
            }
            state = std::get<State>(next);
        }
    } catch (const std::exception& e) {
        spdlog::error("bridge probe: {} failed: {}", to_string(state), e.what());
        return DoctorCheckResult::failed("Editor bridge check failed", e.what());
    }
}

BridgeProber::Transition BridgeProber::checkProject(Context& ctx) {
    if (!options_.projectPath) {
        return DoctorCheckResult::skippedBecause("skipped: no project path");
    }
    ctx.projectRoot = *options_.projectPath;
    return State::CheckPlugin;
}

BridgeProber::Transition BridgeProber::checkPlugin(Context& ctx) {
    auto descriptor = readWholeFile(ctx.projectRoot / config::kProjectDescriptor);
    if (!descriptor) {
        return DoctorCheckResult::failed("Editor bridge check skipped: project.godot unreadable",
                                         descriptor.error().message);
    }
    if (!isEditorPluginEnabled(descriptor.value(), config::kBridgePluginId)) {
        auto r = DoctorCheckResult::failed("Editor bridge plugin is not enabled",
                                           "godot_mcp_bridge missing from [editor_plugins]");
        r.suggestions.push_back(
            "Enable the godot_mcp_bridge plugin (rerun gmcp-doctor without --read-only, or "
            "enable it in Project Settings > Plugins).");
        return r;
    }
    return State::ResolveToken;
}

BridgeProber::Transition BridgeProber::resolveToken(Context& ctx) {
    if (auto env = config::get_env_nonempty("GODOT_MCP_TOKEN")) {
        ctx.token = *env;
        return State::InspectLock;
    }
    if (auto fromFile = readTrimmedFile(ctx.projectRoot / config::kTokenFile)) {
        ctx.token = *fromFile;
        return State::InspectLock;
    }
    auto r = DoctorCheckResult::failed("No editor bridge token",
                                       "neither GODOT_MCP_TOKEN nor .godot_mcp_token is set");
    r.suggestions.push_back(gmcp::format("Create {} with any random string token.",
                                         (ctx.projectRoot / config::kTokenFile).string()));
    return r;
}

BridgeProber::Transition BridgeProber::inspectLock(Context& ctx) {
    ctx.lockPresent = fileExists(ctx.projectRoot / config::kLockFile);
    if (ctx.lockPresent) {
        return State::ProbeExisting;
    }
    ctx.staleLockRemoved = false;
    return State::AutoLaunch;
}

std::vector<BridgeEndpoint> BridgeProber::candidateEndpoints(const fs::path& projectRoot) const {
    const auto& def = options_.defaultEndpoint;
    auto fileHost = readTrimmedFile(projectRoot / config::kHostFile);
    auto filePort = readTrimmedFile(projectRoot / config::kPortFile);
    auto envHost = config::resolve_setting("GODOT_MCP_HOST", "bridge", "host");
    auto envPort = config::resolve_setting("GODOT_MCP_PORT", "bridge", "port");

    auto connectHost = [&def](const std::optional<std::string>& raw) {
        if (!raw || raw->empty() || isBindAllHost(*raw)) {
            return def.host;
        }
        return *raw;
    };
    auto port = [](const std::optional<std::string>& raw) -> std::optional<int> {
        return raw ? config::parse_port(*raw) : std::nullopt;
    };

    std::vector<BridgeEndpoint> out;
    auto add = [&out](BridgeEndpoint e) {
        if (std::find(out.begin(), out.end(), e) == out.end()) {
            out.push_back(std::move(e));
        }
    };
    if (envHost || envPort) {
        auto p = port(envPort);
        add({connectHost(envHost ? envHost : fileHost), p ? *p : port(filePort).value_or(def.port),
             "env"});
    }
    if (fileHost || filePort) {
        add({connectHost(fileHost), port(filePort).value_or(def.port), "file"});
    }
    add(def);
    return out;
}

Result<BridgeHealth> BridgeProber::attemptAndVerify(Context& ctx, const BridgeEndpoint& endpoint,
                                                    std::chrono::milliseconds timeout) {
    auto result = attempt_(endpoint, ctx.token, timeout);
    json record = {{"host", endpoint.host}, {"port", endpoint.port}, {"origin", endpoint.origin}};
    if (!result) {
        record["error"] = result.error().message;
        ctx.attempts.push_back(std::move(record));
        return result;
    }
    const auto& health = result.value();
    if (health.projectRoot) {
        auto expected = platform::normalizeProjectPathForCompare(ctx.projectRoot.string());
        auto actual = platform::normalizeProjectPathForCompare(*health.projectRoot);
        if (expected != actual) {
            auto message = bridge::formatBridgeFailure(
                BridgeFailureKind::ProjectMismatch,
                gmcp::format("bridge serves {} (expected {})", *health.projectRoot,
                             ctx.projectRoot.string()));
            record["error"] = message;
            ctx.attempts.push_back(std::move(record));
            return Error{ErrorCode::InvalidState, message};
        }
    } else {
        spdlog::warn("bridge probe: {}:{} health reply has no project_root; identity unverified",
                     endpoint.host, endpoint.port);
    }
    record["ok"] = true;
    ctx.attempts.push_back(std::move(record));
    return result;
}

BridgeProber::Transition BridgeProber::probeExisting(Context& ctx) {
    ctx.candidates = candidateEndpoints(ctx.projectRoot);
    const auto lockPath = ctx.projectRoot / config::kLockFile;

    std::optional<Error> hardError;
    for (const auto& endpoint : ctx.candidates) {
        spdlog::debug("bridge probe: trying {}:{} ({})", endpoint.host, endpoint.port,
                      endpoint.origin);
        auto result = attemptAndVerify(ctx, endpoint, options_.attemptTimeout);
        if (result) {
            return DoctorCheckResult::passed(
                gmcp::format("Editor bridge reachable at {}:{}", endpoint.host, endpoint.port),
                {{"host", endpoint.host},
                 {"port", endpoint.port},
                 {"origin", endpoint.origin},
                 {"launched", false},
                 {"attempts", ctx.attempts}});
        }
        if (!hardError && !bridge::isStaleLockSignal(failureKind(result.error()))) {
            hardError = result.error();
        }
    }

    if (hardError) {
        auto kind = failureKind(*hardError);
        spdlog::warn("bridge probe: lock present, bridge not healthy ({}); lock kept",
                     bridge::to_string(kind));
        auto r = DoctorCheckResult::failed("Editor bridge lock present but bridge is unhealthy",
                                           hardError->message, {{"attempts", ctx.attempts}});
        r.suggestions.push_back(hardFailureSuggestion(kind));
        return r;
    }

    spdlog::info("bridge probe: every candidate refused or timed out; lock {} is stale",
                 lockPath.string());
    if (!options_.godotPath) {
        auto r = DoctorCheckResult::failed(
            "Stale editor bridge lock and no Godot executable to relaunch",
            "bridge.lock present but nothing is listening", {{"attempts", ctx.attempts}});
        r.suggestions.push_back(gmcp::format(
            "Start the Godot editor for this project, or delete the stale lock {} manually.",
            lockPath.string()));
        return r;
    }
    if (options_.readOnly) {
        auto r = DoctorCheckResult::failed(
            "Stale editor bridge lock (read-only: not removed)",
            "bridge.lock present but nothing is listening", {{"attempts", ctx.attempts}});
        r.suggestions.push_back(
            gmcp::format("Delete the stale lock {} manually, then rerun.", lockPath.string()));
        return r;
    }

    std::error_code ec;
    fs::remove(lockPath, ec);
    if (ec) {
        return DoctorCheckResult::failed(
            "Stale editor bridge lock could not be removed",
            gmcp::format("cannot remove {}: {}", lockPath.string(), ec.message()));
    }
    spdlog::info("bridge probe: removed stale lock {}", lockPath.string());
    ctx.staleLockRemoved = true;
    return State::AutoLaunch;
}

BridgeProber::Transition BridgeProber::autoLaunch(Context& ctx) {
    if (!options_.godotPath) {
        auto r = DoctorCheckResult::skippedBecause(
            "skipped: editor bridge not running and no Godot executable to launch it");
        r.suggestions.push_back(
            "Open the project in the Godot editor (with the godot_mcp_bridge plugin enabled), "
            "or configure GODOT_PATH so the doctor can launch it.");
        return r;
    }
    if (options_.readOnly) {
        auto r = DoctorCheckResult::failed("Editor bridge is not running",
                                           "read-only: auto-launch disabled");
        r.suggestions.push_back(
            "Launch the Godot editor for this project, then rerun the doctor.");
        return r;
    }

    auto freePort = pickFreeLocalPort();
    if (!freePort) {
        return DoctorCheckResult::failed("Could not pick a port for the editor bridge",
                                         freePort.error().message);
    }
    const int port = freePort.value();
    const auto& godot = *options_.godotPath;
    const bool wslExe = platform::isWslEnvironment() && platform::isWindowsExePath(godot);
    const std::string listenHost = wslExe ? "0.0.0.0" : std::string(config::kDefaultBridgeHost);
    const std::string connectHost =
        wslExe ? resolveWslConnectHost() : std::string(config::kDefaultBridgeHost);
    const auto lockPath = ctx.projectRoot / config::kLockFile;

    auto portOverride = ScopedFileOverride::capture(ctx.projectRoot / config::kPortFile);
    if (!portOverride) {
        return DoctorCheckResult::failed("Cannot capture .godot_mcp_port",
                                         portOverride.error().message);
    }
    auto hostOverride = ScopedFileOverride::capture(ctx.projectRoot / config::kHostFile);
    if (!hostOverride) {
        return DoctorCheckResult::failed("Cannot capture .godot_mcp_host",
                                         hostOverride.error().message);
    }
    ScopedFileOverride portFile = std::move(portOverride).value();
    ScopedFileOverride hostFile = std::move(hostOverride).value();

    std::unique_ptr<process::ChildProcess> editor;
    auto cleanup = scope_exit([&] {
        if (editor) {
            spdlog::info("bridge probe: terminating launched editor pid={}", editor->pid());
            editor->terminate(options_.terminateGrace);
        }
        for (auto* file : {&portFile, &hostFile}) {
            if (auto r = file->restore(); !r) {
                spdlog::warn("bridge probe: {}", r.error().message);
            }
        }
        std::error_code ec;
        if (fs::remove(lockPath, ec)) {
            spdlog::info("bridge probe: removed lock left by launched editor");
        }
    });

    if (auto w = portFile.write(std::to_string(port)); !w) {
        return DoctorCheckResult::failed("Cannot write .godot_mcp_port", w.error().message);
    }
    if (auto w = hostFile.write(listenHost); !w) {
        return DoctorCheckResult::failed("Cannot write .godot_mcp_host", w.error().message);
    }

    auto executable = normalizeExecutablePathForHost(godot, currentPlatform());
    std::vector<std::string> args{"--headless", "--editor", "--path", ctx.projectRoot.string()};
    if (platform::shouldTranslatePathsForWindowsExe(executable)) {
        args = platform::translateArgsForWindowsExe(args);
    }
    process::ChildProcessConfig cfg{.executable = executable, .args = std::move(args)};
    cfg.with_env("GODOT_MCP_TOKEN", ctx.token)
        .with_env("GODOT_MCP_PORT", std::to_string(port))
        .with_env("GODOT_MCP_HOST", listenHost)
        .in_directory(ctx.projectRoot);

    spdlog::info("bridge probe: launching {} (bridge {}:{})", executable, connectHost, port);
    editor = std::make_unique<process::ChildProcess>(std::move(cfg));

    const BridgeEndpoint endpoint{connectHost, port, "launch"};
    const auto deadline = std::chrono::steady_clock::now() + options_.launchTimeout;
    auto logs = [&editor] {
        return json{{"stdoutTail", editor->stdout_tail()}, {"stderrTail", editor->stderr_tail()}};
    };

    while (std::chrono::steady_clock::now() < deadline) {
        if (!editor->is_alive()) {
            editor->drain_output(std::chrono::milliseconds{500});
            auto details = logs();
            details["exitCode"] = editor->exit_code() ? json(*editor->exit_code()) : json(nullptr);
            auto r = DoctorCheckResult::failed("Launched Godot editor exited early",
                                               "editor process exited before the bridge came up",
                                               std::move(details));
            r.suggestions.push_back(
                "Run the same Godot command manually to see why it exits (import errors, "
                "missing display, wrong version).");
            return r;
        }

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            break;
        }
        auto result = attemptAndVerify(ctx, endpoint, std::min(options_.attemptTimeout, left));
        if (result) {
            return DoctorCheckResult::passed(
                gmcp::format("Editor bridge came up at {}:{} after launch", connectHost, port),
                {{"host", connectHost},
                 {"port", port},
                 {"listenHost", listenHost},
                 {"origin", "launch"},
                 {"launched", true},
                 {"staleLockRemoved", ctx.staleLockRemoved},
                 {"wsl", wslExe}});
        }
        auto kind = failureKind(result.error());
        if (isHardFailure(kind)) {
            auto r = DoctorCheckResult::failed("Launched editor bridge rejected the probe",
                                               result.error().message, logs());
            r.suggestions.push_back(hardFailureSuggestion(kind));
            return r;
        }
        auto untilDeadline = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(
            std::min(options_.pollInterval, std::max(untilDeadline, std::chrono::milliseconds{0})));
    }

    auto details = logs();
    details["timeoutMs"] = options_.launchTimeout.count();
    details["host"] = connectHost;
    details["port"] = port;
    auto r = DoctorCheckResult::failed(
        "Timed out waiting for the launched editor bridge",
        gmcp::format("no healthy bridge at {}:{} within {}ms", connectHost, port,
                     options_.launchTimeout.count()),
        std::move(details));
    r.suggestions.push_back(
        "Open the project once in the Godot editor so assets import and the bridge plugin "
        "loads, or raise --launch-timeout-ms.");
    if (wslExe) {
        r.suggestions.push_back(
            "Under WSL, allow the Windows firewall to accept the editor's port or set "
            "GODOT_MCP_WSL_HOST to a reachable Windows host address.");
    }
    return r;
}

} // namespace gmcp::doctor
