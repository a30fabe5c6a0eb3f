#include <gmcp/config/config_helpers.h>
#include <gmcp/core/format.h>
#include <gmcp/doctor/doctor.h>
#include <gmcp/doctor/project_setup.h>
#include <gmcp/doctor/self_test.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace gmcp::doctor {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSummaryOk = "DOCTOR OK: environment looks good.";
constexpr std::string_view kSummaryFail = "DOCTOR FAIL: one or more checks failed.";

bool isAddonDir(const fs::path& dir) {
    std::error_code ec;
    return fs::is_regular_file(dir / "plugin.cfg", ec);
}

GodotDetails toGodotDetails(const ExecutableResolution& res, bool strict) {
    GodotDetails d;
    d.ok = res.ok();
    d.path = res.path;
    d.origin = res.origin;
    d.strictPathValidation = strict;
    d.attemptedCandidates = res.candidates;
    if (res.error) {
        d.error = res.error->message;
    }
    return d;
}

const char* checkStatus(const DoctorCheckResult& check) {
    if (check.skipped) {
        return "SKIPPED";
    }
    return check.ok ? "OK" : "FAIL";
}

const char* presence(bool present) {
    return present ? "OK" : "MISSING (non-fatal)";
}

} // namespace

std::optional<fs::path> resolveServerPath(const DoctorOptions& options) {
    if (options.serverPath) {
        return options.serverPath;
    }
    if (auto configured = config::resolve_setting("GODOT_MCP_SERVER", "selftest", "server")) {
        return config::expand_tilde(*configured);
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return std::nullopt;
    }
    return cwd / "build" / "index.js";
}

std::optional<fs::path> resolveAddonSourceDir(const DoctorOptions& options) {
    if (options.addonSourceDir) {
        return options.addonSourceDir;
    }
    if (auto configured = config::resolve_setting("GODOT_MCP_ADDON_DIR", "bridge", "addon_dir")) {
        return config::expand_tilde(*configured);
    }

    std::vector<fs::path> guesses;
    if (auto server = resolveServerPath(options); server && server->has_parent_path()) {
        guesses.push_back(server->parent_path().parent_path() / config::kAddonDir);
    }
    std::error_code ec;
    if (auto cwd = fs::current_path(ec); !ec) {
        guesses.push_back(cwd / config::kAddonDir);
    }
    for (const auto& guess : guesses) {
        if (!isAddonDir(guess)) {
            continue;
        }
        if (options.projectPath) {
            auto own = *options.projectPath / config::kAddonDir;
            if (fs::equivalent(guess, own, ec)) {
                continue;
            }
        }
        return guess;
    }
    return std::nullopt;
}

DoctorResult runDoctor(const DoctorOptions& options, const DoctorHooks& hooks) {
    DoctorResult result;
    std::vector<std::string> suggestions;

    // Executable
    ValidityCache cache;
    auto serverPath = resolveServerPath(options);
    auto discovery = hooks.discovery
                         ? *hooks.discovery
                         : DiscoveryContext::fromEnvironment(
                               serverPath && serverPath->has_parent_path()
                                   ? std::optional<fs::path>(serverPath->parent_path())
                                   : std::nullopt);
    ExecutableValidator validator =
        hooks.validator ? hooks.validator
                        : [](const std::string& path) { return probeExecutableVersion(path); };
    ExecutableResolver resolver(cache, std::move(validator), std::move(discovery));

    ResolverOptions resolverOptions{.explicitPath = options.godotPath,
                                    .strictPathValidation = options.strictPathValidation};
    auto configured = config::parse_config_value(config::get_config_path(), "godot", "path");
    if (!configured.empty()) {
        resolverOptions.configuredPath = configured;
    }
    spdlog::info("doctor: resolving Godot executable");
    auto resolution = resolver.resolve(resolverOptions);
    result.godot = toGodotDetails(resolution, options.strictPathValidation);
    appendUnique(suggestions, resolution.suggestions);
    std::optional<std::string> godotPath;
    if (resolution.ok()) {
        godotPath = resolution.path;
        spdlog::info("doctor: Godot {} ({})", *godotPath, resolution.origin);
    } else {
        spdlog::warn("doctor: no valid Godot executable: {}",
                     result.godot.error.value_or("unknown"));
    }

    // Project inspection + setup
    std::optional<fs::path> projectRoot;
    if (options.projectPath) {
        auto inspection = inspectProject(*options.projectPath);
        projectRoot = fs::path(inspection.details.path);
        result.project = inspection.details;

        spdlog::info("doctor: project setup");
        ProjectSetupOptions setupOptions{.projectPath = *projectRoot,
                                         .addonSourceDir = resolveAddonSourceDir(options),
                                         .readOnly = options.readOnly};
        std::vector<std::string> setupSuggestions;
        try {
            auto setup = reconcileProjectSetup(setupOptions);
            // Hints for what setup just fixed are stale
            if (setup.addonCopied || setup.pluginEnabledUpdated || setup.tokenCreated) {
                inspection = inspectProject(*projectRoot);
            }
            setupSuggestions = std::move(setup.suggestions);
            result.checks.projectSetup = setup.toCheckResult();
        } catch (const std::exception& e) {
            spdlog::error("doctor: project setup failed: {}", e.what());
            result.checks.projectSetup =
                DoctorCheckResult::failed("project setup failed", e.what());
        }
        appendUnique(suggestions, inspection.suggestions);
        appendUnique(suggestions, setupSuggestions);
    }

    // Self-test
    if (options.skipSelfTest) {
        result.checks.mcpServer = DoctorCheckResult::skippedBecause("skipped by request", true);
        result.checks.headlessBatch = DoctorCheckResult::skippedBecause("skipped by request", true);
    } else {
        spdlog::info("doctor: MCP server self-test");
        SelfTestOptions selfTest{.serverPath = serverPath,
                                 .godotPath = godotPath,
                                 .terminateGrace = options.terminateGrace};
        try {
            auto tested = runSelfTest(selfTest);
            appendUnique(suggestions, tested.mcpServer.suggestions);
            appendUnique(suggestions, tested.headlessBatch.suggestions);
            result.checks.mcpServer = std::move(tested.mcpServer);
            result.checks.headlessBatch = std::move(tested.headlessBatch);
        } catch (const std::exception& e) {
            spdlog::error("doctor: self-test failed: {}", e.what());
            result.checks.mcpServer = DoctorCheckResult::failed("MCP server self-test failed",
                                                                e.what());
            result.checks.headlessBatch =
                DoctorCheckResult::skippedBecause("skipped: MCP server self-test failed");
        }
    }

    // Editor bridge
    if (projectRoot) {
        spdlog::info("doctor: editor bridge");
        BridgeProbeOptions probe{.projectPath = projectRoot,
                                 .godotPath = godotPath,
                                 .readOnly = options.readOnly,
                                 .launchTimeout = options.launchTimeout,
                                 .attemptTimeout = options.probeAttemptTimeout,
                                 .pollInterval = options.pollInterval,
                                 .terminateGrace = options.terminateGrace};
        if (hooks.defaultBridgeEndpoint) {
            probe.defaultEndpoint = *hooks.defaultBridgeEndpoint;
        }
        BridgeProber prober(std::move(probe),
                            hooks.bridgeAttempt ? hooks.bridgeAttempt : attemptBridgeHealth);
        try {
            auto bridgeCheck = prober.run();
            appendUnique(suggestions, bridgeCheck.suggestions);
            result.checks.editorBridge = std::move(bridgeCheck);
        } catch (const std::exception& e) {
            spdlog::error("doctor: bridge probe failed: {}", e.what());
            result.checks.editorBridge = DoctorCheckResult::failed("bridge probe failed", e.what());
        }

        // Reflect what setup and the probe left behind
        result.project = inspectProject(*projectRoot).details;
    }

    const auto& checks = result.checks;
    bool ok = result.godot.ok;
    if (result.project) {
        ok = ok && result.project->ok;
    }
    ok = ok && checks.mcpServer && checks.mcpServer->ok;
    ok = ok && checks.headlessBatch && (checks.headlessBatch->ok || checks.headlessBatch->skipped);
    if (options.projectPath) {
        ok = ok && checks.projectSetup && checks.projectSetup->ok;
        ok = ok && checks.editorBridge && checks.editorBridge->ok;
    }

    result.ok = ok;
    result.summary = std::string(ok ? kSummaryOk : kSummaryFail);
    result.suggestions = std::move(suggestions);
    spdlog::info("doctor: {}", result.summary);
    return result;
}

std::string formatDoctorReport(const DoctorResult& result) {
    std::vector<std::string> lines;
    lines.push_back(result.summary);

    const auto& godot = result.godot;
    lines.push_back(gmcp::format("Strict path validation: {}",
                                 godot.strictPathValidation ? "true" : "false"));
    if (godot.ok) {
        lines.push_back(gmcp::format("Godot: OK ({}) -> {}", godot.origin, godot.path.value_or("")));
    } else {
        lines.push_back(gmcp::format("Godot: FAIL -> {}", godot.error.value_or("not found")));
        if (!godot.attemptedCandidates.empty()) {
            std::string tried;
            const size_t shown = std::min<size_t>(godot.attemptedCandidates.size(), 6);
            for (size_t i = 0; i < shown; ++i) {
                const auto& c = godot.attemptedCandidates[i];
                if (i > 0) {
                    tried += ", ";
                }
                tried += gmcp::format("{}={}", c.origin, c.rawCandidate);
            }
            if (godot.attemptedCandidates.size() > 6) {
                tried += ", \xE2\x80\xA6";
            }
            lines.push_back("Godot tried: " + tried);
        }
    }

    if (!result.project) {
        lines.emplace_back("Project: SKIPPED (pass --project <path> to enable checks)");
    } else {
        const auto& p = *result.project;
        if (p.ok) {
            lines.push_back(gmcp::format("Project: OK -> {}", p.path));
            lines.push_back(gmcp::format("- project.godot: OK ({})", p.projectGodotPath));
        } else {
            lines.push_back(gmcp::format("Project: FAIL -> {}", p.error.value_or("invalid project")));
            lines.push_back(gmcp::format("- project.godot: {} ({})",
                                         p.hasProjectGodot ? "OK" : "MISSING", p.projectGodotPath));
        }
        lines.push_back(gmcp::format("- addons/godot_mcp_bridge: {}", presence(p.hasBridgeAddon)));
        lines.push_back(
            gmcp::format("- plugin godot_mcp_bridge enabled: {}", presence(p.hasBridgePluginEnabled)));
        lines.push_back(gmcp::format("- .godot_mcp_token: {}", presence(p.hasTokenFile)));
        lines.push_back(gmcp::format("- .godot_mcp_port: {}", presence(p.hasPortFile)));
        lines.push_back(gmcp::format("- .godot_mcp_host: {}", presence(p.hasHostFile)));
        lines.push_back(gmcp::format("- .godot_mcp/bridge.lock: {}",
                                     p.hasLockFile ? "present" : "absent"));
    }

    auto checkLine = [&lines](std::string_view name, const std::optional<DoctorCheckResult>& c) {
        if (!c) {
            return;
        }
        auto line = gmcp::format("{}: {} - {}", name, checkStatus(*c), c->summary);
        if (!c->ok && c->error && !c->skipped) {
            line += gmcp::format(" ({})", *c->error);
        }
        lines.push_back(std::move(line));
    };
    checkLine("Project setup", result.checks.projectSetup);
    checkLine("MCP server", result.checks.mcpServer);
    checkLine("Headless batch", result.checks.headlessBatch);
    checkLine("Editor bridge", result.checks.editorBridge);

    if (!result.suggestions.empty()) {
        lines.emplace_back();
        lines.emplace_back("Suggestions:");
        for (const auto& s : result.suggestions) {
            lines.push_back("- " + s);
        }
    }

    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    return text;
}

} // namespace gmcp::doctor
