#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gmcp::doctor {

using json = nlohmann::json;

// ============================================================================
// Stage results
// ============================================================================

/// Uniform output of every doctor stage.
struct DoctorCheckResult {
    bool ok{false};
    bool skipped{false};
    std::string summary;
    json details = json::object();
    std::optional<std::string> error;
    std::vector<std::string> suggestions;

    static DoctorCheckResult passed(std::string summary, json details = json::object());
    static DoctorCheckResult failed(std::string summary, std::string error,
                                    json details = json::object());
    /// Skipped stages keep ok=false unless the caller flips it (e.g. read-only dry runs).
    static DoctorCheckResult skippedBecause(std::string reason, bool ok = false);

    json toJson() const;
};

// ============================================================================
// Executable resolution
// ============================================================================

struct ExecutableCandidate {
    std::string origin;
    std::string rawCandidate;
    std::string normalizedPath;
    bool valid{false};

    json toJson() const;
};

/// `origin` is one of cli | env | config | auto | none.
struct GodotDetails {
    bool ok{false};
    std::optional<std::string> path;
    std::string origin{"none"};
    bool strictPathValidation{false};
    std::optional<std::string> error;
    std::vector<ExecutableCandidate> attemptedCandidates;

    json toJson() const;
};

// ============================================================================
// Project inspection / setup
// ============================================================================

struct ProjectDetails {
    bool ok{false};
    std::string path;
    std::string projectGodotPath;
    bool hasProjectGodot{false};
    bool hasBridgeAddon{false};
    bool hasBridgePluginEnabled{false};
    bool hasTokenFile{false};
    bool hasPortFile{false};
    bool hasHostFile{false};
    bool hasLockFile{false};
    std::optional<std::string> error;

    json toJson() const;
};

struct ProjectSetupOutcome {
    bool ok{false};
    bool skipped{false};
    std::string summary;
    bool addonCopied{false};
    bool pluginEnabledUpdated{false};
    bool tokenCreated{false};
    bool lockFileExists{false};
    /// Changes that would be made (read-only or lock-present runs)
    std::vector<std::string> pendingChanges;
    std::optional<std::string> error;
    std::vector<std::string> suggestions;

    DoctorCheckResult toCheckResult() const;
};

// ============================================================================
// Aggregate
// ============================================================================

struct DoctorChecks {
    std::optional<DoctorCheckResult> mcpServer;
    std::optional<DoctorCheckResult> headlessBatch;
    std::optional<DoctorCheckResult> projectSetup;
    std::optional<DoctorCheckResult> editorBridge;
};

struct DoctorResult {
    bool ok{false};
    std::string summary;
    GodotDetails godot;
    std::optional<ProjectDetails> project;
    DoctorChecks checks;
    std::vector<std::string> suggestions;

    json toJson() const;
};

/// Appends @p suggestion unless an identical string is already present.
void appendUnique(std::vector<std::string>& out, std::string suggestion);
void appendUnique(std::vector<std::string>& out, const std::vector<std::string>& suggestions);

} // namespace gmcp::doctor
