#include <gmcp/doctor/types.h>

#include <algorithm>

namespace gmcp::doctor {

DoctorCheckResult DoctorCheckResult::passed(std::string summary, json details) {
    DoctorCheckResult r;
    r.ok = true;
    r.summary = std::move(summary);
    r.details = std::move(details);
    return r;
}

DoctorCheckResult DoctorCheckResult::failed(std::string summary, std::string error, json details) {
    DoctorCheckResult r;
    r.ok = false;
    r.summary = std::move(summary);
    r.error = std::move(error);
    r.details = std::move(details);
    return r;
}

DoctorCheckResult DoctorCheckResult::skippedBecause(std::string reason, bool ok) {
    DoctorCheckResult r;
    r.ok = ok;
    r.skipped = true;
    r.summary = std::move(reason);
    return r;
}

json DoctorCheckResult::toJson() const {
    json j = {{"ok", ok}, {"summary", summary}};
    if (skipped) {
        j["skipped"] = true;
    }
    if (!details.is_null() && !(details.is_object() && details.empty())) {
        j["details"] = details;
    }
    if (error) {
        j["error"] = *error;
    }
    return j;
}

json ExecutableCandidate::toJson() const {
    return {{"origin", origin},
            {"candidate", rawCandidate},
            {"normalized", normalizedPath},
            {"valid", valid}};
}

json GodotDetails::toJson() const {
    json j = {{"ok", ok},
              {"path", path ? json(*path) : json(nullptr)},
              {"origin", origin},
              {"strictPathValidation", strictPathValidation}};
    if (error) {
        j["error"] = *error;
    }
    if (!attemptedCandidates.empty()) {
        json list = json::array();
        for (const auto& c : attemptedCandidates) {
            list.push_back(c.toJson());
        }
        j["attemptedCandidates"] = std::move(list);
    }
    return j;
}

json ProjectDetails::toJson() const {
    json j = {{"ok", ok},
              {"path", path},
              {"projectGodotPath", projectGodotPath},
              {"hasProjectGodot", hasProjectGodot},
              {"hasBridgeAddon", hasBridgeAddon},
              {"hasBridgePluginEnabled", hasBridgePluginEnabled},
              {"hasTokenFile", hasTokenFile},
              {"hasPortFile", hasPortFile},
              {"hasHostFile", hasHostFile},
              {"hasLockFile", hasLockFile}};
    if (error) {
        j["error"] = *error;
    }
    return j;
}

DoctorCheckResult ProjectSetupOutcome::toCheckResult() const {
    DoctorCheckResult r;
    r.ok = ok;
    r.skipped = skipped;
    r.summary = summary;
    r.error = error;
    r.suggestions = suggestions;
    r.details = {{"addonCopied", addonCopied},
                 {"pluginEnabledUpdated", pluginEnabledUpdated},
                 {"tokenCreated", tokenCreated},
                 {"lockFileExists", lockFileExists}};
    if (!pendingChanges.empty()) {
        r.details["pendingChanges"] = pendingChanges;
    }
    return r;
}

json DoctorResult::toJson() const {
    json detailsJson = {{"godot", godot.toJson()}};
    if (project) {
        detailsJson["project"] = project->toJson();
    }
    json checksJson = json::object();
    if (checks.mcpServer)
        checksJson["mcpServer"] = checks.mcpServer->toJson();
    if (checks.headlessBatch)
        checksJson["headlessBatch"] = checks.headlessBatch->toJson();
    if (checks.projectSetup)
        checksJson["projectSetup"] = checks.projectSetup->toJson();
    if (checks.editorBridge)
        checksJson["editorBridge"] = checks.editorBridge->toJson();
    if (!checksJson.empty()) {
        detailsJson["checks"] = std::move(checksJson);
    }
    return {{"ok", ok},
            {"summary", summary},
            {"details", std::move(detailsJson)},
            {"suggestions", suggestions}};
}

void appendUnique(std::vector<std::string>& out, std::string suggestion) {
    if (suggestion.empty()) {
        return;
    }
    if (std::find(out.begin(), out.end(), suggestion) == out.end()) {
        out.push_back(std::move(suggestion));
    }
}

void appendUnique(std::vector<std::string>& out, const std::vector<std::string>& suggestions) {
    for (const auto& s : suggestions) {
        appendUnique(out, s);
    }
}

} // namespace gmcp::doctor
