#include <gmcp/config/config_helpers.h>
#include <gmcp/core/format.h>
#include <gmcp/doctor/project_setup.h>
#include <gmcp/doctor/scoped_file_override.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>
#include <regex>

namespace gmcp::doctor {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kPluginSection = "[editor_plugins]";

std::vector<std::string> splitLines(std::string_view text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        normalized += text[i];
    }
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        auto pos = normalized.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(normalized.substr(start));
            break;
        }
        lines.push_back(normalized.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

bool isSectionHeader(const std::string& line) {
    static const std::regex header(R"(^\s*\[[^\]]+\]\s*$)");
    return std::regex_match(line, header);
}

struct PluginSection {
    std::optional<size_t> start;
    size_t end{0};
    std::optional<size_t> enabledLine;
};

PluginSection locatePluginSection(const std::vector<std::string>& lines) {
    PluginSection section;
    section.end = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (config::trimmed(lines[i]) == kPluginSection) {
            section.start = i;
            break;
        }
    }
    if (!section.start) {
        return section;
    }
    for (size_t i = *section.start + 1; i < lines.size(); ++i) {
        if (isSectionHeader(lines[i])) {
            section.end = i;
            break;
        }
    }
    for (size_t i = *section.start + 1; i < section.end; ++i) {
        if (config::trimmed(lines[i]).starts_with("enabled=")) {
            section.enabledLine = i;
            break;
        }
    }
    return section;
}

std::vector<std::string> quotedValues(const std::string& line) {
    static const std::regex quoted(R"re("([^"]*)")re");
    std::vector<std::string> values;
    for (auto it = std::sregex_iterator(line.begin(), line.end(), quoted);
         it != std::sregex_iterator(); ++it) {
        values.push_back((*it)[1].str());
    }
    return values;
}

std::string serializePackedStringArray(const std::vector<std::string>& values) {
    std::vector<std::string> unique;
    for (const auto& v : values) {
        if (!v.empty() && std::find(unique.begin(), unique.end(), v) == unique.end()) {
            unique.push_back(v);
        }
    }
    std::string out = "PackedStringArray(";
    for (size_t i = 0; i < unique.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += '"';
        for (char c : unique[i]) {
            if (c == '"') {
                out += '\\';
            }
            out += c;
        }
        out += '"';
    }
    out += ')';
    return out;
}

bool pathExists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

bool tokenFilePresent(const fs::path& tokenPath) {
    auto contents = readWholeFile(tokenPath);
    return contents && !config::trimmed(contents.value()).empty();
}

constexpr std::string_view kLockActiveError =
    "cannot modify project while the Godot editor is active (bridge lock present)";

} // namespace

bool isEditorPluginEnabled(std::string_view descriptorText, std::string_view pluginId) {
    auto lines = splitLines(descriptorText);
    auto section = locatePluginSection(lines);
    if (!section.start || !section.enabledLine) {
        return false;
    }
    auto values = quotedValues(config::trimmed(lines[*section.enabledLine]));
    return std::find(values.begin(), values.end(), pluginId) != values.end();
}

std::string ensureEditorPluginEnabled(std::string_view descriptorText, std::string_view pluginId) {
    if (isEditorPluginEnabled(descriptorText, pluginId)) {
        return std::string(descriptorText);
    }

    auto lines = splitLines(descriptorText);
    auto section = locatePluginSection(lines);
    const std::vector<std::string> single{std::string(pluginId)};

    if (!section.start) {
        if (!lines.empty() && !config::trimmed(lines.back()).empty()) {
            lines.emplace_back();
        }
        lines.emplace_back(kPluginSection);
        lines.push_back("enabled=" + serializePackedStringArray(single));
        lines.emplace_back();
        return joinLines(lines);
    }

    if (!section.enabledLine) {
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(section.end),
                     "enabled=" + serializePackedStringArray(single));
        return joinLines(lines);
    }

    auto values = quotedValues(lines[*section.enabledLine]);
    values.emplace_back(pluginId);
    lines[*section.enabledLine] = "enabled=" + serializePackedStringArray(values);
    return joinLines(lines);
}

std::string generateBridgeToken() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::random_device rd;
    std::uniform_int_distribution<int> byte(0, 255);
    std::string token;
    token.reserve(32);
    for (int i = 0; i < 16; ++i) {
        int b = byte(rd);
        token += kHex[(b >> 4) & 0xF];
        token += kHex[b & 0xF];
    }
    return token;
}

ProjectInspection inspectProject(const fs::path& projectPath) {
    ProjectInspection out;
    auto& d = out.details;
    std::error_code ec;
    auto root = fs::absolute(projectPath, ec).lexically_normal();
    if (ec) {
        root = projectPath.lexically_normal();
    }
    d.path = root.string();
    d.projectGodotPath = (root / config::kProjectDescriptor).string();

    try {
        if (!fs::is_directory(root)) {
            d.error = gmcp::format("Project path does not exist: {}", d.path);
            out.suggestions.push_back(gmcp::format(
                "Pass a valid Godot project root containing project.godot (got: {}).", d.path));
            return out;
        }

        auto descriptor = root / config::kProjectDescriptor;
        auto addonDir = root / config::kAddonDir;
        auto tokenPath = root / config::kTokenFile;
        auto portPath = root / config::kPortFile;
        auto hostPath = root / config::kHostFile;

        d.hasProjectGodot = fs::is_regular_file(descriptor);
        d.hasBridgeAddon = fs::is_regular_file(root / config::kAddonMarker);
        d.hasTokenFile = pathExists(tokenPath);
        d.hasPortFile = pathExists(portPath);
        d.hasHostFile = pathExists(hostPath);
        d.hasLockFile = pathExists(root / config::kLockFile);
        if (d.hasProjectGodot) {
            auto text = readWholeFile(descriptor);
            if (!text) {
                d.error = text.error().message;
            } else {
                d.hasBridgePluginEnabled =
                    isEditorPluginEnabled(text.value(), config::kBridgePluginId);
            }
        }
        d.ok = d.hasProjectGodot && !d.error;

        auto& s = out.suggestions;
        if (!d.hasProjectGodot) {
            s.push_back(gmcp::format(
                "Missing project.godot at: {} (pass the Godot project root).", d.projectGodotPath));
        }
        if (!d.hasBridgeAddon) {
            s.push_back(gmcp::format("Missing editor bridge addon at: {} (non-fatal).",
                                     addonDir.string()));
            s.push_back(gmcp::format(
                "To install/sync it: gmcp-doctor --project {} --addon-dir <path to "
                "addons/godot_mcp_bridge> (or set GODOT_MCP_ADDON_DIR).",
                d.path));
        }
        if (d.hasProjectGodot && !d.error && !d.hasBridgePluginEnabled) {
            s.push_back(gmcp::format(
                "Editor bridge plugin is not enabled in {} (add \"{}\" under [editor_plugins]).",
                d.projectGodotPath, config::kBridgePluginId));
        }
        if (!d.hasTokenFile) {
            s.push_back(gmcp::format("Missing .godot_mcp_token at: {} (non-fatal).",
                                     tokenPath.string()));
            s.push_back("Create it with any random string token.");
        }
        if (!d.hasPortFile) {
            s.push_back(
                gmcp::format("Missing .godot_mcp_port at: {} (non-fatal).", portPath.string()));
            s.push_back("(Optional) Create it with a port number like 8765.");
        }
        if (!d.hasHostFile) {
            s.push_back(
                gmcp::format("Missing .godot_mcp_host at: {} (non-fatal).", hostPath.string()));
            s.push_back("(Optional) Create it with a host value like 127.0.0.1.");
        }
    } catch (const std::exception& e) {
        d.ok = false;
        d.error = e.what();
        out.suggestions.push_back(gmcp::format("Failed to check project: {}", e.what()));
    }
    return out;
}

ProjectSetupOutcome reconcileProjectSetup(const ProjectSetupOptions& options) {
    ProjectSetupOutcome outcome;
    const auto root = options.projectPath;
    const auto descriptorPath = root / config::kProjectDescriptor;
    const auto markerPath = root / config::kAddonMarker;
    const auto addonDst = root / config::kAddonDir;
    const auto tokenPath = root / config::kTokenFile;
    const auto lockPath = root / config::kLockFile;

    spdlog::info("project setup: reconciling {}", root.string());

    auto descriptor = readWholeFile(descriptorPath);
    if (!descriptor) {
        outcome.summary = "project setup failed: project.godot not readable";
        outcome.error = descriptor.error().message;
        if (descriptor.error().code == ErrorCode::FileNotFound) {
            outcome.summary = "project setup skipped: project.godot not found";
            outcome.suggestions.push_back(gmcp::format(
                "Pass a valid Godot project root containing project.godot (got: {}).",
                root.string()));
        }
        return outcome;
    }

    const std::string& before = descriptor.value();
    const std::string after = ensureEditorPluginEnabled(before, config::kBridgePluginId);
    const bool addonNeeded = !fs::is_regular_file(markerPath);
    const bool pluginNeeded = after != before;
    const bool tokenNeeded = !tokenFilePresent(tokenPath);

    outcome.lockFileExists = pathExists(lockPath);
    if (addonNeeded)
        outcome.pendingChanges.push_back(gmcp::format("copy addon to {}", addonDst.string()));
    if (pluginNeeded)
        outcome.pendingChanges.push_back(gmcp::format("enable plugin {} in project.godot",
                                                      config::kBridgePluginId));
    if (tokenNeeded)
        outcome.pendingChanges.push_back(gmcp::format("create {}", tokenPath.string()));

    if (options.readOnly || outcome.lockFileExists) {
        outcome.ok = true;
        outcome.skipped = true;
        if (outcome.pendingChanges.empty()) {
            outcome.summary = "project setup: already up to date";
        } else if (options.readOnly) {
            outcome.summary = gmcp::format("project setup: read-only, {} change(s) pending",
                                           outcome.pendingChanges.size());
            outcome.suggestions.push_back(
                "Rerun without --read-only to apply the pending project setup changes.");
        } else {
            outcome.summary = gmcp::format(
                "project setup: bridge lock present, {} change(s) not applied",
                outcome.pendingChanges.size());
            outcome.suggestions.push_back(
                "Close the Godot editor for this project, then rerun the doctor to apply "
                "pending setup changes.");
        }
        spdlog::info("{}", outcome.summary);
        return outcome;
    }

    auto lockAppeared = [&](std::string_view step) {
        if (options.beforeMutation) {
            options.beforeMutation(step);
        }
        if (pathExists(lockPath)) {
            outcome.lockFileExists = true;
            outcome.error = std::string(kLockActiveError);
            outcome.summary = gmcp::format("project setup aborted before {} step", step);
            spdlog::warn("project setup: lock appeared before {} step; aborting", step);
            return true;
        }
        return false;
    };

    std::vector<std::string> failures;

    if (addonNeeded) {
        std::error_code ec;
        const auto& src = options.addonSourceDir;
        if (!src || !fs::is_regular_file(*src / "plugin.cfg", ec)) {
            failures.push_back(gmcp::format(
                "editor bridge addon source not found{}",
                src ? gmcp::format(" at {}", src->string()) : std::string()));
            outcome.suggestions.push_back(
                "Point GODOT_MCP_ADDON_DIR (or --addon-dir) at the godot_mcp_bridge addon "
                "directory containing plugin.cfg.");
        } else {
            if (lockAppeared("addon")) {
                return outcome;
            }
            fs::create_directories(addonDst, ec);
            if (!ec) {
                fs::copy(*src, addonDst,
                         fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
            }
            if (ec) {
                failures.push_back(gmcp::format("failed to copy addon from {}: {}",
                                                src->string(), ec.message()));
            } else {
                outcome.addonCopied = true;
                outcome.suggestions.push_back(gmcp::format(
                    "Synced the editor bridge addon into {}. Restart the Godot editor to load it.",
                    addonDst.string()));
                spdlog::info("project setup: copied addon {} -> {}", src->string(),
                             addonDst.string());
            }
        }
    }

    if (pluginNeeded) {
        if (lockAppeared("plugin")) {
            return outcome;
        }
        if (auto w = writeWholeFile(descriptorPath, after); !w) {
            failures.push_back(w.error().message);
        } else {
            outcome.pluginEnabledUpdated = true;
            spdlog::info("project setup: enabled {} in {}", config::kBridgePluginId,
                         descriptorPath.string());
        }
    }

    if (tokenNeeded) {
        if (lockAppeared("token")) {
            return outcome;
        }
        if (auto w = writeWholeFile(tokenPath, generateBridgeToken() + "\n"); !w) {
            failures.push_back(w.error().message);
        } else {
            outcome.tokenCreated = true;
            outcome.suggestions.push_back(gmcp::format(
                "Created .godot_mcp_token at: {}. Restart the Godot editor so the bridge uses it.",
                tokenPath.string()));
            spdlog::info("project setup: created {}", tokenPath.string());
        }
    }

    outcome.pendingChanges.clear();
    if (!failures.empty()) {
        outcome.ok = false;
        outcome.error = failures.front();
        outcome.summary = gmcp::format("project setup failed: {}", failures.front());
        for (size_t i = 1; i < failures.size(); ++i) {
            spdlog::warn("project setup: {}", failures[i]);
        }
        return outcome;
    }

    outcome.ok = true;
    if (!outcome.addonCopied && !outcome.pluginEnabledUpdated && !outcome.tokenCreated) {
        outcome.summary = "project setup: already up to date";
    } else {
        std::vector<std::string> done;
        if (outcome.addonCopied)
            done.emplace_back("addon copied");
        if (outcome.pluginEnabledUpdated)
            done.emplace_back("plugin enabled");
        if (outcome.tokenCreated)
            done.emplace_back("token created");
        std::string joined;
        for (const auto& d : done) {
            joined += joined.empty() ? d : ", " + d;
        }
        outcome.summary = gmcp::format("project setup: {}", joined);
    }
    spdlog::info("{}", outcome.summary);
    return outcome;
}

} // namespace gmcp::doctor
