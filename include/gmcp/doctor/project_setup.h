#pragma once

#include <gmcp/doctor/types.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gmcp::doctor {

// ============================================================================
// project.godot editing
// ============================================================================

/// True when @p pluginId is listed in `[editor_plugins] enabled=PackedStringArray(...)`.
bool isEditorPluginEnabled(std::string_view descriptorText, std::string_view pluginId);

/**
 * Returns @p descriptorText with @p pluginId added to the enabled plugin list.
 *
 * Already enabled: the input is returned unchanged, byte for byte. Otherwise line endings are
 * normalized to LF and either the section, the `enabled=` line or the id is appended.
 */
std::string ensureEditorPluginEnabled(std::string_view descriptorText, std::string_view pluginId);

/// 16 random bytes as 32 lowercase hex characters.
std::string generateBridgeToken();

// ============================================================================
// Inspection
// ============================================================================

struct ProjectInspection {
    ProjectDetails details;
    std::vector<std::string> suggestions;
};

/// Reports which bridge-related files exist. Never modifies the project.
ProjectInspection inspectProject(const std::filesystem::path& projectPath);

// ============================================================================
// Reconciliation
// ============================================================================

struct ProjectSetupOptions {
    std::filesystem::path projectPath;
    /// Directory holding the bridge addon (contains plugin.cfg)
    std::optional<std::filesystem::path> addonSourceDir;
    bool readOnly{false};
    /// Invoked right before each mutating step with its name ("addon", "plugin", "token").
    std::function<void(std::string_view step)> beforeMutation;
};

/**
 * Brings the project's addon copy, plugin enablement and token file to the desired state.
 *
 * Never writes while the bridge lock exists; the lock is re-checked before every mutating step.
 * Read-only runs and lock-present runs report pendingChanges and skip all writes.
 */
ProjectSetupOutcome reconcileProjectSetup(const ProjectSetupOptions& options);

} // namespace gmcp::doctor
