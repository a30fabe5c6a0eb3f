#include <gtest/gtest.h>

#include <gmcp/doctor/project_setup.h>

#include "../../common/test_helpers.h"

#include <regex>

using namespace gmcp::doctor;
namespace fs = std::filesystem;

// ----------------------------------------------------------------------------
// project.godot editing
// ----------------------------------------------------------------------------

TEST(EditorPluginPatch, AppendsSectionWhenMissing) {
    const std::string in = "config_version=5\n\n[application]\nconfig/name=\"Demo\"\n";
    auto out = ensureEditorPluginEnabled(in, "godot_mcp_bridge");
    EXPECT_EQ(out, "config_version=5\n\n[application]\nconfig/name=\"Demo\"\n\n"
                   "[editor_plugins]\nenabled=PackedStringArray(\"godot_mcp_bridge\")\n");
    EXPECT_TRUE(isEditorPluginEnabled(out, "godot_mcp_bridge"));
}

TEST(EditorPluginPatch, AddsEnabledLineToExistingSection) {
    const std::string in = "[editor_plugins]\n\n[rendering]\nx=1";
    auto out = ensureEditorPluginEnabled(in, "godot_mcp_bridge");
    EXPECT_EQ(out, "[editor_plugins]\n\nenabled=PackedStringArray(\"godot_mcp_bridge\")\n"
                   "[rendering]\nx=1");
}

TEST(EditorPluginPatch, ExtendsExistingListKeepingOrder) {
    const std::string in =
        "[editor_plugins]\r\nenabled=PackedStringArray(\"res://addons/a/plugin.cfg\", \"b\")\r\n";
    auto out = ensureEditorPluginEnabled(in, "godot_mcp_bridge");
    EXPECT_EQ(out, "[editor_plugins]\nenabled=PackedStringArray(\"res://addons/a/plugin.cfg\", "
                   "\"b\", \"godot_mcp_bridge\")\n");
}

TEST(EditorPluginPatch, AlreadyEnabledIsByteIdentical) {
    const std::string in =
        "[editor_plugins]\r\n\r\nenabled=PackedStringArray(\"godot_mcp_bridge\")\r\n";
    EXPECT_EQ(ensureEditorPluginEnabled(in, "godot_mcp_bridge"), in);
}

TEST(EditorPluginPatch, PatchingIsIdempotent) {
    for (const std::string in :
         {"", "[editor_plugins]\n", "a=1\n[editor_plugins]\nenabled=PackedStringArray()\n"}) {
        auto once = ensureEditorPluginEnabled(in, "godot_mcp_bridge");
        EXPECT_EQ(ensureEditorPluginEnabled(once, "godot_mcp_bridge"), once) << in;
    }
}

TEST(EditorPluginPatch, EnabledInOtherSectionDoesNotCount) {
    EXPECT_FALSE(isEditorPluginEnabled(
        "[other]\nenabled=PackedStringArray(\"godot_mcp_bridge\")\n", "godot_mcp_bridge"));
}

TEST(BridgeToken, ThirtyTwoLowercaseHexCharacters) {
    const std::regex hex("^[0-9a-f]{32}$");
    auto a = generateBridgeToken();
    auto b = generateBridgeToken();
    EXPECT_TRUE(std::regex_match(a, hex)) << a;
    EXPECT_NE(a, b);
}

// ----------------------------------------------------------------------------
// Inspection and reconciliation
// ----------------------------------------------------------------------------

class ProjectSetupTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = gmcp::test::make_temp_dir("gmcp_setup_");
        project_ = base_ / "game";
        addonSrc_ = base_ / "addon_src";
        gmcp::test::write_file(project_ / "project.godot",
                               "config_version=5\n\n[application]\nconfig/name=\"Demo\"\n");
        gmcp::test::write_file(addonSrc_ / "plugin.cfg", "[plugin]\nname=\"bridge\"\n");
        gmcp::test::write_file(addonSrc_ / "bridge.gd", "extends EditorPlugin\n");
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    ProjectSetupOptions options(bool readOnly = false) const {
        return ProjectSetupOptions{.projectPath = project_, .addonSourceDir = addonSrc_,
                                   .readOnly = readOnly};
    }

    fs::path lockPath() const { return project_ / ".godot_mcp" / "bridge.lock"; }

    fs::path base_;
    fs::path project_;
    fs::path addonSrc_;
};

TEST_F(ProjectSetupTest, InspectionReportsMissingPiecesWithHints) {
    auto inspection = inspectProject(project_);
    const auto& d = inspection.details;
    EXPECT_TRUE(d.ok);
    EXPECT_TRUE(d.hasProjectGodot);
    EXPECT_FALSE(d.hasBridgeAddon);
    EXPECT_FALSE(d.hasBridgePluginEnabled);
    EXPECT_FALSE(d.hasTokenFile);
    EXPECT_FALSE(d.hasLockFile);

    auto mentions = [&](std::string_view needle) {
        for (const auto& s : inspection.suggestions) {
            if (s.find(needle) != std::string::npos)
                return true;
        }
        return false;
    };
    EXPECT_TRUE(mentions("Missing editor bridge addon"));
    EXPECT_TRUE(mentions("GODOT_MCP_ADDON_DIR"));
    EXPECT_TRUE(mentions("Missing .godot_mcp_token"));
    EXPECT_TRUE(mentions("not enabled"));
}

TEST_F(ProjectSetupTest, InspectionOfMissingDirectoryFails) {
    auto inspection = inspectProject(base_ / "nope");
    EXPECT_FALSE(inspection.details.ok);
    EXPECT_FALSE(inspection.details.hasProjectGodot);
    EXPECT_TRUE(inspection.details.error.has_value());
}

TEST_F(ProjectSetupTest, FreshProjectIsFullyReconciled) {
    auto outcome = reconcileProjectSetup(options());
    ASSERT_TRUE(outcome.ok) << outcome.error.value_or("");
    EXPECT_FALSE(outcome.skipped);
    EXPECT_TRUE(outcome.addonCopied);
    EXPECT_TRUE(outcome.pluginEnabledUpdated);
    EXPECT_TRUE(outcome.tokenCreated);
    EXPECT_EQ(outcome.summary, "project setup: addon copied, plugin enabled, token created");

    EXPECT_TRUE(fs::exists(project_ / "addons/godot_mcp_bridge/plugin.cfg"));
    EXPECT_TRUE(fs::exists(project_ / "addons/godot_mcp_bridge/bridge.gd"));
    auto token = gmcp::test::read_file(project_ / ".godot_mcp_token");
    EXPECT_EQ(token.size(), 33u);
    EXPECT_EQ(token.back(), '\n');

    auto inspection = inspectProject(project_);
    EXPECT_TRUE(inspection.details.hasBridgeAddon);
    EXPECT_TRUE(inspection.details.hasBridgePluginEnabled);
    EXPECT_TRUE(inspection.details.hasTokenFile);
}

TEST_F(ProjectSetupTest, SecondRunIsNoOp) {
    ASSERT_TRUE(reconcileProjectSetup(options()).ok);
    const auto descriptor = gmcp::test::read_file(project_ / "project.godot");
    const auto token = gmcp::test::read_file(project_ / ".godot_mcp_token");

    auto again = reconcileProjectSetup(options());
    EXPECT_TRUE(again.ok);
    EXPECT_FALSE(again.addonCopied);
    EXPECT_FALSE(again.pluginEnabledUpdated);
    EXPECT_FALSE(again.tokenCreated);
    EXPECT_EQ(again.summary, "project setup: already up to date");
    EXPECT_EQ(gmcp::test::read_file(project_ / "project.godot"), descriptor);
    EXPECT_EQ(gmcp::test::read_file(project_ / ".godot_mcp_token"), token);
}

TEST_F(ProjectSetupTest, WhitespaceOnlyTokenIsReplaced) {
    gmcp::test::write_file(project_ / ".godot_mcp_token", "  \n");
    auto outcome = reconcileProjectSetup(options());
    EXPECT_TRUE(outcome.tokenCreated);
}

TEST_F(ProjectSetupTest, ReadOnlyReportsPendingChangesWithoutWriting) {
    const auto before = gmcp::test::read_file(project_ / "project.godot");
    auto outcome = reconcileProjectSetup(options(true));
    EXPECT_TRUE(outcome.ok);
    EXPECT_TRUE(outcome.skipped);
    EXPECT_EQ(outcome.pendingChanges.size(), 3u);
    EXPECT_EQ(gmcp::test::read_file(project_ / "project.godot"), before);
    EXPECT_FALSE(fs::exists(project_ / ".godot_mcp_token"));
    EXPECT_FALSE(fs::exists(project_ / "addons"));
}

TEST_F(ProjectSetupTest, LockPresentBlocksAllWrites) {
    gmcp::test::write_file(lockPath(), "{}");
    const auto before = gmcp::test::read_file(project_ / "project.godot");
    auto outcome = reconcileProjectSetup(options());
    EXPECT_TRUE(outcome.ok);
    EXPECT_TRUE(outcome.skipped);
    EXPECT_TRUE(outcome.lockFileExists);
    EXPECT_FALSE(outcome.pendingChanges.empty());
    EXPECT_EQ(gmcp::test::read_file(project_ / "project.godot"), before);
    EXPECT_FALSE(fs::exists(project_ / ".godot_mcp_token"));
}

TEST_F(ProjectSetupTest, LockAppearingMidRunStopsBeforeNextWrite) {
    auto opts = options();
    std::vector<std::string> steps;
    opts.beforeMutation = [&](std::string_view step) {
        steps.emplace_back(step);
        if (step == "plugin") {
            gmcp::test::write_file(lockPath(), "{}");
        }
    };
    const auto before = gmcp::test::read_file(project_ / "project.godot");

    auto outcome = reconcileProjectSetup(opts);
    EXPECT_FALSE(outcome.ok);
    EXPECT_TRUE(outcome.lockFileExists);
    EXPECT_TRUE(outcome.addonCopied);
    EXPECT_FALSE(outcome.pluginEnabledUpdated);
    EXPECT_FALSE(outcome.tokenCreated);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("bridge lock present"), std::string::npos);
    EXPECT_EQ(steps, (std::vector<std::string>{"addon", "plugin"}));
    EXPECT_EQ(gmcp::test::read_file(project_ / "project.godot"), before);
    EXPECT_FALSE(fs::exists(project_ / ".godot_mcp_token"));
}

TEST_F(ProjectSetupTest, MissingAddonSourceFailsButOtherStepsRun) {
    auto opts = options();
    opts.addonSourceDir = base_ / "no_such_addon";
    auto outcome = reconcileProjectSetup(opts);
    EXPECT_FALSE(outcome.ok);
    EXPECT_FALSE(outcome.addonCopied);
    EXPECT_TRUE(outcome.pluginEnabledUpdated);
    EXPECT_TRUE(outcome.tokenCreated);
    ASSERT_EQ(outcome.suggestions.size(), 2u);
    EXPECT_NE(outcome.suggestions.front().find("GODOT_MCP_ADDON_DIR"), std::string::npos);
    EXPECT_NE(outcome.suggestions.back().find("Created .godot_mcp_token"), std::string::npos);
}

TEST_F(ProjectSetupTest, MissingDescriptorFails) {
    fs::remove(project_ / "project.godot");
    auto outcome = reconcileProjectSetup(options());
    EXPECT_FALSE(outcome.ok);
    EXPECT_FALSE(outcome.skipped);
    EXPECT_FALSE(fs::exists(project_ / ".godot_mcp_token"));
}

TEST_F(ProjectSetupTest, CheckResultCarriesFlags) {
    auto check = reconcileProjectSetup(options()).toCheckResult();
    EXPECT_TRUE(check.ok);
    EXPECT_TRUE(check.details.value("tokenCreated", false));
}
