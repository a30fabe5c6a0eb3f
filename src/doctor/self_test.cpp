#include <gmcp/config/config_helpers.h>
#include <gmcp/core/format.h>
#include <gmcp/core/scope_guard.h>
#include <gmcp/doctor/project_setup.h>
#include <gmcp/doctor/scoped_file_override.h>
#include <gmcp/doctor/self_test.h>
#include <gmcp/process/child_process.hpp>
#include <gmcp/process/jsonrpc_client.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>

namespace gmcp::doctor {

namespace fs = std::filesystem;
using process::ChildProcess;
using process::ChildProcessConfig;
using process::JsonRpcClient;

namespace {

constexpr std::string_view kBatchTool = "godot_headless_batch";

// 32x16 RGBA atlas: two solid 16x16 tiles
constexpr unsigned char kAtlasPng[] = {
    0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a, 0x00, 0x00, 0x00, 0x0d, 0x49, 0x48, 0x44,
    0x52, 0x00, 0x00, 0x00, 0x20, 0x00, 0x00, 0x00, 0x10, 0x08, 0x06, 0x00, 0x00, 0x00, 0x77,
    0x00, 0x7d, 0x59, 0x00, 0x00, 0x00, 0x28, 0x49, 0x44, 0x41, 0x54, 0x78, 0xda, 0x63, 0x38,
    0x61, 0x63, 0xf3, 0x9f, 0x12, 0x6c, 0x63, 0x73, 0x82, 0x22, 0xcc, 0x30, 0xea, 0x80, 0x51,
    0x07, 0x8c, 0x3a, 0x60, 0xd4, 0x01, 0xa3, 0x0e, 0x18, 0x75, 0xc0, 0xa8, 0x03, 0x06, 0xda,
    0x01, 0x00, 0x4a, 0xa5, 0x7e, 0x3d, 0xf9, 0x2f, 0x33, 0x6d, 0x00, 0x00, 0x00, 0x00, 0x49,
    0x45, 0x4e, 0x44, 0xae, 0x42, 0x60, 0x82};

constexpr std::string_view kProjectGodot = R"(; Engine configuration file.
config_version=5

[application]

config/name="gmcp-selftest"
)";

constexpr std::string_view kAsepriteJson = R"({
  "frames": {
    "idle 0": {"frame": {"x": 0, "y": 0, "w": 16, "h": 16}, "duration": 100},
    "idle 1": {"frame": {"x": 16, "y": 0, "w": 16, "h": 16}, "duration": 100}
  },
  "meta": {
    "image": "atlas.png",
    "size": {"w": 32, "h": 16},
    "frameTags": [{"name": "idle", "from": 0, "to": 1, "direction": "forward"}]
  }
}
)";

constexpr std::string_view kScript = R"(extends Node2D

func _ready() -> void:
	print("gmcp selftest")
)";

constexpr std::string_view kFixtureScene = R"([gd_scene format=3]

[node name="Fixture" type="Node2D"]
)";

std::string fixture(std::string_view name) {
    return gmcp::format("{}/{}", config::kSelfTestDir, name);
}

std::string output(std::string_view name) {
    return gmcp::format("{}/out/{}", config::kSelfTestDir, name);
}

json step(std::string_view operation, json params) {
    return {{"operation", std::string(operation)}, {"params", std::move(params)}};
}

ChildProcessConfig dispatcherCommand(const fs::path& entry) {
    ChildProcessConfig cfg;
    auto ext = config::to_lower(entry.extension().string());
    if (ext == ".js" || ext == ".mjs" || ext == ".cjs") {
        cfg.executable = "node";
        cfg.args = {entry.string()};
    } else {
        cfg.executable = entry;
    }
    return cfg;
}

std::string joinPaths(const std::vector<std::string>& paths) {
    std::string out;
    for (const auto& p : paths) {
        out += out.empty() ? p : ", " + p;
    }
    return out;
}

Result<fs::path> makeScratchProject(const std::optional<fs::path>& parent) {
    fs::path base;
    if (parent) {
        base = *parent;
    } else {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         gmcp::format("no usable temp directory: {}", ec.message())};
        }
    }
    return base / gmcp::format("gmcp-selftest-{}", generateBridgeToken().substr(0, 12));
}

} // namespace

json buildSelfTestBatchSteps() {
    const auto mainScene = output("Main.tscn");
    const auto hostScene = output("Host.tscn");
    const auto worldScene = output("World.tscn");
    const auto tileset = output("Tiles.tres");
    const auto atlasRes = "res://" + fixture("atlas.png");

    json steps = json::array();
    steps.push_back(step("write_text_file",
                         {{"path", output("hello.txt")}, {"content", "gmcp selftest\n"}}));
    steps.push_back(
        step("create_resource", {{"resourcePath", output("Mesh.tres")}, {"type", "BoxMesh"}}));
    steps.push_back(
        step("create_scene", {{"scenePath", mainScene}, {"rootNodeType", "Node2D"}}));
    steps.push_back(step("add_node", {{"scenePath", mainScene},
                                      {"parentNodePath", "root"},
                                      {"nodeType", "Sprite2D"},
                                      {"nodeName", "Sprite"}}));
    steps.push_back(step("add_node", {{"scenePath", mainScene},
                                      {"parentNodePath", "root"},
                                      {"nodeType", "Timer"},
                                      {"nodeName", "Timer"}}));
    steps.push_back(step("set_node_properties", {{"scenePath", mainScene},
                                                 {"nodePath", "root/Timer"},
                                                 {"props", {{"wait_time", 0.5}, {"autostart", true}}}}));
    steps.push_back(step("load_sprite", {{"scenePath", mainScene},
                                         {"nodePath", "root/Sprite"},
                                         {"texturePath", atlasRes}}));
    steps.push_back(step("connect_signal", {{"scenePath", mainScene},
                                            {"fromNodePath", "root/Timer"},
                                            {"toNodePath", "root"},
                                            {"signal", "timeout"},
                                            {"method", "queue_free"}}));
    steps.push_back(step("validate_scene", {{"scenePath", mainScene}}));
    steps.push_back(step("save_scene", {{"scenePath", mainScene}}));
    steps.push_back(step("create_scene", {{"scenePath", hostScene}, {"rootNodeType", "Node"}}));
    steps.push_back(step("instance_scene", {{"scenePath", hostScene},
                                            {"sourceScenePath", fixture("Fixture.tscn")},
                                            {"parentNodePath", "root"},
                                            {"name", "Fixture"}}));
    steps.push_back(step("save_scene", {{"scenePath", hostScene}}));
    steps.push_back(step("op_tileset_create_from_atlas", {{"pngPath", fixture("atlas.png")},
                                                          {"tileSize", 16},
                                                          {"outputTilesetPath", tileset},
                                                          {"allowOverwrite", true}}));
    steps.push_back(
        step("create_scene", {{"scenePath", worldScene}, {"rootNodeType", "Node2D"}}));
    steps.push_back(step("op_world_scene_ensure_layers", {{"scenePath", worldScene}}));
    steps.push_back(step("op_world_generate_tiles", {{"scenePath", worldScene},
                                                     {"layerName", "Terrain"},
                                                     {"mapSize", {{"width", 8}, {"height", 8}}},
                                                     {"seed", 1},
                                                     {"tilesetPath", tileset}}));
    steps.push_back(step("op_spriteframes_from_aseprite_json",
                         {{"spritesheetPngPath", fixture("atlas.png")},
                          {"asepriteJsonPath", fixture("atlas.json")},
                          {"spriteFramesPath", output("Frames.tres")},
                          {"fps", 8},
                          {"loop", true}}));
    steps.push_back(step("resave_resources", json::object()));
    steps.push_back(step("doctor_scan_v1", {{"include_assets", true},
                                            {"include_scripts", true},
                                            {"include_scenes", true},
                                            {"include_uid", true},
                                            {"include_export", false},
                                            {"max_issues_per_category", 50}}));
    return steps;
}

std::vector<ExpectedArtifact> selfTestExpectedArtifacts() {
    return {{output("hello.txt"), false},  {output("Mesh.tres"), false},
            {output("Main.tscn"), false},  {output("Host.tscn"), false},
            {output("World.tscn"), false}, {output("Tiles.tres"), true},
            {output("Frames.tres"), true}};
}

Result<void> writeSelfTestFixtures(const fs::path& projectRoot) {
    const std::string_view png(reinterpret_cast<const char*>(kAtlasPng), sizeof(kAtlasPng));
    const std::pair<std::string, std::string_view> files[] = {
        {std::string(config::kProjectDescriptor), kProjectGodot},
        {fixture("atlas.png"), png},
        {fixture("atlas.json"), kAsepriteJson},
        {fixture("hello.gd"), kScript},
        {fixture("Fixture.tscn"), kFixtureScene},
    };
    for (const auto& [rel, content] : files) {
        if (auto r = writeWholeFile(projectRoot / rel, content); !r) {
            return r.error();
        }
    }
    return {};
}

std::vector<std::string> findMissingArtifacts(const fs::path& projectRoot,
                                              const std::vector<ExpectedArtifact>& expected) {
    std::vector<std::string> missing;
    for (const auto& artifact : expected) {
        std::error_code ec;
        auto path = projectRoot / artifact.relativePath;
        bool present = fs::is_regular_file(path, ec);
        if (present && artifact.nonEmpty) {
            auto size = fs::file_size(path, ec);
            present = !ec && size > 0;
        }
        if (!present) {
            missing.push_back(artifact.relativePath);
        }
    }
    return missing;
}

SelfTestResult runSelfTest(const SelfTestOptions& options) {
    SelfTestResult result;

    std::error_code ec;
    if (!options.serverPath || !fs::is_regular_file(*options.serverPath, ec)) {
        auto where = options.serverPath ? options.serverPath->string() : std::string("(unset)");
        result.mcpServer = DoctorCheckResult::failed(
            "MCP server entry point not found", gmcp::format("missing dispatcher: {}", where));
        result.mcpServer.suggestions.push_back(
            gmcp::format("Build the MCP server first (expected entry point: {}), or point "
                         "GODOT_MCP_SERVER / --server at it.",
                         where));
        result.headlessBatch =
            DoctorCheckResult::skippedBecause("skipped: MCP server is not available");
        return result;
    }

    auto scratchPath = makeScratchProject(options.scratchParent);
    if (!scratchPath) {
        result.mcpServer = DoctorCheckResult::failed("Could not prepare self-test project",
                                                     scratchPath.error().message);
        result.headlessBatch =
            DoctorCheckResult::skippedBecause("skipped: self-test project not prepared");
        return result;
    }
    const fs::path scratch = scratchPath.value();
    auto removeScratch = scope_exit([&scratch] {
        std::error_code rmEc;
        fs::remove_all(scratch, rmEc);
        if (rmEc) {
            spdlog::warn("self-test: failed to remove {}: {}", scratch.string(), rmEc.message());
        } else {
            spdlog::debug("self-test: removed {}", scratch.string());
        }
    });

    std::unique_ptr<ChildProcess> server;
    auto stopServer = scope_exit([&server, &options] {
        if (server) {
            spdlog::debug("self-test: stopping dispatcher pid={}", server->pid());
            server->terminate(options.terminateGrace);
        }
    });

    try {
        if (auto fx = writeSelfTestFixtures(scratch); !fx) {
            result.mcpServer = DoctorCheckResult::failed("Could not prepare self-test project",
                                                         fx.error().message);
            result.headlessBatch =
                DoctorCheckResult::skippedBecause("skipped: self-test project not prepared");
            return result;
        }

        auto cfg = dispatcherCommand(*options.serverPath);
        cfg.with_env("ALLOW_DANGEROUS_OPS", "true").in_directory(scratch);
        if (options.godotPath) {
            cfg.with_env("GODOT_PATH", *options.godotPath);
        }
        spdlog::info("self-test: starting dispatcher {}", options.serverPath->string());
        server = std::make_unique<ChildProcess>(std::move(cfg));
        JsonRpcClient rpc{*server};

        auto tools = rpc.listTools(options.listTimeout);
        if (!tools) {
            json details = {{"stderrTail", server->stderr_tail()}};
            result.mcpServer = DoctorCheckResult::failed(
                "MCP server did not answer tools/list", tools.error().message, details);
            result.mcpServer.suggestions.push_back(
                "Run the MCP server manually to see its startup error.");
            result.headlessBatch =
                DoctorCheckResult::skippedBecause("skipped: MCP server not responding");
            return result;
        }
        const auto& names = tools.value();
        result.mcpServer = DoctorCheckResult::passed(
            gmcp::format("MCP server responded ({} tools)", names.size()),
            {{"toolCount", names.size()}});

        if (!options.godotPath) {
            result.headlessBatch = DoctorCheckResult::skippedBecause(
                "skipped: no valid Godot executable for headless batch");
            return result;
        }
        if (std::find(names.begin(), names.end(), kBatchTool) == names.end()) {
            result.headlessBatch = DoctorCheckResult::failed(
                "Headless batch tool not advertised",
                gmcp::format("{} missing from tools/list", kBatchTool));
            return result;
        }

        json args = {{"projectPath", scratch.string()},
                     {"steps", buildSelfTestBatchSteps()},
                     {"stopOnError", true}};
        spdlog::info("self-test: running headless batch in {}", scratch.string());
        auto batch = rpc.callTool(kBatchTool, std::move(args), options.batchTimeout);
        if (!batch) {
            result.headlessBatch = DoctorCheckResult::failed("Headless batch did not complete",
                                                             batch.error().message);
            return result;
        }
        const auto& response = batch.value();
        if (!response.ok) {
            result.headlessBatch = DoctorCheckResult::failed(
                "Headless batch failed", response.summary, response.details);
            return result;
        }

        auto expected = selfTestExpectedArtifacts();
        auto missing = findMissingArtifacts(scratch, expected);
        if (!missing.empty()) {
            json expectedList = json::array();
            for (const auto& e : expected) {
                expectedList.push_back(e.relativePath);
            }
            result.headlessBatch = DoctorCheckResult::failed(
                "Headless batch finished but artifacts are missing",
                gmcp::format("missing: {}", joinPaths(missing)),
                {{"expected", std::move(expectedList)}, {"missing", missing}});
            return result;
        }
        result.headlessBatch = DoctorCheckResult::passed(
            gmcp::format("Headless batch OK ({} steps)", buildSelfTestBatchSteps().size()));
    } catch (const std::exception& e) {
        spdlog::error("self-test: {}", e.what());
        if (result.mcpServer.summary.empty()) {
            result.mcpServer = DoctorCheckResult::failed("MCP server self-test failed", e.what());
            result.headlessBatch =
                DoctorCheckResult::skippedBecause("skipped: MCP server self-test failed");
        } else {
            result.headlessBatch = DoctorCheckResult::failed("Headless batch failed", e.what());
        }
    }
    return result;
}

} // namespace gmcp::doctor
