#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>

#include <CLI/CLI.hpp>

#include <gmcp/config/config_helpers.h>
#include <gmcp/doctor/doctor.h>
#include <gmcp/doctor/issue_report.h>
#include <gmcp/doctor/scoped_file_override.h>

namespace {

using gmcp::doctor::json;

bool setupLogging(const std::string& level, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!logFile.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, 10 * 1024 * 1024, 3));
        }
        auto logger = std::make_shared<spdlog::logger>("gmcp-doctor", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);

        if (level == "trace")
            spdlog::set_level(spdlog::level::trace);
        else if (level == "debug")
            spdlog::set_level(spdlog::level::debug);
        else if (level == "info")
            spdlog::set_level(spdlog::level::info);
        else if (level == "warn")
            spdlog::set_level(spdlog::level::warn);
        else if (level == "error")
            spdlog::set_level(spdlog::level::err);
        else if (level == "off")
            spdlog::set_level(spdlog::level::off);

        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return false;
    }
    return true;
}

struct ReportArgs {
    std::string project;
    std::string scan;
    std::string out{gmcp::config::kDefaultReportPath};
    std::string godotVersion;
};

int runReport(const ReportArgs& args, bool jsonOutput) {
    namespace fs = std::filesystem;
    using namespace gmcp::doctor;

    auto raw = readWholeFile(args.scan);
    if (!raw) {
        spdlog::error("Cannot read scan result {}: {}", args.scan, raw.error().message);
        return 1;
    }
    auto scan = json::parse(raw.value(), nullptr, false);
    if (scan.is_discarded()) {
        spdlog::error("Scan result {} is not valid JSON", args.scan);
        return 1;
    }

    std::error_code ec;
    auto root = fs::absolute(args.project, ec).lexically_normal();
    if (ec) {
        spdlog::error("Invalid project path {}: {}", args.project, ec.message());
        return 1;
    }

    ReportInput input{.projectPath = root.string(),
                      .godotVersion = std::nullopt,
                      .generatedAt = currentIsoTimestamp(),
                      .scan = std::move(scan)};
    if (!args.godotVersion.empty()) {
        input.godotVersion = args.godotVersion;
    }
    auto report = buildDoctorReport(input);

    auto written = writeDoctorReport(report, root, args.out);
    if (!written) {
        spdlog::error("Failed to write report: {}", written.error().message);
        return 1;
    }
    spdlog::info("Report written to {}", written.value().string());

    if (jsonOutput) {
        json out = {{"ok", !report.hasErrors()},
                    {"path", written.value().string()},
                    {"summary", report.summary.toJson()}};
        std::cout << out.dump(2) << std::endl;
    } else {
        std::cout << written.value().string() << std::endl;
    }
    return report.hasErrors() ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"gmcp-doctor - environment and connectivity checks for the Godot MCP server"};

    std::string logLevel = gmcp::config::get_env_nonempty("GMCP_LOG_LEVEL").value_or("warn");
    std::string logFile;
    bool jsonOutput = false;

    std::string godotPath;
    std::string projectPath;
    std::string serverPath;
    std::string addonDir;
    bool strict = false;
    bool readOnly = false;
    bool skipSelfTest = false;
    long long launchTimeoutMs = 0;

    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app.add_option("--log-file", logFile, "Log file path (optional)");
    app.add_flag("--json", jsonOutput, "Print machine-readable JSON to stdout");

    app.add_option("--godot-path", godotPath, "Godot executable to check");
    app.add_option("--project", projectPath, "Godot project directory");
    app.add_flag("--strict-path-validation", strict,
                 "Fail instead of falling back to an unvalidated default executable");
    app.add_flag("--read-only", readOnly, "Report needed project changes without writing them");
    app.add_option("--server", serverPath, "MCP server entry point used by the self-test");
    app.add_option("--addon-dir", addonDir, "Source directory of the godot_mcp_bridge addon");
    app.add_option("--launch-timeout-ms", launchTimeoutMs,
                   "How long to wait for an auto-launched editor bridge")
        ->check(CLI::PositiveNumber);
    app.add_flag("--skip-self-test", skipSelfTest, "Do not start the MCP server");

    ReportArgs reportArgs;
    auto* report = app.add_subcommand("report", "Render a project scan result as Markdown");
    report->add_option("--project", reportArgs.project, "Godot project directory")->required();
    report->add_option("--scan", reportArgs.scan, "Scan result JSON file")
        ->required()
        ->check(CLI::ExistingFile);
    report->add_option("--out", reportArgs.out, "Output path relative to the project")
        ->capture_default_str();
    report->add_option("--godot-version", reportArgs.godotVersion, "Godot version to record");

    CLI11_PARSE(app, argc, argv);

    if (!setupLogging(logLevel, logFile)) {
        return 1;
    }

    if (report->parsed()) {
        return runReport(reportArgs, jsonOutput);
    }

    gmcp::doctor::DoctorOptions options;
    if (!godotPath.empty()) {
        options.godotPath = godotPath;
    }
    if (!projectPath.empty()) {
        options.projectPath = projectPath;
    }
    if (!serverPath.empty()) {
        options.serverPath = gmcp::config::expand_tilde(serverPath);
    }
    if (!addonDir.empty()) {
        options.addonSourceDir = gmcp::config::expand_tilde(addonDir);
    }
    options.strictPathValidation = strict;
    options.readOnly = readOnly;
    options.skipSelfTest = skipSelfTest;

    if (launchTimeoutMs > 0) {
        options.launchTimeout = std::chrono::milliseconds{launchTimeoutMs};
    } else if (auto configured = gmcp::config::parse_config_value(
                   gmcp::config::get_config_path(), "probe", "launch_timeout_ms");
               !configured.empty()) {
        char* end = nullptr;
        const long long ms = std::strtoll(configured.c_str(), &end, 10);
        if (end != configured.c_str() && *end == '\0' && ms > 0) {
            options.launchTimeout = std::chrono::milliseconds{ms};
        } else {
            spdlog::warn("Ignoring invalid [probe] launch_timeout_ms '{}'", configured);
        }
    }

    try {
        auto result = gmcp::doctor::runDoctor(options);
        if (jsonOutput) {
            std::cout << result.toJson().dump(2) << std::endl;
        } else {
            std::cout << gmcp::doctor::formatDoctorReport(result) << std::endl;
        }
        return result.ok ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
