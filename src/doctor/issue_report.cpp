#include <gmcp/config/config_helpers.h>
#include <gmcp/core/format.h>
#include <gmcp/doctor/issue_report.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <set>
#include <sstream>
#include <tuple>

namespace gmcp::doctor {

namespace fs = std::filesystem;

namespace {

constexpr IssueCategory kCategoryOrder[] = {
    IssueCategory::Environment, IssueCategory::Project, IssueCategory::Assets,
    IssueCategory::Scripts,     IssueCategory::Scenes,  IssueCategory::Uid,
    IssueCategory::Export,      IssueCategory::Other};

std::string_view categoryTitle(IssueCategory category) noexcept {
    switch (category) {
        case IssueCategory::Environment:
            return "Environment";
        case IssueCategory::Project:
            return "Project Settings";
        case IssueCategory::Assets:
            return "Assets / Import";
        case IssueCategory::Scripts:
            return "Scripts";
        case IssueCategory::Scenes:
            return "Scenes / Resources";
        case IssueCategory::Uid:
            return "UID";
        case IssueCategory::Export:
            return "Export";
        case IssueCategory::Other:
            return "Other";
    }
    return "Other";
}

std::string_view severityBadge(IssueSeverity severity) noexcept {
    switch (severity) {
        case IssueSeverity::Error:
            return "ERROR";
        case IssueSeverity::Warning:
            return "WARN";
        case IssueSeverity::Info:
            return "INFO";
    }
    return "INFO";
}

std::optional<std::string> nonEmptyTrimmed(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = config::trimmed(it->get_ref<const std::string&>());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

/// Numbers pass through; strings must parse completely as a number.
std::optional<double> coerceNumber(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return std::nullopt;
    }
    double value = 0;
    if (it->is_number()) {
        value = it->get<double>();
    } else if (it->is_string()) {
        auto text = config::trimmed(it->get_ref<const std::string&>());
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        value = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<IssueLocation> normalizeLocation(const json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    IssueLocation loc;
    loc.file = nonEmptyTrimmed(raw, "file");
    if (auto line = coerceNumber(raw, "line"); line && *line > 0) {
        auto floored = std::floor(*line);
        if (floored >= 1 && floored < 9.0e18) {
            loc.line = static_cast<std::int64_t>(floored);
        }
    }
    loc.nodePath = nonEmptyTrimmed(raw, "nodePath");
    loc.uid = nonEmptyTrimmed(raw, "uid");
    if (loc.empty()) {
        return std::nullopt;
    }
    return loc;
}

std::vector<std::string> normalizeActions(const json& raw) {
    std::vector<std::string> actions;
    const json* list = nullptr;
    if (auto it = raw.find("relatedActions"); it != raw.end() && it->is_array()) {
        list = &*it;
    } else if (auto legacy = raw.find("relatedMcpActions");
               legacy != raw.end() && legacy->is_array()) {
        list = &*legacy;
    }
    if (!list) {
        return actions;
    }
    for (const auto& entry : *list) {
        if (!entry.is_string()) {
            continue;
        }
        auto action = config::trimmed(entry.get_ref<const std::string&>());
        if (!action.empty()) {
            actions.push_back(std::move(action));
        }
    }
    return actions;
}

using DedupeKey =
    std::tuple<std::string, int, int, std::string, std::int64_t, std::string, std::string,
               std::string, std::string>;

DedupeKey dedupeKey(const DoctorIssue& issue) {
    const IssueLocation empty;
    const auto& loc = issue.location ? *issue.location : empty;
    return {issue.issueId,
            severityRank(issue.severity),
            categoryRank(issue.category),
            loc.file.value_or(""),
            loc.line.value_or(0),
            loc.nodePath.value_or(""),
            loc.uid.value_or(""),
            issue.title,
            issue.message};
}

std::string escapeTableCell(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '|') {
            out += "\\|";
        } else if (c == '\n') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return config::trimmed(out);
}

std::string locationText(const DoctorIssue& issue) {
    if (!issue.location) {
        return {};
    }
    const auto& loc = *issue.location;
    std::vector<std::string> bits;
    if (loc.file) {
        bits.push_back(loc.line ? gmcp::format("{}:{}", *loc.file, *loc.line) : *loc.file);
    }
    if (loc.nodePath) {
        bits.push_back("node:" + *loc.nodePath);
    }
    if (loc.uid) {
        bits.push_back("uid:" + *loc.uid);
    }
    std::string text;
    for (size_t i = 0; i < bits.size(); ++i) {
        if (i > 0) {
            text += ' ';
        }
        text += bits[i];
    }
    return text;
}

std::string issueAnchor(const DoctorIssue& issue, size_t index) {
    auto base = config::to_lower(gmcp::format("{}-{}-{}-{}", to_string(issue.severity),
                                              to_string(issue.category), issue.issueId,
                                              index + 1));
    std::string anchor;
    bool pendingDash = false;
    for (char c : base) {
        bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (!alnum) {
            pendingDash = true;
            continue;
        }
        if (pendingDash && !anchor.empty()) {
            anchor += '-';
        }
        pendingDash = false;
        anchor += c;
    }
    if (anchor.empty()) {
        return gmcp::format("issue-{}", index + 1);
    }
    return anchor;
}

const char* boolText(bool value) {
    return value ? "true" : "false";
}

void renderIssueDetails(std::vector<std::string>& lines, const DoctorIssue& issue, size_t index) {
    // U+2022 BULLET between badge and id
    lines.push_back(
        gmcp::format("### {} \xE2\x80\xA2 {}", severityBadge(issue.severity), issue.issueId));
    lines.push_back(gmcp::format("<a id=\"{}\"></a>", issueAnchor(issue, index)));
    lines.emplace_back();
    lines.push_back(gmcp::format("- Category: `{}`", to_string(issue.category)));
    if (auto loc = locationText(issue); !loc.empty()) {
        lines.push_back(gmcp::format("- Location: `{}`", loc));
    }
    if (!config::trimmed(issue.title).empty()) {
        lines.push_back("- Title: " + issue.title);
    }
    if (!config::trimmed(issue.message).empty()) {
        lines.push_back("- Message: " + issue.message);
    }
    if (issue.evidence && !config::trimmed(*issue.evidence).empty()) {
        lines.push_back(gmcp::format("- Evidence: `{}`", config::trimmed(*issue.evidence)));
    }
    if (issue.suggestedFix && !config::trimmed(*issue.suggestedFix).empty()) {
        lines.push_back("- How to fix: " + config::trimmed(*issue.suggestedFix));
    }
    if (!issue.relatedActions.empty()) {
        std::set<std::string> unique(issue.relatedActions.begin(), issue.relatedActions.end());
        std::string joined;
        for (const auto& action : unique) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += gmcp::format("`{}`", action);
        }
        lines.push_back("- Related MCP actions: " + joined);
    }
    lines.emplace_back();
}

} // namespace

// ============================================================================
// Enumerations
// ============================================================================

std::string_view to_string(IssueSeverity severity) noexcept {
    switch (severity) {
        case IssueSeverity::Error:
            return "error";
        case IssueSeverity::Warning:
            return "warning";
        case IssueSeverity::Info:
            return "info";
    }
    return "info";
}

std::string_view to_string(IssueCategory category) noexcept {
    switch (category) {
        case IssueCategory::Environment:
            return "environment";
        case IssueCategory::Project:
            return "project";
        case IssueCategory::Assets:
            return "assets";
        case IssueCategory::Scripts:
            return "scripts";
        case IssueCategory::Scenes:
            return "scenes";
        case IssueCategory::Uid:
            return "uid";
        case IssueCategory::Export:
            return "export";
        case IssueCategory::Other:
            return "other";
    }
    return "other";
}

IssueSeverity parseIssueSeverity(std::string_view value) {
    auto normalized = config::to_lower(config::trimmed(value));
    if (normalized == "error") {
        return IssueSeverity::Error;
    }
    if (normalized == "warning") {
        return IssueSeverity::Warning;
    }
    return IssueSeverity::Info;
}

IssueCategory parseIssueCategory(std::string_view value) {
    auto normalized = config::to_lower(config::trimmed(value));
    for (auto category : kCategoryOrder) {
        if (category != IssueCategory::Other && normalized == to_string(category)) {
            return category;
        }
    }
    return IssueCategory::Other;
}

int severityRank(IssueSeverity severity) noexcept {
    return static_cast<int>(severity);
}

int categoryRank(IssueCategory category) noexcept {
    return category == IssueCategory::Other ? 99 : static_cast<int>(category);
}

// ============================================================================
// JSON views
// ============================================================================

json DoctorIssue::toJson() const {
    json j = {{"issueId", issueId},
              {"severity", std::string(to_string(severity))},
              {"category", std::string(to_string(category))},
              {"title", title},
              {"message", message}};
    if (location) {
        json loc = json::object();
        if (location->file)
            loc["file"] = *location->file;
        if (location->line)
            loc["line"] = *location->line;
        if (location->nodePath)
            loc["nodePath"] = *location->nodePath;
        if (location->uid)
            loc["uid"] = *location->uid;
        j["location"] = std::move(loc);
    }
    if (evidence) {
        j["evidence"] = *evidence;
    }
    if (suggestedFix) {
        j["suggestedFix"] = *suggestedFix;
    }
    if (!relatedActions.empty()) {
        j["relatedActions"] = relatedActions;
    }
    return j;
}

ScanOptions ScanOptions::fromJson(const json& raw) {
    ScanOptions options;
    if (!raw.is_object()) {
        return options;
    }
    auto flag = [&raw](const char* key, bool& target) {
        if (auto it = raw.find(key); it != raw.end() && it->is_boolean()) {
            target = it->get<bool>();
        }
    };
    auto limit = [&raw](const char* key, std::int64_t& target) {
        if (auto it = raw.find(key); it != raw.end() && it->is_number()) {
            double value = it->get<double>();
            if (std::isfinite(value)) {
                target = std::max<std::int64_t>(
                    1, static_cast<std::int64_t>(std::clamp(std::floor(value), -9.0e18, 9.0e18)));
            }
        }
    };
    flag("includeAssets", options.includeAssets);
    flag("includeScripts", options.includeScripts);
    flag("includeScenes", options.includeScenes);
    flag("includeUID", options.includeUID);
    flag("includeExport", options.includeExport);
    flag("deepSceneInstantiate", options.deepSceneInstantiate);
    limit("maxIssuesPerCategory", options.maxIssuesPerCategory);
    limit("timeBudgetMs", options.timeBudgetMs);
    return options;
}

json ScanOptions::toJson() const {
    return {{"includeAssets", includeAssets},
            {"includeScripts", includeScripts},
            {"includeScenes", includeScenes},
            {"includeUID", includeUID},
            {"includeExport", includeExport},
            {"maxIssuesPerCategory", maxIssuesPerCategory},
            {"timeBudgetMs", timeBudgetMs},
            {"deepSceneInstantiate", deepSceneInstantiate}};
}

json IssueSummary::toJson() const {
    return {{"issueCountTotal", total},
            {"issueCountBySeverity", bySeverity},
            {"issueCountByCategory", byCategory},
            {"scanDurationMs", scanDurationMs ? json(*scanDurationMs) : json(nullptr)}};
}

bool DoctorReport::hasErrors() const noexcept {
    auto it = summary.bySeverity.find("error");
    return it != summary.bySeverity.end() && it->second > 0;
}

json DoctorReport::toJson() const {
    json list = json::array();
    for (const auto& issue : issues) {
        list.push_back(issue.toJson());
    }
    return {{"generatedAt", generatedAt},
            {"projectPath", projectPath},
            {"godotVersion", godotVersion ? json(*godotVersion) : json(nullptr)},
            {"options", options.toJson()},
            {"summary", summary.toJson()},
            {"issues", std::move(list)}};
}

// ============================================================================
// Pipeline
// ============================================================================

DoctorIssue normalizeIssue(const json& raw) {
    DoctorIssue issue;
    if (!raw.is_object()) {
        return issue;
    }
    issue.issueId = nonEmptyTrimmed(raw, "issueId").value_or("UNKNOWN");
    if (auto it = raw.find("severity"); it != raw.end() && it->is_string()) {
        issue.severity = parseIssueSeverity(it->get_ref<const std::string&>());
    }
    if (auto it = raw.find("category"); it != raw.end() && it->is_string()) {
        issue.category = parseIssueCategory(it->get_ref<const std::string&>());
    }
    issue.title = nonEmptyTrimmed(raw, "title").value_or("Untitled issue");
    issue.message = nonEmptyTrimmed(raw, "message").value_or("");
    if (auto it = raw.find("location"); it != raw.end()) {
        issue.location = normalizeLocation(*it);
    }
    issue.evidence = nonEmptyTrimmed(raw, "evidence");
    issue.suggestedFix = nonEmptyTrimmed(raw, "suggestedFix");
    issue.relatedActions = normalizeActions(raw);
    return issue;
}

std::vector<DoctorIssue> normalizeIssues(const json& raw) {
    std::vector<DoctorIssue> issues;
    if (!raw.is_array()) {
        return issues;
    }
    issues.reserve(raw.size());
    for (const auto& item : raw) {
        if (!item.is_object()) {
            continue;
        }
        issues.push_back(normalizeIssue(item));
    }
    return issues;
}

bool issueLess(const DoctorIssue& a, const DoctorIssue& b) {
    auto fileOf = [](const DoctorIssue& i) -> std::string_view {
        return i.location && i.location->file ? std::string_view(*i.location->file)
                                              : std::string_view{};
    };
    auto lineOf = [](const DoctorIssue& i) -> std::int64_t {
        return i.location && i.location->line ? *i.location->line : 0;
    };
    return std::forward_as_tuple(severityRank(a.severity), categoryRank(a.category), fileOf(a),
                                 lineOf(a), a.issueId, a.title, a.message) <
           std::forward_as_tuple(severityRank(b.severity), categoryRank(b.category), fileOf(b),
                                 lineOf(b), b.issueId, b.title, b.message);
}

std::vector<DoctorIssue> dedupeAndSortIssues(std::vector<DoctorIssue> issues) {
    std::set<DedupeKey> seen;
    std::vector<DoctorIssue> unique;
    unique.reserve(issues.size());
    for (auto& issue : issues) {
        if (!seen.insert(dedupeKey(issue)).second) {
            continue;
        }
        unique.push_back(std::move(issue));
    }
    std::stable_sort(unique.begin(), unique.end(), issueLess);
    return unique;
}

IssueSummary summarizeIssues(const std::vector<DoctorIssue>& issues, const json& meta) {
    IssueSummary summary;
    summary.total = issues.size();
    for (const auto& issue : issues) {
        ++summary.bySeverity[std::string(to_string(issue.severity))];
        ++summary.byCategory[std::string(to_string(issue.category))];
    }
    if (meta.is_object()) {
        if (auto duration = coerceNumber(meta, "scanDurationMs");
            duration && std::abs(*duration) < 9.0e18) {
            summary.scanDurationMs = static_cast<std::int64_t>(std::floor(*duration));
        }
    }
    return summary;
}

DoctorReport buildDoctorReport(const ReportInput& input) {
    DoctorReport report;
    report.generatedAt = input.generatedAt;
    report.projectPath = input.projectPath;
    report.godotVersion = input.godotVersion;

    const json empty = json::object();
    const json& scan = input.scan.is_object() ? input.scan : empty;
    auto field = [&scan](const char* key) -> const json& {
        static const json null_value;
        auto it = scan.find(key);
        return it == scan.end() ? null_value : *it;
    };

    report.options = ScanOptions::fromJson(field("options"));
    report.issues = dedupeAndSortIssues(normalizeIssues(field("issues")));
    report.summary = summarizeIssues(report.issues, field("meta"));
    spdlog::debug("doctor report: {} issue(s) after dedupe ({} error)", report.summary.total,
                  report.summary.bySeverity["error"]);
    return report;
}

std::string renderDoctorReportMarkdown(const DoctorReport& report) {
    std::vector<std::string> lines;

    lines.emplace_back("# Doctor Report");
    lines.emplace_back();
    lines.push_back(gmcp::format("- Generated: `{}`", report.generatedAt));
    lines.push_back(gmcp::format("- Project: `{}`", report.projectPath));
    lines.push_back(gmcp::format("- Godot: `{}`", report.godotVersion.value_or("unknown")));
    lines.emplace_back();

    const auto& opt = report.options;
    lines.emplace_back("## Scan Options");
    lines.emplace_back();
    lines.push_back(gmcp::format("- includeAssets: `{}`", boolText(opt.includeAssets)));
    lines.push_back(gmcp::format("- includeScripts: `{}`", boolText(opt.includeScripts)));
    lines.push_back(gmcp::format("- includeScenes: `{}`", boolText(opt.includeScenes)));
    lines.push_back(gmcp::format("- includeUID: `{}`", boolText(opt.includeUID)));
    lines.push_back(gmcp::format("- includeExport: `{}`", boolText(opt.includeExport)));
    lines.push_back(
        gmcp::format("- deepSceneInstantiate: `{}`", boolText(opt.deepSceneInstantiate)));
    lines.push_back(gmcp::format("- maxIssuesPerCategory: `{}`", opt.maxIssuesPerCategory));
    lines.push_back(gmcp::format("- timeBudgetMs: `{}`", opt.timeBudgetMs));
    lines.emplace_back();

    const auto& summary = report.summary;
    auto severityCount = [&summary](const char* key) -> std::size_t {
        auto it = summary.bySeverity.find(key);
        return it == summary.bySeverity.end() ? 0 : it->second;
    };
    lines.emplace_back("## Executive Summary");
    lines.emplace_back();
    lines.push_back(gmcp::format(
        "- Total issues: `{}` (errors `{}`, warnings `{}`, info `{}`)", summary.total,
        severityCount("error"), severityCount("warning"), severityCount("info")));
    lines.push_back(gmcp::format("- Scan duration: `{}` ms",
                                 summary.scanDurationMs ? std::to_string(*summary.scanDurationMs)
                                                        : std::string("unknown")));
    lines.emplace_back();

    std::vector<const DoctorIssue*> topErrors;
    for (const auto& issue : report.issues) {
        if (issue.severity == IssueSeverity::Error && topErrors.size() < 10) {
            topErrors.push_back(&issue);
        }
    }
    if (!topErrors.empty()) {
        lines.emplace_back("### Top Errors");
        lines.emplace_back();
        lines.emplace_back("| # | Issue | Location | Message |");
        lines.emplace_back("| -: | --- | --- | --- |");
        for (size_t i = 0; i < topErrors.size(); ++i) {
            const auto& issue = *topErrors[i];
            lines.push_back(gmcp::format("| {} | `{}` | `{}` | {} |", i + 1,
                                         escapeTableCell(issue.issueId),
                                         escapeTableCell(locationText(issue)),
                                         escapeTableCell(issue.message)));
        }
        lines.emplace_back();
    }

    lines.emplace_back("## Issues By Category");
    lines.emplace_back();

    for (auto category : kCategoryOrder) {
        std::vector<const DoctorIssue*> bucket;
        for (const auto& issue : report.issues) {
            if (issue.category == category) {
                bucket.push_back(&issue);
            }
        }
        if (bucket.empty()) {
            continue;
        }

        lines.push_back(gmcp::format("### {}", categoryTitle(category)));
        lines.emplace_back();
        lines.emplace_back("| Severity | IssueId | Title | Location |");
        lines.emplace_back("| --- | --- | --- | --- |");
        for (const auto* issue : bucket) {
            lines.push_back(gmcp::format("| `{}` | `{}` | {} | `{}` |",
                                         severityBadge(issue->severity),
                                         escapeTableCell(issue->issueId),
                                         escapeTableCell(issue->title),
                                         escapeTableCell(locationText(*issue))));
        }
        lines.emplace_back();

        lines.push_back(gmcp::format("#### {} Details", categoryTitle(category)));
        lines.emplace_back();
        for (size_t i = 0; i < bucket.size(); ++i) {
            renderIssueDetails(lines, *bucket[i], i);
        }
    }

    lines.emplace_back("---");
    lines.emplace_back("Generated by godot-mcp-omni doctor_report.");

    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    config::rtrim(text);
    text += '\n';
    return text;
}

// ============================================================================
// Output
// ============================================================================

Result<fs::path> validateReportRelativePath(const fs::path& projectRoot,
                                            std::string_view relativePath) {
    auto rel = config::trimmed(relativePath);
    auto reject = [&rel](std::string_view why) -> Error {
        return Error{ErrorCode::InvalidArgument,
                     gmcp::format("invalid report path '{}': {}", rel, why)};
    };

    if (rel.empty()) {
        return reject("path is empty");
    }
    if (rel.starts_with("res://") || rel.starts_with("user://")) {
        return reject("must be a project-relative filesystem path, not a resource URI");
    }
    bool driveLetter = rel.size() >= 2 && std::isalpha(static_cast<unsigned char>(rel[0])) &&
                       rel[1] == ':';
    if (rel.front() == '/' || rel.front() == '\\' || driveLetter || fs::path(rel).is_absolute()) {
        return reject("absolute paths are not allowed");
    }
    if (rel.back() == '/' || rel.back() == '\\') {
        return reject("path names a directory");
    }

    std::string portable = rel;
    std::replace(portable.begin(), portable.end(), '\\', '/');
    auto normalized = fs::path(portable).lexically_normal();
    if (normalized.empty() || normalized == ".") {
        return reject("path names the project root");
    }
    auto first = *normalized.begin();
    if (first == "..") {
        return reject("path escapes the project root");
    }
    return projectRoot / normalized;
}

Result<fs::path> writeDoctorReport(const DoctorReport& report, const fs::path& projectRoot,
                                   std::string_view relativePath) {
    auto target = validateReportRelativePath(projectRoot, relativePath);
    if (!target) {
        return target.error();
    }
    const auto& path = target.value();

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     gmcp::format("cannot create {}: {}", path.parent_path().string(),
                                  ec.message())};
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, gmcp::format("cannot open {}", path.string())};
    }
    out << renderDoctorReportMarkdown(report);
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, gmcp::format("failed writing {}", path.string())};
    }
    spdlog::info("doctor report written to {}", path.string());
    return path;
}

std::string currentIsoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return gmcp::format("{}.{:03d}Z", buf, static_cast<int>(ms.count()));
}

} // namespace gmcp::doctor
