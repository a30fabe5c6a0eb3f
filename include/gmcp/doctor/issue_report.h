#pragma once

#include <gmcp/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gmcp::doctor {

using json = nlohmann::json;

enum class IssueSeverity { Error, Warning, Info };

enum class IssueCategory { Environment, Project, Assets, Scripts, Scenes, Uid, Export, Other };

std::string_view to_string(IssueSeverity severity) noexcept;
std::string_view to_string(IssueCategory category) noexcept;

/// Unknown or malformed values map to Info / Other.
IssueSeverity parseIssueSeverity(std::string_view value);
IssueCategory parseIssueCategory(std::string_view value);

/// Position in the fixed ordering used for sorting and rendering.
int severityRank(IssueSeverity severity) noexcept;
int categoryRank(IssueCategory category) noexcept;

struct IssueLocation {
    std::optional<std::string> file;
    std::optional<std::int64_t> line; ///< always >= 1 when present
    std::optional<std::string> nodePath;
    std::optional<std::string> uid;

    bool empty() const noexcept { return !file && !line && !nodePath && !uid; }
    bool operator==(const IssueLocation&) const = default;
};

struct DoctorIssue {
    std::string issueId{"UNKNOWN"};
    IssueSeverity severity{IssueSeverity::Info};
    IssueCategory category{IssueCategory::Other};
    std::string title{"Untitled issue"};
    std::string message;
    std::optional<IssueLocation> location;
    std::optional<std::string> evidence;
    std::optional<std::string> suggestedFix;
    std::vector<std::string> relatedActions;

    bool operator==(const DoctorIssue&) const = default;

    json toJson() const;
};

struct ScanOptions {
    bool includeAssets{true};
    bool includeScripts{true};
    bool includeScenes{true};
    bool includeUID{true};
    bool includeExport{false};
    std::int64_t maxIssuesPerCategory{200};
    std::int64_t timeBudgetMs{180000};
    bool deepSceneInstantiate{false};

    /// Missing or mistyped fields keep their defaults; numeric limits are floored and clamped to >= 1.
    static ScanOptions fromJson(const json& raw);
    json toJson() const;
};

struct IssueSummary {
    std::size_t total{0};
    /// Always holds error, warning and info.
    std::map<std::string, std::size_t> bySeverity{{"error", 0}, {"warning", 0}, {"info", 0}};
    /// Only categories that occur.
    std::map<std::string, std::size_t> byCategory;
    std::optional<std::int64_t> scanDurationMs;

    json toJson() const;
};

struct DoctorReport {
    std::string generatedAt;
    std::string projectPath;
    std::optional<std::string> godotVersion;
    ScanOptions options;
    std::vector<DoctorIssue> issues;
    IssueSummary summary;

    bool hasErrors() const noexcept;
    json toJson() const;
};

// ============================================================================
// Pipeline: normalize -> dedupe/sort -> summarize -> render
// ============================================================================

/// Coerces one loosely-typed scan record. Never throws; non-object input yields defaults.
DoctorIssue normalizeIssue(const json& raw);

/// Normalizes every object element of @p raw; non-array input and non-object elements are skipped.
std::vector<DoctorIssue> normalizeIssues(const json& raw);

/// Total order: severity, category, file, line, issueId, title, message.
bool issueLess(const DoctorIssue& a, const DoctorIssue& b);

/// Drops later duplicates of (issueId, severity, category, file, line, nodePath, uid, title,
/// message) and sorts the survivors stably with issueLess.
std::vector<DoctorIssue> dedupeAndSortIssues(std::vector<DoctorIssue> issues);

/// @p meta is the scan's opaque metadata; `scanDurationMs` is used when numeric.
IssueSummary summarizeIssues(const std::vector<DoctorIssue>& issues, const json& meta);

struct ReportInput {
    std::string projectPath;
    std::optional<std::string> godotVersion;
    std::string generatedAt;
    /// Raw scan result `{meta?, options?, issues[]}`
    json scan;
};

DoctorReport buildDoctorReport(const ReportInput& input);

/// Deterministic Markdown rendering; byte-identical for equal reports.
std::string renderDoctorReportMarkdown(const DoctorReport& report);

/// Resolves a project-relative output path. Rejects empty, res://, user://, absolute,
/// escaping and directory-like paths with InvalidArgument.
Result<std::filesystem::path> validateReportRelativePath(const std::filesystem::path& projectRoot,
                                                         std::string_view relativePath);

/// Renders and writes the report, creating parent directories.
Result<std::filesystem::path> writeDoctorReport(const DoctorReport& report,
                                                const std::filesystem::path& projectRoot,
                                                std::string_view relativePath);

/// UTC timestamp in ISO-8601 form with millisecond precision.
std::string currentIsoTimestamp();

} // namespace gmcp::doctor
