#pragma once

#include <gmcp/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gmcp::doctor {

/**
 * @brief Temporarily replaces the contents of one file.
 *
 * capture() snapshots the file (or records that it is absent). On restore() or destruction the
 * snapshot is written back byte for byte, or the file is deleted when it did not exist before.
 * A file that is present but unreadable fails capture() instead of being treated as absent.
 */
class ScopedFileOverride {
public:
    static Result<ScopedFileOverride> capture(std::filesystem::path path);

    ~ScopedFileOverride();

    ScopedFileOverride(ScopedFileOverride&& other) noexcept;
    ScopedFileOverride& operator=(ScopedFileOverride&& other) noexcept;
    ScopedFileOverride(const ScopedFileOverride&) = delete;
    ScopedFileOverride& operator=(const ScopedFileOverride&) = delete;

    /// Replaces the file contents, creating parent directories as needed.
    Result<void> write(std::string_view content);

    /// Puts the snapshot back. Safe to call more than once; later calls are no-ops.
    Result<void> restore();

    const std::filesystem::path& path() const noexcept { return path_; }
    bool existedBefore() const noexcept { return original_.has_value(); }
    const std::optional<std::string>& original() const noexcept { return original_; }

private:
    ScopedFileOverride(std::filesystem::path path, std::optional<std::string> original);

    std::filesystem::path path_;
    std::optional<std::string> original_;
    bool active_{false};
};

/// Reads a whole file. FileNotFound when absent; PermissionDenied or IOError otherwise.
Result<std::string> readWholeFile(const std::filesystem::path& path);

/// Writes @p content to @p path, creating parent directories.
Result<void> writeWholeFile(const std::filesystem::path& path, std::string_view content);

} // namespace gmcp::doctor
