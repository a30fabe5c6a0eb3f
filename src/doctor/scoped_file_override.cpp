#include <gmcp/core/format.h>
#include <gmcp/doctor/scoped_file_override.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace gmcp::doctor {

namespace fs = std::filesystem;

Result<std::string> readWholeFile(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        if (!ec || ec == std::errc::no_such_file_or_directory ||
            ec == std::errc::not_a_directory) {
            return Error{ErrorCode::FileNotFound, gmcp::format("{} does not exist", path.string())};
        }
        if (ec == std::errc::permission_denied) {
            return Error{ErrorCode::PermissionDenied,
                         gmcp::format("cannot stat {}: {}", path.string(), ec.message())};
        }
        return Error{ErrorCode::IOError,
                     gmcp::format("cannot stat {}: {}", path.string(), ec.message())};
    }
    if (fs::is_directory(status)) {
        return Error{ErrorCode::IOError, gmcp::format("{} is a directory", path.string())};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            return Error{ErrorCode::PermissionDenied,
                         gmcp::format("cannot read {}: {}", path.string(), std::strerror(err))};
        }
        return Error{ErrorCode::IOError, gmcp::format("cannot read {}", path.string())};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IOError, gmcp::format("read error on {}", path.string())};
    }
    return buffer.str();
}

Result<void> writeWholeFile(const fs::path& path, std::string_view content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ec == std::errc::permission_denied ? ErrorCode::PermissionDenied
                                                            : ErrorCode::IOError,
                         gmcp::format("cannot create {}: {}", path.parent_path().string(),
                                      ec.message())};
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, gmcp::format("cannot open {} for writing", path.string())};
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        return Error{ErrorCode::WriteError, gmcp::format("failed writing {}", path.string())};
    }
    return {};
}

ScopedFileOverride::ScopedFileOverride(fs::path path, std::optional<std::string> original)
    : path_(std::move(path)), original_(std::move(original)), active_(true) {}

Result<ScopedFileOverride> ScopedFileOverride::capture(fs::path path) {
    auto snapshot = readWholeFile(path);
    if (snapshot) {
        spdlog::debug("override: captured {} ({} bytes)", path.string(), snapshot.value().size());
        return ScopedFileOverride(std::move(path), std::move(snapshot).value());
    }
    if (snapshot.error().code == ErrorCode::FileNotFound) {
        spdlog::debug("override: {} absent before override", path.string());
        return ScopedFileOverride(std::move(path), std::nullopt);
    }
    return snapshot.error();
}

ScopedFileOverride::~ScopedFileOverride() {
    if (!active_) {
        return;
    }
    if (auto r = restore(); !r) {
        spdlog::warn("override: failed to restore {}: {}", path_.string(), r.error().message);
    }
}

ScopedFileOverride::ScopedFileOverride(ScopedFileOverride&& other) noexcept
    : path_(std::move(other.path_)), original_(std::move(other.original_)),
      active_(other.active_) {
    other.active_ = false;
}

ScopedFileOverride& ScopedFileOverride::operator=(ScopedFileOverride&& other) noexcept {
    if (this != &other) {
        if (auto r = restore(); !r) {
            spdlog::warn("override: failed to restore {}: {}", path_.string(), r.error().message);
        }
        path_ = std::move(other.path_);
        original_ = std::move(other.original_);
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}

Result<void> ScopedFileOverride::write(std::string_view content) {
    if (!active_) {
        return Error{ErrorCode::InvalidState,
                     gmcp::format("override of {} already restored", path_.string())};
    }
    spdlog::info("override: writing {}", path_.string());
    return writeWholeFile(path_, content);
}

Result<void> ScopedFileOverride::restore() {
    if (!active_) {
        return {};
    }
    active_ = false;
    if (original_) {
        spdlog::info("override: restoring {}", path_.string());
        return writeWholeFile(path_, *original_);
    }
    std::error_code ec;
    bool removed = fs::remove(path_, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     gmcp::format("cannot remove {}: {}", path_.string(), ec.message())};
    }
    if (removed) {
        spdlog::info("override: removed {} (absent before override)", path_.string());
    }
    return {};
}

} // namespace gmcp::doctor
