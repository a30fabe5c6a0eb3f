#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gmcp::platform {

/// `C:\Users\me\game` → `/mnt/c/Users/me/game`; nullopt when not a drive path.
std::optional<std::string> windowsDriveToWslPath(std::string_view p);

/// `/mnt/c/Users/me/game` → `C:\Users\me\game`; nullopt when not under /mnt/<drive>/.
std::optional<std::string> wslPathToWindowsDrive(std::string_view p);

bool isWindowsExePath(std::string_view p);

/// True when running on Linux with WSL_DISTRO_NAME or WSL_INTEROP set.
bool isWslEnvironment();

/// A POSIX process launching a Windows `.exe` must hand it Windows-style paths.
bool shouldTranslatePathsForWindowsExe(std::string_view exe);

/// Rewrites the values following `--path` and `--script` for a Windows executable.
/// `res://` and `user://` values are left untouched.
std::vector<std::string> translateArgsForWindowsExe(const std::vector<std::string>& args);

/// Canonical form used to compare project roots reported by different environments.
/// Windows drive paths are mapped to their /mnt/<drive> mount, separators are unified,
/// the path is lexically normalized and case-folded when it lives on a case-insensitive
/// filesystem.
std::string normalizeProjectPathForCompare(std::string_view p);

/// Extracts the default-route gateway from the text of /proc/net/route.
std::optional<std::string> parseDefaultGatewayFromRouteTable(std::string_view routeTable);

/// Reads /proc/net/route when inside WSL; nullopt elsewhere or on failure.
std::optional<std::string> readWslGatewayIp();

} // namespace gmcp::platform
