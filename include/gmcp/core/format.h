#pragma once

// Uses std::format when the toolchain ships it, otherwise the fmt bundled with spdlog.

#if GMCP_HAS_STD_FORMAT
#include <format>
namespace gmcp {
using std::format;
using std::format_to;
using std::vformat;
} // namespace gmcp
#else
#include <spdlog/fmt/fmt.h>

namespace gmcp {
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace gmcp
#endif
