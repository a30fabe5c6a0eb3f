#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace gmcp::bridge {

// Stable classification for editor bridge (TCP) failures.
//
// Carried as a prefix of Error.message so it survives the Result/Error plumbing unchanged.
enum class BridgeFailureKind {
    Refused,
    ConnectTimeout,
    HelloTimeout,
    AuthRejected,
    RequestTimeout,
    ResetOrBrokenPipe,
    Eof,
    ProjectMismatch,
    Other
};

inline constexpr std::string_view kBridgeFailurePrefix = "[bridge:";

inline constexpr std::string_view to_string(BridgeFailureKind k) {
    switch (k) {
        case BridgeFailureKind::Refused:
            return "refused";
        case BridgeFailureKind::ConnectTimeout:
            return "connect_timeout";
        case BridgeFailureKind::HelloTimeout:
            return "hello_timeout";
        case BridgeFailureKind::AuthRejected:
            return "auth_rejected";
        case BridgeFailureKind::RequestTimeout:
            return "request_timeout";
        case BridgeFailureKind::ResetOrBrokenPipe:
            return "reset_or_broken_pipe";
        case BridgeFailureKind::Eof:
            return "eof";
        case BridgeFailureKind::ProjectMismatch:
            return "project_mismatch";
        case BridgeFailureKind::Other:
            return "other";
    }
    return "other";
}

inline std::string formatBridgeFailure(BridgeFailureKind kind, std::string_view detail) {
    std::string out;
    out.reserve(kBridgeFailurePrefix.size() + 24 + 2 + detail.size());
    out.append(kBridgeFailurePrefix);
    out.append(to_string(kind));
    out.push_back(']');
    out.push_back(' ');
    out.append(detail);
    return out;
}

inline std::optional<BridgeFailureKind> parseBridgeFailureKind(std::string_view message) {
    if (!message.starts_with(kBridgeFailurePrefix)) {
        return std::nullopt;
    }
    auto close = message.find(']');
    if (close == std::string_view::npos || close <= kBridgeFailurePrefix.size()) {
        return std::nullopt;
    }
    // message looks like: [bridge:<kind>] ...
    auto kind = message.substr(kBridgeFailurePrefix.size(), close - kBridgeFailurePrefix.size());
    for (auto k : {BridgeFailureKind::Refused, BridgeFailureKind::ConnectTimeout,
                   BridgeFailureKind::HelloTimeout, BridgeFailureKind::AuthRejected,
                   BridgeFailureKind::RequestTimeout, BridgeFailureKind::ResetOrBrokenPipe,
                   BridgeFailureKind::Eof, BridgeFailureKind::ProjectMismatch,
                   BridgeFailureKind::Other}) {
        if (kind == to_string(k)) {
            return k;
        }
    }
    return std::nullopt;
}

/// Strips the classification prefix for display.
inline std::string_view stripBridgeFailurePrefix(std::string_view message) {
    if (!parseBridgeFailureKind(message)) {
        return message;
    }
    auto close = message.find(']');
    auto rest = message.substr(close + 1);
    if (!rest.empty() && rest.front() == ' ') {
        rest.remove_prefix(1);
    }
    return rest;
}

/// Nothing is accepting connections at the endpoint: the only shapes that mark a lock stale.
/// A bridge that answers but rejects us (token, project, protocol) is alive.
inline bool isStaleLockSignal(BridgeFailureKind kind) {
    switch (kind) {
        case BridgeFailureKind::Refused:
        case BridgeFailureKind::ConnectTimeout:
            return true;
        case BridgeFailureKind::HelloTimeout:
        case BridgeFailureKind::AuthRejected:
        case BridgeFailureKind::RequestTimeout:
        case BridgeFailureKind::ResetOrBrokenPipe:
        case BridgeFailureKind::Eof:
        case BridgeFailureKind::ProjectMismatch:
        case BridgeFailureKind::Other:
            return false;
    }
    return false;
}

} // namespace gmcp::bridge
