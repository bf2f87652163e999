#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// Transport kinds
// ─────────────────────────────────────────────────────────────────────────────

enum class TransportKind {
    Stdio,          ///< line-delimited JSON-RPC over a child process or our own stdio
    Http,           ///< request/response HTTP, single JSON replies only
    StreamableHttp  ///< HTTP with event-stream replies and resumption
};

[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Stdio:          return "stdio";
        case TransportKind::Http:           return "http";
        case TransportKind::StreamableHttp: return "streamable-http";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Session
// ─────────────────────────────────────────────────────────────────────────────
// A client conversation as the proxy sees it. Transport kinds and protocol
// version are fixed when the session is created; upstream_session_id is set at
// most once, by the first upstream reply that asserts one. Only the position
// marker and the liveness timestamp change afterwards.

struct Session {
    std::string id;
    TransportKind client_transport{TransportKind::Stdio};
    TransportKind upstream_transport{TransportKind::StreamableHttp};
    std::string protocol_version;
    std::optional<std::string> upstream_session_id;
    std::optional<std::string> last_event_id;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_activity{};
};

enum class HistoryDirection {
    ClientToUpstream,
    UpstreamToClient
};

/// One message recorded against a session.
struct HistoryEntry {
    std::uint64_t sequence{0};                 ///< assigned by the store
    HistoryDirection direction{HistoryDirection::UpstreamToClient};
    std::optional<std::string> event_id;
    std::string payload;
    std::chrono::system_clock::time_point recorded_at{};
};

/// Session ids are 1..256 visible ASCII characters (0x21-0x7E). This holds
/// for ids we mint and is enforced on ids asserted by upstreams and clients
/// before they reach logs or headers.
[[nodiscard]] bool is_valid_session_id(std::string_view session_id) noexcept;

/// 128 random bits as 32 lowercase hex characters.
[[nodiscard]] std::string generate_session_id();

}  // namespace mcpx
