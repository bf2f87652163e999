#pragma once

#include "mcpx/session/write_behind_writer.hpp"
#include "mcpx/stream/event_tracker.hpp"
#include "mcpx/stream/reconnection_manager.hpp"
#include "mcpx/stream/sse_parser.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// ProxyConfig
// ─────────────────────────────────────────────────────────────────────────────
// Everything tunable about the engine. Defaults suit a single proxy process
// in front of one upstream.
//
//   ProxyConfig config;
//   config.with_max_reply_bytes(1 << 20)
//         .with_session_idle_timeout(std::chrono::minutes{10})
//         .with_recency_window(4096);

struct ProxyConfig {
    /// Largest single reply buffered in memory. Larger replies are refused.
    std::size_t max_reply_bytes{4 * 1024 * 1024};

    /// Events queued towards a slow client before the upstream read pauses.
    std::size_t client_channel_capacity{64};

    /// Chunks queued for a pass-through body.
    std::size_t passthrough_channel_capacity{16};

    std::chrono::milliseconds interceptor_timeout{std::chrono::seconds(2)};

    std::chrono::milliseconds session_idle_timeout{std::chrono::minutes(30)};
    std::chrono::milliseconds session_sweep_interval{std::chrono::minutes(1)};

    /// How long shutdown() lets open streams finish before stopping them.
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds(5)};

    /// Event ids remembered per session for duplicate suppression. Deployment
    /// specific: it must cover the largest replay an upstream performs.
    std::size_t recency_window{EventTracker::kDefaultCapacity};

    /// Stream events with this type label end the stream normally.
    std::string termination_event_type{"end"};

    /// Used when the client does not send MCP-Protocol-Version.
    std::string default_protocol_version{"2025-03-26"};

    SseParserConfig parser{};
    ReconnectPolicy reconnect{};
    WriteBehindConfig write_behind{};

    ProxyConfig& with_max_reply_bytes(std::size_t bytes) {
        max_reply_bytes = bytes;
        return *this;
    }

    ProxyConfig& with_client_channel_capacity(std::size_t capacity) {
        client_channel_capacity = capacity;
        return *this;
    }

    ProxyConfig& with_interceptor_timeout(std::chrono::milliseconds timeout) {
        interceptor_timeout = timeout;
        return *this;
    }

    ProxyConfig& with_session_idle_timeout(std::chrono::milliseconds timeout) {
        session_idle_timeout = timeout;
        return *this;
    }

    ProxyConfig& with_session_sweep_interval(std::chrono::milliseconds interval) {
        session_sweep_interval = interval;
        return *this;
    }

    ProxyConfig& with_shutdown_grace(std::chrono::milliseconds grace) {
        shutdown_grace = grace;
        return *this;
    }

    ProxyConfig& with_recency_window(std::size_t capacity) {
        recency_window = capacity;
        return *this;
    }

    ProxyConfig& with_termination_event_type(std::string type) {
        termination_event_type = std::move(type);
        return *this;
    }

    ProxyConfig& with_reconnect_policy(ReconnectPolicy policy) {
        reconnect = std::move(policy);
        return *this;
    }
};

}  // namespace mcpx
