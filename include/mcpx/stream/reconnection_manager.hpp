#pragma once

#include "mcpx/transport/backoff_policy.hpp"
#include "mcpx/upstream/response_classifier.hpp"
#include "mcpx/upstream/upstream_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// Stream State
// ─────────────────────────────────────────────────────────────────────────────
//
//        ┌───────────┐  stream_lost()   ┌──────────────┐
//   ───▶ │ Streaming │ ───────────────▶ │ Reconnecting │
//        └─────┬─────┘ ◀─────────────── └──────┬───────┘
//              │       resumed stream          │ attempts exhausted,
//              │ close()                       │ not resumable, close()
//              ▼                               ▼
//        ┌──────────────────────────────────────────┐
//        │                  Closed                  │
//        └──────────────────────────────────────────┘

enum class StreamState {
    Streaming,
    Reconnecting,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(StreamState state) noexcept {
    switch (state) {
        case StreamState::Streaming:    return "Streaming";
        case StreamState::Reconnecting: return "Reconnecting";
        case StreamState::Closed:       return "Closed";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectPolicy
// ─────────────────────────────────────────────────────────────────────────────
// When and how often a lost upstream stream is resumed.
//
//   ReconnectPolicy policy;
//   policy.with_max_attempts(8)
//         .with_base_delay(std::chrono::milliseconds{100})
//         .with_idle_timeout(std::chrono::seconds{15});

class ReconnectPolicy {
public:
    ReconnectPolicy()
        : retryable_http_statuses_{408, 425, 429, 500, 502, 503, 504}
    {}

    ReconnectPolicy& with_max_attempts(std::size_t attempts) {
        max_attempts_ = attempts;
        return *this;
    }

    ReconnectPolicy& with_base_delay(std::chrono::milliseconds delay) {
        base_delay_ = delay;
        return *this;
    }

    ReconnectPolicy& with_max_delay(std::chrono::milliseconds delay) {
        max_delay_ = delay;
        return *this;
    }

    ReconnectPolicy& with_multiplier(double multiplier) {
        multiplier_ = multiplier;
        return *this;
    }

    /// 0.0 disables jitter, 0.25 spreads delays by +/-25%.
    ReconnectPolicy& with_jitter(double jitter_factor) {
        jitter_ = jitter_factor;
        return *this;
    }

    /// A stream with no bytes at all (keep-alive comments count) for this
    /// long is treated as lost.
    ReconnectPolicy& with_idle_timeout(std::chrono::milliseconds timeout) {
        idle_timeout_ = timeout;
        return *this;
    }

    /// How long one resume attempt may wait for the upstream to answer
    /// before it counts as failed.
    ReconnectPolicy& with_attempt_timeout(std::chrono::milliseconds timeout) {
        attempt_timeout_ = timeout;
        return *this;
    }

    ReconnectPolicy& with_retryable_status(int status_code) {
        retryable_http_statuses_.insert(status_code);
        return *this;
    }

    ReconnectPolicy& without_retryable_status(int status_code) {
        retryable_http_statuses_.erase(status_code);
        return *this;
    }

    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }
    [[nodiscard]] std::chrono::milliseconds max_delay() const noexcept { return max_delay_; }
    [[nodiscard]] double multiplier() const noexcept { return multiplier_; }
    [[nodiscard]] double jitter() const noexcept { return jitter_; }
    [[nodiscard]] std::chrono::milliseconds idle_timeout() const noexcept { return idle_timeout_; }
    [[nodiscard]] std::chrono::milliseconds attempt_timeout() const noexcept { return attempt_timeout_; }

    /// Whether a non-stream reply with this status is worth another attempt.
    [[nodiscard]] bool should_retry_status(int status_code) const {
        return retryable_http_statuses_.contains(status_code);
    }

    [[nodiscard]] std::unique_ptr<IBackoffPolicy> make_backoff() const {
        return std::make_unique<ExponentialBackoff>(base_delay_, multiplier_, max_delay_, jitter_);
    }

private:
    std::size_t max_attempts_{5};
    std::chrono::milliseconds base_delay_{250};
    std::chrono::milliseconds max_delay_{10'000};
    double multiplier_{2.0};
    double jitter_{0.25};
    std::chrono::milliseconds idle_timeout_{30'000};
    std::chrono::milliseconds attempt_timeout_{10'000};
    std::set<int> retryable_http_statuses_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectError
// ─────────────────────────────────────────────────────────────────────────────

struct ReconnectError {
    enum class Code {
        Exhausted,     ///< attempt ceiling reached
        NotResumable,  ///< upstream answered in a way retrying cannot fix
        Cancelled      ///< close() was called
    };

    Code code{Code::Exhausted};
    std::string message;
    std::size_t attempts{0};
};

using ReconnectResult = tl::expected<EventStreamResponse, ReconnectError>;

// ─────────────────────────────────────────────────────────────────────────────
// ReconnectionManager
// ─────────────────────────────────────────────────────────────────────────────
// Resumes one upstream event stream. A resume is a GET to the same upstream
// carrying Accept: text/event-stream, the upstream session id and
// Last-Event-ID; the original request is never re-sent.
//
// The attempt counter spans consecutive failures and is reset by
// note_progress() once the resumed stream delivers an event, so a flapping
// upstream that never gets an event through still hits the ceiling.
//
// State callbacks are invoked outside the internal lock.

class ReconnectionManager {
public:
    using StateChangeCallback = std::function<void(StreamState old_state, StreamState new_state)>;

    ReconnectionManager(
        std::shared_ptr<IUpstreamDispatcher> dispatcher,
        HeaderMap resume_headers,
        ReconnectPolicy policy = {},
        std::unique_ptr<IBackoffPolicy> backoff = nullptr
    );

    ReconnectionManager(const ReconnectionManager&) = delete;
    ReconnectionManager& operator=(const ReconnectionManager&) = delete;

    [[nodiscard]] StreamState state() const noexcept;
    [[nodiscard]] std::size_t attempts() const noexcept;
    [[nodiscard]] const ReconnectPolicy& policy() const noexcept { return policy_; }
    [[nodiscard]] std::chrono::milliseconds idle_timeout() const noexcept { return policy_.idle_timeout(); }

    void on_state_change(StateChangeCallback callback);

    /// Streaming -> Reconnecting, then attempts until a stream is back
    /// (-> Streaming) or the manager gives up (-> Closed).
    asio::awaitable<ReconnectResult> resume(std::optional<std::string> last_event_id);

    /// The resumed stream delivered an event; failures start counting from zero.
    void note_progress();

    /// Forward an SSE `retry:` value to the backoff policy.
    void note_retry_hint(std::chrono::milliseconds hint);

    /// -> Closed. An in-flight resume() stops at its next step.
    void close();

private:
    /// Returns false if the transition is not allowed from the current state.
    bool transition(StreamState to);

    std::shared_ptr<IUpstreamDispatcher> dispatcher_;
    HeaderMap resume_headers_;
    ReconnectPolicy policy_;
    std::unique_ptr<IBackoffPolicy> backoff_;

    mutable std::mutex mutex_;
    StreamState state_{StreamState::Streaming};
    std::size_t attempts_{0};
    std::vector<StateChangeCallback> callbacks_;
};

}  // namespace mcpx
