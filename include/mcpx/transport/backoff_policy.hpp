#ifndef MCPX_TRANSPORT_BACKOFF_POLICY_HPP
#define MCPX_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay to wait before reconnection attempt `attempt` (0-indexed).

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;

    /// The upstream sent an SSE `retry:` field. Policies that grow from a
    /// base delay adopt it as their new base; others ignore it.
    virtual void on_server_hint(std::chrono::milliseconds /*hint*/) {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
//   delay = min(base * multiplier^attempt * U(1 - jitter, 1 + jitter), max)
//
// The ceiling is applied after jitter, so `max` is a hard upper bound. A
// server hint replaces `base` (capped at `max`) for the rest of the stream.

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{250},
              2.0,
              std::chrono::milliseconds{10'000},
              0.25
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor
    )
        : base_(base)
        , multiplier_(std::max(1.0, multiplier))
        , max_(max)
        , jitter_factor_(std::clamp(jitter_factor, 0.0, 1.0))
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double base_ms = static_cast<double>(base_.count());
        const double max_ms = static_cast<double>(max_.count());
        // Growth is clamped before jitter so large attempt numbers cannot overflow.
        const double grown_ms = std::min(base_ms * std::pow(multiplier_, static_cast<double>(attempt)), max_ms);
        const double jittered_ms = std::min(add_jitter(grown_ms), max_ms);
        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, jittered_ms))};
    }

    void reset() override {}

    void on_server_hint(std::chrono::milliseconds hint) override {
        base_ = std::clamp(hint, std::chrono::milliseconds{0}, max_);
    }

    [[nodiscard]] std::chrono::milliseconds base_delay() const noexcept { return base_; }

private:
    double add_jitter(double value) {
        if (jitter_factor_ <= 0.0) {
            return value;
        }
        std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
        return value * dist(rng_);
    }

    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - resumes immediately; used where timing is driven elsewhere
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }

    void reset() override {}
};

}  // namespace mcpx

#endif  // MCPX_TRANSPORT_BACKOFF_POLICY_HPP
