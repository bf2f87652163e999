#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// EventTracker
// ─────────────────────────────────────────────────────────────────────────────
// Per-session position bookkeeping for an upstream event stream:
//
//   - last_id(): the most recent id actually delivered to the client, which is
//     the resumption marker sent as Last-Event-ID.
//   - a fixed-capacity recency window of delivered ids. Ids that fall out of
//     the window are forgotten, so a replay older than the window is not
//     detected as a duplicate.
//
// Thread-safe. Streams of one session (a POST reply stream and a GET stream)
// share a tracker; claim() makes the duplicate check and the reservation one
// step so two of them cannot both deliver a replayed id.

class EventTracker {
public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit EventTracker(std::size_t capacity = kDefaultCapacity);

    /// Record a delivered id. Returns false, and changes nothing, when the id
    /// is already in the window.
    bool record(std::string_view id);

    /// Reserve an id before delivery starts. Returns false when the id is
    /// already in the window, claimed or delivered. last_id() is unchanged
    /// until mark_delivered().
    [[nodiscard]] bool claim(std::string_view id);

    /// Give a claimed id back; used when the event was not delivered.
    void release(std::string_view id);

    /// The claimed id reached the client and becomes last_id().
    void mark_delivered(std::string_view id);

    [[nodiscard]] bool contains(std::string_view id) const;

    [[nodiscard]] std::optional<std::string> last_id() const;

    /// Adopt a marker restored from the session store. The id becomes
    /// last_id() and enters the window.
    void seed(std::string id);

    /// Forget everything, including last_id().
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    void insert_locked(std::string id);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> members_;
    std::optional<std::string> last_id_;
};

// ─────────────────────────────────────────────────────────────────────────────
// EventTrackerRegistry
// ─────────────────────────────────────────────────────────────────────────────
// Trackers keyed by proxy session id. Owned by the engine; entries go away
// with their session.

class EventTrackerRegistry {
public:
    explicit EventTrackerRegistry(std::size_t capacity = EventTracker::kDefaultCapacity)
        : capacity_(capacity) {}

    /// Existing tracker for the session, or a fresh empty one.
    [[nodiscard]] std::shared_ptr<EventTracker> acquire(const std::string& session_id);

    [[nodiscard]] std::shared_ptr<EventTracker> find(const std::string& session_id) const;

    void remove(const std::string& session_id);

    [[nodiscard]] std::size_t size() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<EventTracker>> trackers_;
};

}  // namespace mcpx
