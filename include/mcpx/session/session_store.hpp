#pragma once

#include "mcpx/session/session.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// StoreError
// ─────────────────────────────────────────────────────────────────────────────

struct StoreError {
    enum class Code {
        NotFound,       ///< no session with that id
        AlreadyExists,  ///< create_session with a taken id
        Conflict,       ///< update would change an immutable field
        Unavailable     ///< backend could not be reached; callers may degrade
    };

    Code code{Code::Unavailable};
    std::string message;

    [[nodiscard]] static StoreError not_found(std::string_view session_id) {
        return StoreError{Code::NotFound, "session not found: " + std::string(session_id)};
    }

    [[nodiscard]] static StoreError already_exists(std::string_view session_id) {
        return StoreError{Code::AlreadyExists, "session already exists: " + std::string(session_id)};
    }

    [[nodiscard]] static StoreError conflict(std::string msg) {
        return StoreError{Code::Conflict, std::move(msg)};
    }

    [[nodiscard]] static StoreError unavailable(std::string msg) {
        return StoreError{Code::Unavailable, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(StoreError::Code code) noexcept {
    switch (code) {
        case StoreError::Code::NotFound:      return "not-found";
        case StoreError::Code::AlreadyExists: return "already-exists";
        case StoreError::Code::Conflict:      return "conflict";
        case StoreError::Code::Unavailable:   return "unavailable";
    }
    return "unknown";
}

template <typename T>
using StoreResult = tl::expected<T, StoreError>;

// ─────────────────────────────────────────────────────────────────────────────
// ISessionStore
// ─────────────────────────────────────────────────────────────────────────────
// Persistence for sessions, their message history and the last delivered
// event id. Implementations may be remote; every operation is asynchronous
// and may fail with Code::Unavailable. Operations on one session are atomic
// with respect to each other; batch operations are atomic per session only.

class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    // Sessions

    virtual asio::awaitable<StoreResult<void>> create_session(Session session) = 0;

    virtual asio::awaitable<StoreResult<Session>> get_session(std::string session_id) = 0;

    /// Replaces last activity, and the upstream session id while it is still
    /// unset. The last event id is ignored here; see set_last_event_id.
    /// Changing a transport kind
    /// or the protocol version, or replacing an upstream session id that is
    /// already set, yields Code::Conflict.
    virtual asio::awaitable<StoreResult<void>> update_session(Session session) = 0;

    /// Removes the session together with its history.
    virtual asio::awaitable<StoreResult<void>> delete_session(std::string session_id) = 0;

    // History

    /// Returns the sequence number assigned to the entry.
    virtual asio::awaitable<StoreResult<std::uint64_t>> append_history(
        std::string session_id, HistoryEntry entry) = 0;

    /// The newest `limit` entries, oldest first. limit == 0 returns
    /// everything retained.
    virtual asio::awaitable<StoreResult<std::vector<HistoryEntry>>> list_history(
        std::string session_id, std::size_t limit) = 0;

    virtual asio::awaitable<StoreResult<void>> delete_history(std::string session_id) = 0;

    // Resumption marker

    virtual asio::awaitable<StoreResult<std::optional<std::string>>> get_last_event_id(
        std::string session_id) = 0;

    /// nullopt clears the marker.
    virtual asio::awaitable<StoreResult<void>> set_last_event_id(
        std::string session_id, std::optional<std::string> event_id) = 0;

    // Batch

    /// Sessions that exist among the given ids; missing ids are omitted.
    virtual asio::awaitable<StoreResult<std::unordered_map<std::string, Session>>> get_sessions(
        std::vector<std::string> session_ids) = 0;

    /// One result per input, in input order.
    virtual asio::awaitable<std::vector<StoreResult<void>>> update_sessions(
        std::vector<Session> sessions) = 0;

    // Maintenance

    /// Deletes sessions whose last activity is before cutoff and returns
    /// their ids.
    virtual asio::awaitable<StoreResult<std::vector<std::string>>> remove_idle_sessions(
        std::chrono::system_clock::time_point cutoff) = 0;
};

}  // namespace mcpx
