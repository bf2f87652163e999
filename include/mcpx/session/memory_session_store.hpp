#pragma once

#include "mcpx/session/session_store.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace mcpx {

struct MemorySessionStoreConfig {
    /// Number of independently locked buckets.
    std::size_t bucket_count{16};

    /// History entries retained per session; the oldest are dropped first.
    std::size_t max_history_entries{1000};
};

/// Process-local ISessionStore. Sessions are spread across buckets by id hash,
/// each bucket with its own mutex, so unrelated sessions never contend. No
/// operation suspends while a bucket lock is held.
class MemorySessionStore final : public ISessionStore {
public:
    MemorySessionStore() : MemorySessionStore(MemorySessionStoreConfig{}) {}
    explicit MemorySessionStore(MemorySessionStoreConfig config);

    asio::awaitable<StoreResult<void>> create_session(Session session) override;
    asio::awaitable<StoreResult<Session>> get_session(std::string session_id) override;
    asio::awaitable<StoreResult<void>> update_session(Session session) override;
    asio::awaitable<StoreResult<void>> delete_session(std::string session_id) override;

    asio::awaitable<StoreResult<std::uint64_t>> append_history(
        std::string session_id, HistoryEntry entry) override;
    asio::awaitable<StoreResult<std::vector<HistoryEntry>>> list_history(
        std::string session_id, std::size_t limit) override;
    asio::awaitable<StoreResult<void>> delete_history(std::string session_id) override;

    asio::awaitable<StoreResult<std::optional<std::string>>> get_last_event_id(
        std::string session_id) override;
    asio::awaitable<StoreResult<void>> set_last_event_id(
        std::string session_id, std::optional<std::string> event_id) override;

    asio::awaitable<StoreResult<std::unordered_map<std::string, Session>>> get_sessions(
        std::vector<std::string> session_ids) override;
    asio::awaitable<std::vector<StoreResult<void>>> update_sessions(
        std::vector<Session> sessions) override;

    asio::awaitable<StoreResult<std::vector<std::string>>> remove_idle_sessions(
        std::chrono::system_clock::time_point cutoff) override;

    [[nodiscard]] std::size_t session_count() const;

private:
    struct Record {
        Session session;
        std::deque<HistoryEntry> history;
        std::uint64_t next_sequence{1};
    };

    struct Bucket {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Record> records;
    };

    [[nodiscard]] Bucket& bucket_for(const std::string& session_id) const;
    [[nodiscard]] StoreResult<void> update_locked(Bucket& bucket, Session session);

    MemorySessionStoreConfig config_;
    std::vector<std::unique_ptr<Bucket>> buckets_;
};

}  // namespace mcpx
