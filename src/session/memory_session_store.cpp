#include "mcpx/session/memory_session_store.hpp"

#include "mcpx/log/logger.hpp"

#include <algorithm>
#include <functional>

namespace mcpx {

MemorySessionStore::MemorySessionStore(MemorySessionStoreConfig config)
    : config_(config)
{
    const std::size_t count = std::max<std::size_t>(config_.bucket_count, 1);
    buckets_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        buckets_.push_back(std::make_unique<Bucket>());
    }
}

MemorySessionStore::Bucket& MemorySessionStore::bucket_for(const std::string& session_id) const {
    const std::size_t index = std::hash<std::string>{}(session_id) % buckets_.size();
    return *buckets_[index];
}

// ─────────────────────────────────────────────────────────────────────────────
// Sessions
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<StoreResult<void>> MemorySessionStore::create_session(Session session) {
    Bucket& bucket = bucket_for(session.id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    if (bucket.records.contains(session.id)) {
        co_return tl::unexpected(StoreError::already_exists(session.id));
    }
    const std::string id = session.id;
    bucket.records.emplace(id, Record{std::move(session), {}, 1});
    co_return StoreResult<void>{};
}

asio::awaitable<StoreResult<Session>> MemorySessionStore::get_session(std::string session_id) {
    Bucket& bucket = bucket_for(session_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    const auto it = bucket.records.find(session_id);
    if (it == bucket.records.end()) {
        co_return tl::unexpected(StoreError::not_found(session_id));
    }
    co_return it->second.session;
}

StoreResult<void> MemorySessionStore::update_locked(Bucket& bucket, Session session) {
    const auto it = bucket.records.find(session.id);
    if (it == bucket.records.end()) {
        return tl::unexpected(StoreError::not_found(session.id));
    }
    Session& stored = it->second.session;

    if (stored.client_transport != session.client_transport
        || stored.upstream_transport != session.upstream_transport) {
        return tl::unexpected(StoreError::conflict(
            "transport kinds of session " + session.id + " cannot change"));
    }
    if (stored.protocol_version != session.protocol_version) {
        return tl::unexpected(StoreError::conflict(
            "protocol version of session " + session.id + " cannot change"));
    }
    if (stored.upstream_session_id.has_value()
        && session.upstream_session_id != stored.upstream_session_id) {
        return tl::unexpected(StoreError::conflict(
            "upstream session id of session " + session.id + " is already set"));
    }

    // The delivered position moves only through set_last_event_id.
    stored.upstream_session_id = std::move(session.upstream_session_id);
    stored.last_activity = session.last_activity;
    return {};
}

asio::awaitable<StoreResult<void>> MemorySessionStore::update_session(Session session) {
    Bucket& bucket = bucket_for(session.id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    co_return update_locked(bucket, std::move(session));
}

asio::awaitable<StoreResult<void>> MemorySessionStore::delete_session(std::string session_id) {
    Bucket& bucket = bucket_for(session_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    if (bucket.records.erase(session_id) == 0) {
        co_return tl::unexpected(StoreError::not_found(session_id));
    }
    co_return StoreResult<void>{};
}

// ─────────────────────────────────────────────────────────────────────────────
// History
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<StoreResult<std::uint64_t>> MemorySessionStore::append_history(
    std::string session_id, HistoryEntry entry)
{
    Bucket& bucket = bucket_for(session_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    const auto it = bucket.records.find(session_id);
    if (it == bucket.records.end()) {
        co_return tl::unexpected(StoreError::not_found(session_id));
    }

    Record& record = it->second;
    entry.sequence = record.next_sequence++;
    const std::uint64_t sequence = entry.sequence;
    record.history.push_back(std::move(entry));
    while (record.history.size() > config_.max_history_entries) {
        record.history.pop_front();
    }
    co_return sequence;
}

asio::awaitable<StoreResult<std::vector<HistoryEntry>>> MemorySessionStore::list_history(
    std::string session_id, std::size_t limit)
{
    Bucket& bucket = bucket_for(session_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    const auto it = bucket.records.find(session_id);
    if (it == bucket.records.end()) {
        co_return tl::unexpected(StoreError::not_found(session_id));
    }

    const auto& history = it->second.history;
    const std::size_t count = (limit == 0) ? history.size() : std::min(limit, history.size());
    co_return std::vector<HistoryEntry>(history.end() - static_cast<std::ptrdiff_t>(count), history.end());
}

asio::awaitable<StoreResult<void>> MemorySessionStore::delete_history(std::string session_id) {
    Bucket& bucket = bucket_for(session_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    const auto it = bucket.records.find(session_id);
    if (it == bucket.records.end()) {
        co_return tl::unexpected(StoreError::not_found(session_id));
    }
    it->second.history.clear();
    co_return StoreResult<void>{};
}

// ─────────────────────────────────────────────────────────────────────────────
// Resumption marker
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<StoreResult<std::optional<std::string>>> MemorySessionStore::get_last_event_id(
    std::string session_id)
{
    Bucket& bucket = bucket_for(session_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    const auto it = bucket.records.find(session_id);
    if (it == bucket.records.end()) {
        co_return tl::unexpected(StoreError::not_found(session_id));
    }
    co_return it->second.session.last_event_id;
}

asio::awaitable<StoreResult<void>> MemorySessionStore::set_last_event_id(
    std::string session_id, std::optional<std::string> event_id)
{
    Bucket& bucket = bucket_for(session_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    const auto it = bucket.records.find(session_id);
    if (it == bucket.records.end()) {
        co_return tl::unexpected(StoreError::not_found(session_id));
    }
    it->second.session.last_event_id = std::move(event_id);
    it->second.session.last_activity = std::chrono::system_clock::now();
    co_return StoreResult<void>{};
}

// ─────────────────────────────────────────────────────────────────────────────
// Batch
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<StoreResult<std::unordered_map<std::string, Session>>> MemorySessionStore::get_sessions(
    std::vector<std::string> session_ids)
{
    std::unordered_map<std::string, Session> found;
    for (const auto& id : session_ids) {
        Bucket& bucket = bucket_for(id);
        std::lock_guard<std::mutex> lock(bucket.mutex);
        const auto it = bucket.records.find(id);
        if (it != bucket.records.end()) {
            found.emplace(id, it->second.session);
        }
    }
    co_return found;
}

asio::awaitable<std::vector<StoreResult<void>>> MemorySessionStore::update_sessions(
    std::vector<Session> sessions)
{
    std::vector<StoreResult<void>> results;
    results.reserve(sessions.size());
    for (auto& session : sessions) {
        Bucket& bucket = bucket_for(session.id);
        std::lock_guard<std::mutex> lock(bucket.mutex);
        results.push_back(update_locked(bucket, std::move(session)));
    }
    co_return results;
}

// ─────────────────────────────────────────────────────────────────────────────
// Maintenance
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<StoreResult<std::vector<std::string>>> MemorySessionStore::remove_idle_sessions(
    std::chrono::system_clock::time_point cutoff)
{
    std::vector<std::string> removed;
    for (auto& bucket : buckets_) {
        std::lock_guard<std::mutex> lock(bucket->mutex);
        std::erase_if(bucket->records, [&](const auto& entry) {
            if (entry.second.session.last_activity < cutoff) {
                removed.push_back(entry.first);
                return true;
            }
            return false;
        });
    }
    if (removed.empty() == false) {
        get_logger().info_fmt("expired {} idle session(s)", removed.size());
    }
    co_return removed;
}

std::size_t MemorySessionStore::session_count() const {
    std::size_t total = 0;
    for (const auto& bucket : buckets_) {
        std::lock_guard<std::mutex> lock(bucket->mutex);
        total += bucket->records.size();
    }
    return total;
}

}  // namespace mcpx
