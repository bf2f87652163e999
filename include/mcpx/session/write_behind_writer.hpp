#pragma once

#include "mcpx/session/session_store.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>

namespace mcpx {

struct WriteBehindConfig {
    /// Also append delivered messages to the session history.
    bool record_history{true};

    /// History entries held while the store is slow; beyond this the oldest
    /// pending entries are dropped.
    std::size_t max_pending_history{256};
};

/// Persists a stream's delivery position off the forwarding path.
///
/// record() only touches memory and never waits for the store. run() drains
/// pending writes in the background, coalescing positions so only the latest
/// one is written. A failed write is retried once and then dropped with a
/// warning; the stream itself is never interrupted by store trouble.
///
/// Usage:
///   auto writer = std::make_shared<WriteBehindWriter>(executor, store, session_id);
///   co_await (pipeline_body() && writer->run());   // pipeline calls close() when done
class WriteBehindWriter {
public:
    WriteBehindWriter(
        asio::any_io_executor executor,
        std::shared_ptr<ISessionStore> store,
        std::string session_id,
        WriteBehindConfig config = {}
    );

    WriteBehindWriter(const WriteBehindWriter&) = delete;
    WriteBehindWriter& operator=(const WriteBehindWriter&) = delete;

    /// Queue the position just delivered, plus an optional history entry.
    void record(std::string event_id, std::optional<HistoryEntry> entry = std::nullopt);

    /// Queue removal of the stored marker.
    void clear_marker();

    /// run() flushes what is pending and returns.
    void close();

    asio::awaitable<void> run();

    [[nodiscard]] std::size_t completed_writes() const noexcept { return completed_.load(); }
    [[nodiscard]] std::size_t dropped_writes() const noexcept { return dropped_.load(); }
    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }

private:
    using WakeChannel = asio::experimental::concurrent_channel<void(asio::error_code)>;

    void wake();
    [[nodiscard]] bool is_closed() const;
    asio::awaitable<void> flush();

    template <typename Operation>
    asio::awaitable<bool> write_with_retry(std::string_view what, Operation operation);

    std::shared_ptr<ISessionStore> store_;
    std::string session_id_;
    WriteBehindConfig config_;
    WakeChannel wake_;

    mutable std::mutex mutex_;
    // Outer optional: a marker write is pending. Inner: the value to write.
    std::optional<std::optional<std::string>> pending_marker_;
    std::vector<HistoryEntry> pending_history_;
    bool closed_{false};

    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> dropped_{0};
};

}  // namespace mcpx
