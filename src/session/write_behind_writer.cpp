#include "mcpx/session/write_behind_writer.hpp"

#include "mcpx/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpx {

WriteBehindWriter::WriteBehindWriter(
    asio::any_io_executor executor,
    std::shared_ptr<ISessionStore> store,
    std::string session_id,
    WriteBehindConfig config
)
    : store_(std::move(store))
    , session_id_(std::move(session_id))
    , config_(config)
    , wake_(executor, 1)
{}

void WriteBehindWriter::record(std::string event_id, std::optional<HistoryEntry> entry) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_marker_ = std::optional<std::string>{std::move(event_id)};
        if (entry.has_value() && config_.record_history) {
            pending_history_.push_back(std::move(*entry));
            if (pending_history_.size() > config_.max_pending_history) {
                pending_history_.erase(pending_history_.begin());
                dropped_.fetch_add(1);
            }
        }
    }
    wake();
}

void WriteBehindWriter::clear_marker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_marker_ = std::optional<std::string>{};
    }
    wake();
}

void WriteBehindWriter::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    wake();
}

void WriteBehindWriter::wake() {
    // try_send only fails when a wake-up is already queued; that one covers this write.
    static_cast<void>(wake_.try_send(asio::error_code{}));
}

bool WriteBehindWriter::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

asio::awaitable<void> WriteBehindWriter::run() {
    while (is_closed() == false) {
        auto [ec] = co_await wake_.async_receive(asio::as_tuple(asio::use_awaitable));
        co_await flush();
        if (ec) {
            break;
        }
    }
    co_await flush();
}

template <typename Operation>
asio::awaitable<bool> WriteBehindWriter::write_with_retry(std::string_view what, Operation operation) {
    constexpr int max_attempts = 2;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        auto result = co_await operation();
        if (result.has_value()) {
            completed_.fetch_add(1);
            co_return true;
        }
        get_logger().warn_fmt("store write ({}) for session {} failed on attempt {}/{}: {}",
            what, session_id_, attempt, max_attempts, result.error().message);
    }
    dropped_.fetch_add(1);
    co_return false;
}

asio::awaitable<void> WriteBehindWriter::flush() {
    std::optional<std::optional<std::string>> marker;
    std::vector<HistoryEntry> history;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        marker.swap(pending_marker_);
        history.swap(pending_history_);
    }

    for (auto& entry : history) {
        co_await write_with_retry("history", [this, &entry]() {
            return store_->append_history(session_id_, entry);
        });
    }

    if (marker.has_value()) {
        co_await write_with_retry("last event id", [this, &marker]() {
            return store_->set_last_event_id(session_id_, *marker);
        });
    }
}

}  // namespace mcpx
