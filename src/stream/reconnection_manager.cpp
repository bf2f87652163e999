#include "mcpx/stream/reconnection_manager.hpp"

#include "mcpx/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpx {

using namespace asio::experimental::awaitable_operators;

ReconnectionManager::ReconnectionManager(
    std::shared_ptr<IUpstreamDispatcher> dispatcher,
    HeaderMap resume_headers,
    ReconnectPolicy policy,
    std::unique_ptr<IBackoffPolicy> backoff
)
    : dispatcher_(std::move(dispatcher))
    , resume_headers_(std::move(resume_headers))
    , policy_(std::move(policy))
    , backoff_(backoff != nullptr ? std::move(backoff) : policy_.make_backoff())
{
    set_header(resume_headers_, header::kAccept, "text/event-stream");
}

StreamState ReconnectionManager::state() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t ReconnectionManager::attempts() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
}

void ReconnectionManager::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

bool ReconnectionManager::transition(StreamState to) {
    std::vector<StateChangeCallback> callbacks;
    StreamState from{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        const bool allowed =
            (from == StreamState::Streaming && to == StreamState::Reconnecting) ||
            (from == StreamState::Reconnecting && to == StreamState::Streaming) ||
            (from != StreamState::Closed && to == StreamState::Closed);
        if (allowed == false) {
            return false;
        }
        state_ = to;
        callbacks = callbacks_;
    }

    for (const auto& callback : callbacks) {
        callback(from, to);
    }
    return true;
}

void ReconnectionManager::note_progress() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempts_ != 0) {
        attempts_ = 0;
        backoff_->reset();
    }
}

void ReconnectionManager::note_retry_hint(std::chrono::milliseconds hint) {
    std::lock_guard<std::mutex> lock(mutex_);
    backoff_->on_server_hint(hint);
}

void ReconnectionManager::close() {
    if (transition(StreamState::Closed)) {
        MCPX_LOG_DEBUG("reconnection manager closed");
    }
}

asio::awaitable<ReconnectResult> ReconnectionManager::resume(std::optional<std::string> last_event_id) {
    if (transition(StreamState::Reconnecting) == false) {
        co_return tl::unexpected(ReconnectError{
            ReconnectError::Code::Cancelled, "stream is closed", attempts()});
    }

    UpstreamRequest request;
    request.method = HttpMethod::Get;
    request.headers = resume_headers_;
    if (last_event_id.has_value()) {
        set_header(request.headers, header::kLastEventId, *last_event_id);
    }

    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (true) {
        std::size_t attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == StreamState::Closed) {
                co_return tl::unexpected(ReconnectError{
                    ReconnectError::Code::Cancelled, "stream closed while reconnecting", attempts_});
            }
            if (attempts_ >= policy_.max_attempts()) {
                break;
            }
            attempt = attempts_++;
        }

        const auto delay = backoff_->next_delay(attempt);
        get_logger().info_fmt("resuming upstream stream in {}ms (attempt {}/{}, last event id {})",
            delay.count(), attempt + 1, policy_.max_attempts(), last_event_id.value_or("<none>"));

        timer.expires_after(delay);
        co_await timer.async_wait(asio::as_tuple(asio::use_awaitable));
        if (state() == StreamState::Closed) {
            co_return tl::unexpected(ReconnectError{
                ReconnectError::Code::Cancelled, "stream closed while reconnecting", attempts()});
        }

        timer.expires_after(policy_.attempt_timeout());
        auto raced = co_await (
            dispatcher_->async_dispatch(request) ||
            timer.async_wait(asio::use_awaitable)
        );
        if (raced.index() == 1) {
            get_logger().warn_fmt("resume attempt {} got no answer within {}ms",
                attempt + 1, policy_.attempt_timeout().count());
            continue;
        }

        auto& response = std::get<0>(raced);
        if (response.has_value() == false) {
            get_logger().warn_fmt("resume attempt {} failed ({}): {}",
                attempt + 1, to_string(response.error().category), response.error().message);
            continue;
        }

        RoutedResponse routed = ResponseClassifier::classify(std::move(*response));
        if (auto* stream = std::get_if<EventStreamResponse>(&routed);
            stream != nullptr && is_success_status(stream->meta.status_code)) {
            if (transition(StreamState::Streaming) == false) {
                stream->body->cancel();
                co_return tl::unexpected(ReconnectError{
                    ReconnectError::Code::Cancelled, "stream closed while reconnecting", attempts()});
            }
            get_logger().info_fmt("upstream stream resumed after {} attempt(s)", attempt + 1);
            co_return std::move(*stream);
        }

        const int status = std::visit([](auto& alternative) {
            if (alternative.body != nullptr) {
                alternative.body->cancel();
            }
            return alternative.meta.status_code;
        }, routed);

        if (policy_.should_retry_status(status) == false) {
            get_logger().error_fmt("upstream answered resume with status {}, stream cannot be resumed", status);
            transition(StreamState::Closed);
            co_return tl::unexpected(ReconnectError{
                ReconnectError::Code::NotResumable,
                "upstream answered resume with status " + std::to_string(status),
                attempts()});
        }
        get_logger().warn_fmt("resume attempt {} got status {}, retrying", attempt + 1, status);
    }

    const std::size_t used = attempts();
    get_logger().error_fmt("giving up on upstream stream after {} reconnection attempt(s)", used);
    transition(StreamState::Closed);
    co_return tl::unexpected(ReconnectError{
        ReconnectError::Code::Exhausted,
        "upstream stream lost after " + std::to_string(used) + " reconnection attempt(s)",
        used});
}

}  // namespace mcpx
