#include "mcpx/stream/stream_pipeline.hpp"

#include "mcpx/log/logger.hpp"

#include <algorithm>
#include <chrono>

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpx {

using namespace asio::experimental::awaitable_operators;

namespace {

enum class ReadKind { Chunk, End, Failed, Stalled };

struct ReadOutcome {
    ReadKind kind{ReadKind::End};
    std::string chunk;
    std::string error;
};

/// One body read bounded by the idle window. The window restarts on every
/// read, so any byte (keep-alive comments included) keeps the stream alive.
asio::awaitable<ReadOutcome> read_with_deadline(IBodySource& body, std::chrono::milliseconds idle_window) {
    asio::steady_timer deadline(co_await asio::this_coro::executor, idle_window);
    auto result = co_await (
        body.async_read_some() ||
        deadline.async_wait(asio::use_awaitable)
    );

    if (result.index() == 1) {
        co_return ReadOutcome{ReadKind::Stalled, {}, "no bytes within idle window"};
    }
    auto& read = std::get<0>(result);
    if (read.has_value() == false) {
        co_return ReadOutcome{ReadKind::Failed, {}, read.error().message};
    }
    if (read->has_value() == false) {
        co_return ReadOutcome{ReadKind::End, {}, {}};
    }
    co_return ReadOutcome{ReadKind::Chunk, std::move(**read), {}};
}

}  // namespace

StreamPipeline::StreamPipeline(
    asio::any_io_executor executor,
    std::string session_id,
    std::optional<JsonRpcId> origin_request_id,
    Dependencies dependencies,
    StreamPipelineConfig config
)
    : session_id_(std::move(session_id))
    , origin_request_id_(std::move(origin_request_id))
    , sink_(std::move(dependencies.sink))
    , tracker_(std::move(dependencies.tracker))
    , reconnection_(std::move(dependencies.reconnection))
    , interceptors_(std::move(dependencies.interceptors))
    , writer_(std::move(dependencies.writer))
    , config_(std::move(config))
    , stop_signal_(std::move(executor), 1)
{}

PipelineStats StreamPipeline::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void StreamPipeline::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(body_mutex_);
        if (current_body_ != nullptr) {
            current_body_->cancel();
        }
    }
    reconnection_->close();
    static_cast<void>(stop_signal_.try_send(asio::error_code{}));
}

void StreamPipeline::attach_body(IBodySource* body) {
    std::lock_guard<std::mutex> lock(body_mutex_);
    current_body_ = body;
    if (body != nullptr && stopping_.load()) {
        body->cancel();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Task structure
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<PipelineOutcome> StreamPipeline::run(EventStreamResponse initial) {
    if (writer_ == nullptr) {
        co_return co_await supervise(std::move(initial));
    }
    co_return co_await (supervise(std::move(initial)) && writer_->run());
}

asio::awaitable<PipelineOutcome> StreamPipeline::supervise(EventStreamResponse initial) {
    auto result = co_await (drive(std::move(initial)) || wait_for_stop());

    PipelineOutcome outcome = PipelineOutcome::Stopped;
    if (result.index() == 0) {
        outcome = std::get<0>(result);
    }

    attach_body(nullptr);
    reconnection_->close();
    if (outcome == PipelineOutcome::Stopped) {
        sink_->close();
    }
    if (writer_ != nullptr) {
        writer_->close();
    }

    const PipelineStats totals = stats();
    get_logger().info_fmt(
        "stream for session {} ended ({}): forwarded={} duplicates={} blocked={} skipped={} reconnects={}",
        session_id_, to_string(outcome), totals.forwarded, totals.duplicates,
        totals.blocked, totals.skipped_records, totals.reconnects);
    co_return outcome;
}

asio::awaitable<void> StreamPipeline::wait_for_stop() {
    co_await stop_signal_.async_receive(asio::as_tuple(asio::use_awaitable));
}

// ─────────────────────────────────────────────────────────────────────────────
// Read loop
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<PipelineOutcome> StreamPipeline::drive(EventStreamResponse initial) {
    SseParser parser(config_.parser);
    BodyHandle body = std::move(initial.body);
    std::optional<std::size_t> remaining = initial.meta.content_length;

    while (true) {
        if (body == nullptr) {
            body = std::make_unique<MemoryBodySource>();
        }
        attach_body(body.get());

        ReadOutcome read = co_await read_with_deadline(*body, reconnection_->idle_timeout());

        if (read.kind == ReadKind::Chunk) {
            if (remaining.has_value()) {
                *remaining -= std::min(*remaining, read.chunk.size());
            }
            auto events = parser.feed(read.chunk);
            update_stats([&](PipelineStats& s) { s.skipped_records = parser.skipped_records(); });

            for (auto& event : events) {
                const Step step = co_await deliver(std::move(event));
                if (step == Step::Terminated) {
                    body->cancel();
                    attach_body(nullptr);
                    co_await sink_->finish();
                    co_return PipelineOutcome::Completed;
                }
                if (step == Step::ClientGone) {
                    get_logger().info_fmt("client left stream for session {}, cancelling upstream", session_id_);
                    body->cancel();
                    attach_body(nullptr);
                    co_return PipelineOutcome::ClientGone;
                }
            }
            continue;
        }

        const bool bounded_body_done = (read.kind == ReadKind::End)
            && remaining.has_value() && *remaining == 0
            && parser.has_partial_record() == false;
        if (bounded_body_done) {
            attach_body(nullptr);
            co_await sink_->finish();
            co_return PipelineOutcome::Completed;
        }

        if (stopping_.load()) {
            co_return PipelineOutcome::Stopped;
        }

        switch (read.kind) {
            case ReadKind::End:
                get_logger().warn_fmt("upstream stream for session {} ended {}without a termination record",
                    session_id_, parser.has_partial_record() ? "mid-record " : "");
                break;
            case ReadKind::Failed:
                get_logger().warn_fmt("upstream stream for session {} failed: {}", session_id_, read.error);
                break;
            case ReadKind::Stalled:
                get_logger().warn_fmt("upstream stream for session {} stalled for {}ms",
                    session_id_, reconnection_->idle_timeout().count());
                break;
            case ReadKind::Chunk:
                break;
        }

        body->cancel();
        attach_body(nullptr);
        body.reset();
        parser.reset();

        auto resumed = co_await reconnection_->resume(tracker_->last_id());
        if (resumed.has_value() == false) {
            if (resumed.error().code == ReconnectError::Code::Cancelled) {
                co_return PipelineOutcome::Stopped;
            }
            co_await send_terminal_error(resumed.error());
            co_return PipelineOutcome::StreamLost;
        }

        update_stats([](PipelineStats& s) { ++s.reconnects; });
        remaining = resumed->meta.content_length;
        body = std::move(resumed->body);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Per-event processing
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<StreamPipeline::Step> StreamPipeline::deliver(StreamEvent event) {
    if (event.retry.has_value()) {
        reconnection_->note_retry_hint(std::chrono::milliseconds{*event.retry});
    }
    // Claimed before the first suspension point; another stream of the same
    // session sees the id as taken from here on.
    if (event.id.has_value() && tracker_->claim(*event.id) == false) {
        update_stats([](PipelineStats& s) { ++s.duplicates; });
        get_logger().trace_fmt("dropping duplicate event {} on session {}", *event.id, session_id_);
        co_return Step::Continue;
    }

    std::optional<ProtocolMessage> message;
    if (event.data.empty() == false) {
        auto parsed = ProtocolMessage::parse(event.data);
        if (parsed.has_value()) {
            message = std::move(*parsed);
        }
    }

    if (message.has_value() && interceptors_ != nullptr && interceptors_->empty() == false) {
        InterceptContext context{session_id_, HistoryDirection::UpstreamToClient,
                                 config_.upstream_transport, event.id};
        ChainVerdict verdict = co_await interceptors_->run(*message, std::move(context));
        if (verdict.blocked()) {
            if (event.id.has_value()) {
                tracker_->release(*event.id);
            }
            update_stats([](PipelineStats& s) { ++s.blocked; });
            co_return Step::Continue;
        }
        if (verdict.modified) {
            event.data = verdict.message.serialize();
            message = std::move(verdict.message);
            update_stats([](PipelineStats& s) { ++s.modified; });
        }
    }

    const bool terminal = is_termination(event, message);
    const std::optional<std::string> event_id = event.id;
    std::string payload = event.data;

    const bool sent = co_await sink_->send(std::move(event));
    if (sent == false) {
        if (event_id.has_value()) {
            tracker_->release(*event_id);
        }
        co_return Step::ClientGone;
    }

    update_stats([](PipelineStats& s) { ++s.forwarded; });
    reconnection_->note_progress();

    if (event_id.has_value()) {
        tracker_->mark_delivered(*event_id);
        if (writer_ != nullptr) {
            writer_->record(*event_id, HistoryEntry{
                0, HistoryDirection::UpstreamToClient, event_id, std::move(payload),
                std::chrono::system_clock::now()});
        }
    }

    co_return terminal ? Step::Terminated : Step::Continue;
}

bool StreamPipeline::is_termination(const StreamEvent& event,
                                    const std::optional<ProtocolMessage>& message) const {
    if (config_.termination_event_type.empty() == false
        && event.type.has_value()
        && *event.type == config_.termination_event_type) {
        return true;
    }
    return origin_request_id_.has_value()
        && message.has_value()
        && message->answers(*origin_request_id_);
}

asio::awaitable<void> StreamPipeline::send_terminal_error(const ReconnectError& error) {
    Json data = Json::object();
    data["attempts"] = error.attempts;
    if (const auto last = tracker_->last_id()) {
        data["lastEventId"] = *last;
    }

    const ProtocolMessage failure = ProtocolMessage::error_response(
        origin_request_id_,
        JsonRpcError{rpc_error::kUpstreamStreamLost, error.message, std::move(data)});

    StreamEvent terminal;
    terminal.type = config_.error_event_type;
    terminal.data = failure.serialize();

    // The stream is gone for good; a later resume must not reuse its marker.
    tracker_->clear();
    if (writer_ != nullptr) {
        writer_->clear_marker();
    }

    if (co_await sink_->send(std::move(terminal))) {
        co_await sink_->finish();
    }
}

}  // namespace mcpx
