#pragma once

#include "mcpx/protocol/json_rpc.hpp"
#include "mcpx/proxy/interceptor.hpp"
#include "mcpx/session/write_behind_writer.hpp"
#include "mcpx/stream/client_sink.hpp"
#include "mcpx/stream/event_tracker.hpp"
#include "mcpx/stream/reconnection_manager.hpp"
#include "mcpx/stream/sse_parser.hpp"
#include "mcpx/upstream/response_classifier.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>

namespace mcpx {

struct StreamPipelineConfig {
    SseParserConfig parser{};

    /// An event with this type label ends the stream normally. Empty disables
    /// label-based termination.
    std::string termination_event_type{"end"};

    /// Label of the final event sent when the stream cannot be resumed.
    std::string error_event_type{"error"};

    TransportKind upstream_transport{TransportKind::StreamableHttp};
};

enum class PipelineOutcome {
    Completed,   ///< termination record seen or bounded body fully read
    StreamLost,  ///< reconnection gave up; the client got a terminal error event
    ClientGone,  ///< the client closed its sink
    Stopped      ///< stop() was called
};

[[nodiscard]] constexpr std::string_view to_string(PipelineOutcome outcome) noexcept {
    switch (outcome) {
        case PipelineOutcome::Completed:  return "completed";
        case PipelineOutcome::StreamLost: return "stream-lost";
        case PipelineOutcome::ClientGone: return "client-gone";
        case PipelineOutcome::Stopped:    return "stopped";
    }
    return "unknown";
}

struct PipelineStats {
    std::size_t forwarded{0};
    std::size_t duplicates{0};
    std::size_t blocked{0};
    std::size_t modified{0};
    std::size_t skipped_records{0};
    std::size_t reconnects{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// StreamPipeline
// ─────────────────────────────────────────────────────────────────────────────
// Carries one upstream event stream to one client sink:
//
//   body chunks -> SseParser -> duplicate check -> interceptors -> sink
//                                                   -> tracker -> write-behind
//
// Ending the body without a termination record, a transport error and an
// idle stall all count as a lost stream and go through the
// ReconnectionManager; the resumed body continues the same sequence.
// A pipeline is single-use.

class StreamPipeline {
public:
    struct Dependencies {
        std::shared_ptr<EventSink> sink;
        std::shared_ptr<EventTracker> tracker;
        std::shared_ptr<ReconnectionManager> reconnection;
        std::shared_ptr<const InterceptorChain> interceptors;  ///< optional
        std::shared_ptr<WriteBehindWriter> writer;             ///< optional
    };

    StreamPipeline(
        asio::any_io_executor executor,
        std::string session_id,
        std::optional<JsonRpcId> origin_request_id,
        Dependencies dependencies,
        StreamPipelineConfig config = {}
    );

    StreamPipeline(const StreamPipeline&) = delete;
    StreamPipeline& operator=(const StreamPipeline&) = delete;

    asio::awaitable<PipelineOutcome> run(EventStreamResponse initial);

    /// Ends run() promptly from any thread: the upstream body is cancelled,
    /// reconnection is abandoned and the sink is closed.
    void stop();

    [[nodiscard]] StreamState state() const noexcept { return reconnection_->state(); }
    [[nodiscard]] PipelineStats stats() const;
    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }

private:
    enum class Step { Continue, Terminated, ClientGone };

    asio::awaitable<PipelineOutcome> supervise(EventStreamResponse initial);
    asio::awaitable<PipelineOutcome> drive(EventStreamResponse initial);
    asio::awaitable<void> wait_for_stop();
    asio::awaitable<Step> deliver(StreamEvent event);
    asio::awaitable<void> send_terminal_error(const ReconnectError& error);

    [[nodiscard]] bool is_termination(const StreamEvent& event,
                                      const std::optional<ProtocolMessage>& message) const;
    void attach_body(IBodySource* body);

    template <typename Fn>
    void update_stats(Fn&& fn) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        fn(stats_);
    }

    using StopChannel = asio::experimental::concurrent_channel<void(asio::error_code)>;

    std::string session_id_;
    std::optional<JsonRpcId> origin_request_id_;
    std::shared_ptr<EventSink> sink_;
    std::shared_ptr<EventTracker> tracker_;
    std::shared_ptr<ReconnectionManager> reconnection_;
    std::shared_ptr<const InterceptorChain> interceptors_;
    std::shared_ptr<WriteBehindWriter> writer_;
    StreamPipelineConfig config_;

    StopChannel stop_signal_;
    std::atomic<bool> stopping_{false};

    std::mutex body_mutex_;
    IBodySource* current_body_{nullptr};

    mutable std::mutex stats_mutex_;
    PipelineStats stats_;
};

}  // namespace mcpx
