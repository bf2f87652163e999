#pragma once

#include "mcpx/protocol/json_rpc.hpp"
#include "mcpx/proxy/interceptor.hpp"
#include "mcpx/proxy/proxy_config.hpp"
#include "mcpx/session/session_store.hpp"
#include "mcpx/stream/client_sink.hpp"
#include "mcpx/stream/event_tracker.hpp"
#include "mcpx/transport/http_types.hpp"
#include "mcpx/upstream/response_classifier.hpp"
#include "mcpx/upstream/upstream_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <tl/expected.hpp>

namespace mcpx {

// ─────────────────────────────────────────────────────────────────────────────
// Client-facing request and response shapes
// ─────────────────────────────────────────────────────────────────────────────

struct ClientRequest {
    HttpMethod method{HttpMethod::Post};
    HeaderMap headers;
    std::string body;
    TransportKind client_transport{TransportKind::StreamableHttp};
};

/// Fully buffered answer.
struct ProxyReply {
    int status_code{200};
    HeaderMap headers;
    std::string body;
};

/// Event stream; the caller drains `events` until it yields nullopt, or
/// closes it to hang up.
struct ProxyStream {
    int status_code{200};
    HeaderMap headers;
    std::shared_ptr<EventSink> events;
};

/// Body of an unrecognised content type, relayed byte for byte.
struct ProxyPassThrough {
    int status_code{200};
    HeaderMap headers;
    std::shared_ptr<ByteSink> bytes;
};

using ProxyResponse = std::variant<ProxyReply, ProxyStream, ProxyPassThrough>;

// ─────────────────────────────────────────────────────────────────────────────
// ProxyEngine
// ─────────────────────────────────────────────────────────────────────────────
// The request path of the proxy:
//
//   POST    parse -> session -> client-direction interceptors -> dispatch
//           -> classify -> { buffered reply | stream pipeline | pass-through }
//   GET     open or resume the session's upstream event stream
//   DELETE  terminate the session
//
// Streams and pass-through relays run as tasks on the engine's executor and
// are tracked until they end, so shutdown() can drain them. The engine must
// outlive those tasks: call shutdown() before destroying it.

class ProxyEngine {
public:
    ProxyEngine(
        asio::any_io_executor executor,
        std::shared_ptr<ISessionStore> store,
        std::shared_ptr<IUpstreamSelector> upstreams,
        std::shared_ptr<const InterceptorChain> interceptors,
        ProxyConfig config = {}
    );

    ProxyEngine(const ProxyEngine&) = delete;
    ProxyEngine& operator=(const ProxyEngine&) = delete;

    asio::awaitable<ProxyResponse> handle(ClientRequest request);

    /// Ends a session: best-effort DELETE upstream, open streams stopped,
    /// store records and tracker removed.
    asio::awaitable<StoreResult<void>> terminate_session(std::string session_id);

    /// One idle-session sweep. Returns how many sessions expired.
    asio::awaitable<std::size_t> run_maintenance();

    /// Sweeps every session_sweep_interval until shutdown().
    asio::awaitable<void> maintenance_loop();

    /// Refuse new requests, give open streams `grace` to finish, then stop
    /// the rest.
    asio::awaitable<void> shutdown(std::chrono::milliseconds grace);

    [[nodiscard]] std::size_t active_streams() const;
    [[nodiscard]] bool is_shutting_down() const noexcept { return shutting_down_.load(); }
    [[nodiscard]] const ProxyConfig& config() const noexcept { return config_; }
    [[nodiscard]] EventTrackerRegistry& trackers() noexcept { return trackers_; }

private:
    using Signal = asio::experimental::concurrent_channel<void(asio::error_code)>;

    asio::awaitable<void> sweep_loop();

    asio::awaitable<ProxyResponse> handle_post(ClientRequest request);
    asio::awaitable<ProxyResponse> handle_get(ClientRequest request);
    asio::awaitable<ProxyResponse> handle_delete(ClientRequest request);

    /// Existing session named by the request, or a new one when it names
    /// none. The error alternative is the reply to send instead.
    asio::awaitable<tl::expected<Session, ProxyReply>> resolve_session(
        const ClientRequest& request, const UpstreamEndpoint& upstream, bool allow_create);

    asio::awaitable<ProxyResponse> route(
        Session session,
        UpstreamEndpoint upstream,
        RoutedResponse routed,
        std::optional<JsonRpcId> origin_id);

    asio::awaitable<ProxyResponse> buffer_reply(
        const Session& session, SingleReplyResponse reply, std::optional<JsonRpcId> origin_id);

    ProxyResponse start_stream(
        const Session& session,
        const UpstreamEndpoint& upstream,
        EventStreamResponse stream,
        std::optional<JsonRpcId> origin_id);

    ProxyResponse start_pass_through(const Session& session, PassThroughResponse response);

    /// Re-reads the stored session, marks it active and fills in the
    /// upstream session id if the store has none yet.
    asio::awaitable<void> touch_session(std::string session_id, std::optional<std::string> upstream_session_id);
    asio::awaitable<void> record_history(const std::string& session_id, HistoryDirection direction, std::string payload);

    [[nodiscard]] HeaderMap upstream_headers(const Session& session) const;
    [[nodiscard]] HeaderMap client_headers(const Session& session, std::string_view content_type) const;

    /// Track a running task; `stop` must be callable from any thread.
    std::uint64_t register_task(std::string session_id, std::function<void()> stop);
    void release_task(std::uint64_t key);
    void stop_tasks(const std::optional<std::string>& session_id);
    void launch(std::uint64_t key, asio::awaitable<void> task);

    asio::any_io_executor executor_;
    std::shared_ptr<ISessionStore> store_;
    std::shared_ptr<IUpstreamSelector> upstreams_;
    std::shared_ptr<const InterceptorChain> interceptors_;
    ProxyConfig config_;
    EventTrackerRegistry trackers_;

    struct ActiveTask {
        std::string session_id;
        std::function<void()> stop;
    };

    mutable std::mutex tasks_mutex_;
    std::unordered_map<std::uint64_t, ActiveTask> tasks_;
    std::uint64_t next_task_key_{0};
    bool draining_{false};

    std::atomic<bool> shutting_down_{false};
    Signal drained_;
    Signal maintenance_stop_;
};

}  // namespace mcpx
