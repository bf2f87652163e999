#include "mcpx/proxy/proxy_engine.hpp"

#include "mcpx/log/logger.hpp"
#include "mcpx/protocol/media_type.hpp"
#include "mcpx/session/write_behind_writer.hpp"
#include "mcpx/stream/reconnection_manager.hpp"
#include "mcpx/stream/stream_pipeline.hpp"

#include <exception>
#include <vector>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpx {

using namespace asio::experimental::awaitable_operators;

namespace {

constexpr std::chrono::milliseconds kForcedStopWait{1000};
constexpr std::string_view kJsonContentType = "application/json";
constexpr std::string_view kEventStreamContentType = "text/event-stream";

ProxyReply rpc_failure(int status, std::optional<JsonRpcId> id, std::int64_t code, std::string message) {
    ProxyReply reply;
    reply.status_code = status;
    set_header(reply.headers, header::kContentType, std::string(kJsonContentType));
    reply.body = ProtocolMessage::error_response(
        std::move(id), JsonRpcError{code, std::move(message), std::nullopt}).serialize();
    return reply;
}

/// Accept lists media ranges separated by commas; text/event-stream,
/// text/* and */* all admit a stream.
bool accepts_event_stream(const HeaderMap& headers) {
    const auto accept = get_header(headers, header::kAccept);
    if (accept.has_value() == false) {
        return false;
    }
    std::string_view rest = *accept;
    while (rest.empty() == false) {
        const auto comma = rest.find(',');
        const std::string_view range = rest.substr(0, comma);
        rest = (comma == std::string_view::npos) ? std::string_view{} : rest.substr(comma + 1);

        const auto media = parse_media_type(range);
        if (media.has_value() == false) {
            continue;
        }
        if (media->is_event_stream() || media->matches("text", "*") || media->matches("*", "*")) {
            return true;
        }
    }
    return false;
}

asio::awaitable<void> drive_pipeline(std::shared_ptr<StreamPipeline> pipeline, EventStreamResponse stream) {
    const PipelineOutcome outcome = co_await pipeline->run(std::move(stream));
    get_logger().debug_fmt("pipeline for session {} finished: {}", pipeline->session_id(), to_string(outcome));
}

asio::awaitable<void> relay_bytes(std::shared_ptr<IBodySource> body, std::shared_ptr<ByteSink> sink) {
    while (true) {
        auto chunk = co_await body->async_read_some();
        if (chunk.has_value() == false) {
            get_logger().warn_fmt("pass-through body ended early: {}", chunk.error().message);
            break;
        }
        if (chunk->has_value() == false) {
            break;
        }
        if (co_await sink->send(std::move(**chunk)) == false) {
            body->cancel();
            co_return;
        }
    }
    co_await sink->finish();
}

}  // namespace

ProxyEngine::ProxyEngine(
    asio::any_io_executor executor,
    std::shared_ptr<ISessionStore> store,
    std::shared_ptr<IUpstreamSelector> upstreams,
    std::shared_ptr<const InterceptorChain> interceptors,
    ProxyConfig config
)
    : executor_(std::move(executor))
    , store_(std::move(store))
    , upstreams_(std::move(upstreams))
    , interceptors_(std::move(interceptors))
    , config_(std::move(config))
    , trackers_(config_.recency_window)
    , drained_(executor_, 1)
    , maintenance_stop_(executor_, 1)
{}

// ─────────────────────────────────────────────────────────────────────────────
// Entry point
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<ProxyResponse> ProxyEngine::handle(ClientRequest request) {
    if (shutting_down_.load()) {
        co_return rpc_failure(503, std::nullopt, rpc_error::kUpstreamUnavailable, "proxy is shutting down");
    }

    switch (request.method) {
        case HttpMethod::Post:   co_return co_await handle_post(std::move(request));
        case HttpMethod::Get:    co_return co_await handle_get(std::move(request));
        case HttpMethod::Delete: co_return co_await handle_delete(std::move(request));
    }
    co_return rpc_failure(405, std::nullopt, rpc_error::kInvalidRequest, "method not allowed");
}

asio::awaitable<ProxyResponse> ProxyEngine::handle_post(ClientRequest request) {
    Json payload;
    try {
        payload = Json::parse(request.body);
    } catch (const Json::parse_error& e) {
        co_return rpc_failure(400, std::nullopt, rpc_error::kParseError, "Parse error: " + std::string(e.what()));
    }

    // Batches are relayed as they are; only single messages are intercepted.
    std::optional<ProtocolMessage> message;
    if (payload.is_array()) {
        if (payload.empty()) {
            co_return rpc_failure(400, std::nullopt, rpc_error::kInvalidRequest, "empty batch");
        }
    } else {
        auto parsed = ProtocolMessage::from_json(std::move(payload));
        if (parsed.has_value() == false) {
            co_return rpc_failure(400, std::nullopt, rpc_error::kInvalidRequest, parsed.error().message);
        }
        message = std::move(*parsed);
    }

    std::optional<JsonRpcId> origin_id;
    if (message.has_value() && message->is_request()) {
        origin_id = message->id();
    }

    UpstreamEndpoint upstream = upstreams_->select();
    auto resolved = co_await resolve_session(request, upstream, true);
    if (resolved.has_value() == false) {
        co_return std::move(resolved.error());
    }
    Session session = std::move(*resolved);

    std::string outbound = std::move(request.body);
    if (message.has_value() && interceptors_ != nullptr && interceptors_->empty() == false) {
        InterceptContext context{session.id, HistoryDirection::ClientToUpstream,
                                 upstream.dispatcher->kind(), std::nullopt};
        ChainVerdict verdict = co_await interceptors_->run(*message, std::move(context));
        if (verdict.blocked()) {
            get_logger().info_fmt("{} from session {} blocked by {}: {}",
                message->method(), session.id, verdict.decided_by, verdict.reason);
            if (origin_id.has_value() == false) {
                co_return ProxyReply{202, client_headers(session, {}), {}};
            }
            ProxyReply reply = rpc_failure(200, origin_id, rpc_error::kBlockedByPolicy, verdict.reason);
            set_header(reply.headers, header::kSessionId, session.id);
            co_return reply;
        }
        if (verdict.modified) {
            outbound = verdict.message.serialize();
        }
    }

    co_await record_history(session.id, HistoryDirection::ClientToUpstream, outbound);

    UpstreamRequest upstream_request;
    upstream_request.method = HttpMethod::Post;
    upstream_request.headers = upstream_headers(session);
    set_header(upstream_request.headers, header::kContentType, std::string(kJsonContentType));
    set_header(upstream_request.headers, header::kAccept, "application/json, text/event-stream");
    upstream_request.body = std::move(outbound);

    auto response = co_await upstream.dispatcher->async_dispatch(std::move(upstream_request));
    if (response.has_value() == false) {
        get_logger().warn_fmt("upstream {} unavailable for session {}: {}",
            upstream.name, session.id, response.error().message);
        ProxyReply reply = rpc_failure(502, origin_id, rpc_error::kUpstreamUnavailable,
            "upstream unavailable: " + response.error().message);
        set_header(reply.headers, header::kSessionId, session.id);
        co_return reply;
    }

    RoutedResponse routed = ResponseClassifier::classify(std::move(*response));
    co_return co_await route(std::move(session), std::move(upstream), std::move(routed), std::move(origin_id));
}

asio::awaitable<ProxyResponse> ProxyEngine::handle_get(ClientRequest request) {
    if (accepts_event_stream(request.headers) == false) {
        co_return rpc_failure(406, std::nullopt, rpc_error::kInvalidRequest,
            "GET requires Accept: text/event-stream");
    }

    UpstreamEndpoint upstream = upstreams_->select();
    auto resolved = co_await resolve_session(request, upstream, false);
    if (resolved.has_value() == false) {
        co_return std::move(resolved.error());
    }
    Session session = std::move(*resolved);

    std::optional<std::string> marker = get_header(request.headers, header::kLastEventId);
    if (marker.has_value() == false) {
        auto stored = co_await store_->get_last_event_id(session.id);
        if (stored.has_value()) {
            marker = std::move(*stored);
        } else {
            get_logger().warn_fmt("no stored position for session {} ({}), streaming from live",
                session.id, stored.error().message);
        }
    }

    auto tracker = trackers_.acquire(session.id);
    if (marker.has_value() && tracker->contains(*marker) == false) {
        tracker->seed(*marker);
    }

    UpstreamRequest upstream_request;
    upstream_request.method = HttpMethod::Get;
    upstream_request.headers = upstream_headers(session);
    set_header(upstream_request.headers, header::kAccept, std::string(kEventStreamContentType));
    if (marker.has_value()) {
        set_header(upstream_request.headers, header::kLastEventId, *marker);
    }

    auto response = co_await upstream.dispatcher->async_dispatch(std::move(upstream_request));
    if (response.has_value() == false) {
        get_logger().warn_fmt("upstream {} unavailable for stream of session {}: {}",
            upstream.name, session.id, response.error().message);
        ProxyReply reply = rpc_failure(502, std::nullopt, rpc_error::kUpstreamUnavailable,
            "upstream unavailable: " + response.error().message);
        set_header(reply.headers, header::kSessionId, session.id);
        co_return reply;
    }

    RoutedResponse routed = ResponseClassifier::classify(std::move(*response));
    co_return co_await route(std::move(session), std::move(upstream), std::move(routed), std::nullopt);
}

asio::awaitable<ProxyResponse> ProxyEngine::handle_delete(ClientRequest request) {
    const auto session_id = get_header(request.headers, header::kSessionId);
    if (session_id.has_value() == false) {
        co_return rpc_failure(400, std::nullopt, rpc_error::kInvalidRequest, "missing Mcp-Session-Id header");
    }

    auto terminated = co_await terminate_session(*session_id);
    if (terminated.has_value()) {
        co_return ProxyReply{200, HeaderMap{}, {}};
    }
    if (terminated.error().code == StoreError::Code::NotFound) {
        co_return rpc_failure(404, std::nullopt, rpc_error::kInvalidRequest, "unknown session");
    }
    co_return rpc_failure(503, std::nullopt, rpc_error::kInternalError, terminated.error().message);
}

// ─────────────────────────────────────────────────────────────────────────────
// Sessions
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<tl::expected<Session, ProxyReply>> ProxyEngine::resolve_session(
    const ClientRequest& request, const UpstreamEndpoint& upstream, bool allow_create)
{
    const auto now = std::chrono::system_clock::now();
    const auto requested = get_header(request.headers, header::kSessionId);

    if (requested.has_value()) {
        if (is_valid_session_id(*requested) == false) {
            co_return tl::unexpected(rpc_failure(400, std::nullopt, rpc_error::kInvalidRequest, "malformed session id"));
        }
        auto existing = co_await store_->get_session(*requested);
        if (existing.has_value()) {
            co_return std::move(*existing);
        }
        if (existing.error().code == StoreError::Code::NotFound) {
            co_return tl::unexpected(rpc_failure(404, std::nullopt, rpc_error::kInvalidRequest, "unknown session"));
        }

        // Store trouble: keep serving the session without its stored state.
        get_logger().warn_fmt("session store unavailable for {}: {}", *requested, existing.error().message);
        Session transient;
        transient.id = *requested;
        transient.client_transport = request.client_transport;
        transient.upstream_transport = upstream.dispatcher->kind();
        transient.protocol_version = get_header(request.headers, header::kProtocolVersion)
            .value_or(config_.default_protocol_version);
        transient.created_at = now;
        transient.last_activity = now;
        co_return transient;
    }

    if (allow_create == false) {
        co_return tl::unexpected(rpc_failure(400, std::nullopt, rpc_error::kInvalidRequest, "missing Mcp-Session-Id header"));
    }

    Session session;
    session.id = generate_session_id();
    session.client_transport = request.client_transport;
    session.upstream_transport = upstream.dispatcher->kind();
    session.protocol_version = get_header(request.headers, header::kProtocolVersion)
        .value_or(config_.default_protocol_version);
    session.created_at = now;
    session.last_activity = now;

    auto created = co_await store_->create_session(session);
    if (created.has_value() == false) {
        get_logger().warn_fmt("could not persist new session {}: {}", session.id, created.error().message);
    } else {
        get_logger().info_fmt("session {} created ({} -> {} via {})", session.id,
            to_string(session.client_transport), to_string(session.upstream_transport), upstream.name);
    }
    co_return session;
}

asio::awaitable<void> ProxyEngine::touch_session(std::string session_id, std::optional<std::string> upstream_session_id) {
    auto current = co_await store_->get_session(session_id);
    if (current.has_value() == false) {
        get_logger().debug_fmt("cannot refresh session {}: {}", session_id, current.error().message);
        co_return;
    }

    Session session = std::move(*current);
    session.last_activity = std::chrono::system_clock::now();
    if (session.upstream_session_id.has_value() == false && upstream_session_id.has_value()) {
        session.upstream_session_id = std::move(upstream_session_id);
    }

    auto updated = co_await store_->update_session(std::move(session));
    if (updated.has_value() == false) {
        get_logger().warn_fmt("could not refresh session {}: {}", session_id, updated.error().message);
    }
}

asio::awaitable<void> ProxyEngine::record_history(const std::string& session_id,
                                                 HistoryDirection direction, std::string payload) {
    if (config_.write_behind.record_history == false) {
        co_return;
    }
    HistoryEntry entry;
    entry.direction = direction;
    entry.payload = std::move(payload);
    entry.recorded_at = std::chrono::system_clock::now();

    auto appended = co_await store_->append_history(session_id, std::move(entry));
    if (appended.has_value() == false) {
        get_logger().debug_fmt("history for session {} not recorded: {}", session_id, appended.error().message);
    }
}

asio::awaitable<StoreResult<void>> ProxyEngine::terminate_session(std::string session_id) {
    stop_tasks(session_id);
    trackers_.remove(session_id);

    auto existing = co_await store_->get_session(session_id);
    if (existing.has_value() && existing->upstream_session_id.has_value()) {
        UpstreamEndpoint upstream = upstreams_->select();
        UpstreamRequest goodbye;
        goodbye.method = HttpMethod::Delete;
        goodbye.headers = upstream_headers(*existing);

        auto response = co_await upstream.dispatcher->async_dispatch(std::move(goodbye));
        if (response.has_value() == false) {
            get_logger().warn_fmt("upstream DELETE for session {} failed: {}", session_id, response.error().message);
        } else {
            response->body->cancel();
        }
    }

    auto deleted = co_await store_->delete_session(session_id);
    if (deleted.has_value()) {
        get_logger().info_fmt("session {} terminated", session_id);
    }
    co_return deleted;
}

// ─────────────────────────────────────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<ProxyResponse> ProxyEngine::route(
    Session session,
    UpstreamEndpoint upstream,
    RoutedResponse routed,
    std::optional<JsonRpcId> origin_id)
{
    const UpstreamResponseMeta& meta = std::visit(
        [](const auto& alternative) -> const UpstreamResponseMeta& { return alternative.meta; }, routed);

    get_logger().debug_fmt("session {}: upstream answered {} ({})",
        session.id, meta.status_code, to_string(meta.category));

    std::optional<std::string> adopted;
    if (meta.upstream_session_id.has_value() && session.upstream_session_id.has_value() == false) {
        session.upstream_session_id = meta.upstream_session_id;
        adopted = meta.upstream_session_id;
    } else if (meta.upstream_session_id.has_value() && meta.upstream_session_id != session.upstream_session_id) {
        get_logger().warn_fmt("upstream asserted session {} for {}, keeping {}",
            *meta.upstream_session_id, session.id, *session.upstream_session_id);
    }
    if (adopted.has_value()) {
        co_await touch_session(session.id, std::move(adopted));
    }

    if (auto* reply = std::get_if<SingleReplyResponse>(&routed)) {
        co_return co_await buffer_reply(session, std::move(*reply), std::move(origin_id));
    }
    if (auto* stream = std::get_if<EventStreamResponse>(&routed)) {
        co_return start_stream(session, upstream, std::move(*stream), std::move(origin_id));
    }
    co_return start_pass_through(session, std::get<PassThroughResponse>(std::move(routed)));
}

asio::awaitable<ProxyResponse> ProxyEngine::buffer_reply(
    const Session& session, SingleReplyResponse reply, std::optional<JsonRpcId> origin_id)
{
    const auto& meta = reply.meta;
    if (meta.content_length.has_value() && *meta.content_length > config_.max_reply_bytes) {
        reply.body->cancel();
        get_logger().warn_fmt("refusing {} byte reply for session {} (limit {})",
            *meta.content_length, session.id, config_.max_reply_bytes);
        ProxyReply refused = rpc_failure(502, origin_id, rpc_error::kReplyTooLarge, "upstream reply too large");
        set_header(refused.headers, header::kSessionId, session.id);
        co_return refused;
    }

    auto body = co_await read_body(*reply.body, config_.max_reply_bytes);
    if (body.has_value() == false) {
        const bool too_large = body.error().category == TransportError::Category::Protocol;
        get_logger().warn_fmt("reply for session {} not relayed: {}", session.id, body.error().message);
        ProxyReply failed = too_large
            ? rpc_failure(502, origin_id, rpc_error::kReplyTooLarge, "upstream reply too large")
            : rpc_failure(502, origin_id, rpc_error::kUpstreamUnavailable, "upstream reply failed: " + body.error().message);
        set_header(failed.headers, header::kSessionId, session.id);
        co_return failed;
    }

    std::string payload = std::move(*body);
    if (interceptors_ != nullptr && interceptors_->empty() == false) {
        auto message = ProtocolMessage::parse(payload);
        if (message.has_value()) {
            InterceptContext context{session.id, HistoryDirection::UpstreamToClient,
                                     session.upstream_transport, std::nullopt};
            ChainVerdict verdict = co_await interceptors_->run(std::move(*message), std::move(context));
            if (verdict.blocked()) {
                get_logger().info_fmt("reply for session {} blocked by {}: {}",
                    session.id, verdict.decided_by, verdict.reason);
                ProxyReply blocked = rpc_failure(200, origin_id, rpc_error::kBlockedByPolicy, verdict.reason);
                set_header(blocked.headers, header::kSessionId, session.id);
                co_return blocked;
            }
            if (verdict.modified) {
                payload = verdict.message.serialize();
            }
        }
    }

    co_await record_history(session.id, HistoryDirection::UpstreamToClient, payload);
    co_await touch_session(session.id, std::nullopt);

    const std::string content_type = get_header(reply.headers, header::kContentType)
        .value_or(std::string(kJsonContentType));
    co_return ProxyReply{meta.status_code, client_headers(session, content_type), std::move(payload)};
}

ProxyResponse ProxyEngine::start_stream(
    const Session& session,
    const UpstreamEndpoint& upstream,
    EventStreamResponse stream,
    std::optional<JsonRpcId> origin_id)
{
    auto sink = std::make_shared<EventSink>(executor_, config_.client_channel_capacity);
    auto reconnection = std::make_shared<ReconnectionManager>(
        upstream.dispatcher, upstream_headers(session), config_.reconnect);
    auto writer = std::make_shared<WriteBehindWriter>(executor_, store_, session.id, config_.write_behind);

    StreamPipelineConfig pipeline_config;
    pipeline_config.parser = config_.parser;
    pipeline_config.termination_event_type = config_.termination_event_type;
    pipeline_config.upstream_transport = upstream.dispatcher->kind();

    auto pipeline = std::make_shared<StreamPipeline>(
        executor_, session.id, std::move(origin_id),
        StreamPipeline::Dependencies{sink, trackers_.acquire(session.id), reconnection, interceptors_, writer},
        std::move(pipeline_config));

    const int status = stream.meta.status_code;
    const auto key = register_task(session.id, [pipeline] { pipeline->stop(); });
    launch(key, drive_pipeline(pipeline, std::move(stream)));

    return ProxyStream{status, client_headers(session, kEventStreamContentType), std::move(sink)};
}

ProxyResponse ProxyEngine::start_pass_through(const Session& session, PassThroughResponse response) {
    auto sink = std::make_shared<ByteSink>(executor_, config_.passthrough_channel_capacity);
    std::shared_ptr<IBodySource> body = std::move(response.body);

    HeaderMap headers = std::move(response.headers);
    strip_hop_by_hop_headers(headers);
    set_header(headers, header::kSessionId, session.id);

    const int status = response.meta.status_code;
    const auto key = register_task(session.id, [body, sink] {
        body->cancel();
        sink->close();
    });
    launch(key, relay_bytes(body, sink));

    return ProxyPassThrough{status, std::move(headers), std::move(sink)};
}

HeaderMap ProxyEngine::upstream_headers(const Session& session) const {
    HeaderMap headers;
    set_header(headers, header::kProtocolVersion, session.protocol_version);
    if (session.upstream_session_id.has_value()) {
        set_header(headers, header::kSessionId, *session.upstream_session_id);
    }
    return headers;
}

HeaderMap ProxyEngine::client_headers(const Session& session, std::string_view content_type) const {
    HeaderMap headers;
    set_header(headers, header::kSessionId, session.id);
    if (content_type.empty() == false) {
        set_header(headers, header::kContentType, std::string(content_type));
    }
    return headers;
}

// ─────────────────────────────────────────────────────────────────────────────
// Task tracking
// ─────────────────────────────────────────────────────────────────────────────

std::uint64_t ProxyEngine::register_task(std::string session_id, std::function<void()> stop) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    const std::uint64_t key = next_task_key_++;
    tasks_.emplace(key, ActiveTask{std::move(session_id), std::move(stop)});
    return key;
}

void ProxyEngine::release_task(std::uint64_t key) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    tasks_.erase(key);
    if (draining_ && tasks_.empty()) {
        static_cast<void>(drained_.try_send(asio::error_code{}));
    }
}

void ProxyEngine::stop_tasks(const std::optional<std::string>& session_id) {
    std::vector<std::function<void()>> stops;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        for (const auto& [key, task] : tasks_) {
            if (session_id.has_value() == false || task.session_id == *session_id) {
                stops.push_back(task.stop);
            }
        }
    }
    for (const auto& stop : stops) {
        stop();
    }
}

void ProxyEngine::launch(std::uint64_t key, asio::awaitable<void> task) {
    asio::co_spawn(executor_, std::move(task), [this, key](std::exception_ptr error) {
        if (error) {
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                get_logger().error_fmt("stream task failed: {}", e.what());
            }
        }
        release_task(key);
    });
}

std::size_t ProxyEngine::active_streams() const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    return tasks_.size();
}

// ─────────────────────────────────────────────────────────────────────────────
// Maintenance and shutdown
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<std::size_t> ProxyEngine::run_maintenance() {
    const auto cutoff = std::chrono::system_clock::now() - config_.session_idle_timeout;
    auto removed = co_await store_->remove_idle_sessions(cutoff);
    if (removed.has_value() == false) {
        get_logger().warn_fmt("idle session sweep failed: {}", removed.error().message);
        co_return 0;
    }
    for (const auto& session_id : *removed) {
        trackers_.remove(session_id);
    }
    co_return removed->size();
}

asio::awaitable<void> ProxyEngine::sweep_loop() {
    asio::steady_timer timer(executor_);
    while (shutting_down_.load() == false) {
        timer.expires_after(config_.session_sweep_interval);
        co_await timer.async_wait(asio::use_awaitable);
        const std::size_t expired = co_await run_maintenance();
        if (expired > 0) {
            get_logger().debug_fmt("sweep expired {} session(s)", expired);
        }
    }
}

asio::awaitable<void> ProxyEngine::maintenance_loop() {
    co_await (sweep_loop() || maintenance_stop_.async_receive(asio::as_tuple(asio::use_awaitable)));
}

asio::awaitable<void> ProxyEngine::shutdown(std::chrono::milliseconds grace) {
    if (shutting_down_.exchange(true)) {
        co_return;
    }
    static_cast<void>(maintenance_stop_.try_send(asio::error_code{}));

    std::size_t open = 0;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        draining_ = true;
        open = tasks_.size();
    }
    if (open == 0) {
        MCPX_LOG_INFO("proxy shut down, no open streams");
        co_return;
    }

    get_logger().info_fmt("draining {} open stream(s) for up to {}ms", open, grace.count());
    asio::steady_timer timer(executor_, grace);
    co_await (drained_.async_receive(asio::as_tuple(asio::use_awaitable)) ||
              timer.async_wait(asio::as_tuple(asio::use_awaitable)));

    open = active_streams();
    if (open == 0) {
        MCPX_LOG_INFO("all streams drained");
        co_return;
    }

    get_logger().warn_fmt("stopping {} stream(s) still open after the grace period", open);
    stop_tasks(std::nullopt);
    timer.expires_after(kForcedStopWait);
    co_await (drained_.async_receive(asio::as_tuple(asio::use_awaitable)) ||
              timer.async_wait(asio::as_tuple(asio::use_awaitable)));
}

}  // namespace mcpx
