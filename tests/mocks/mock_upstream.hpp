#pragma once

#include "mcpx/proxy/interceptor.hpp"
#include "mcpx/session/memory_session_store.hpp"
#include "mcpx/upstream/upstream_dispatcher.hpp"
#include "mcpx/upstream/upstream_response.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpx::testing {

// ═══════════════════════════════════════════════════════════════════════════
// ScriptedBody
// ═══════════════════════════════════════════════════════════════════════════
// Serves fixed chunks, then ends the way the script says: cleanly, with a
// transport error, or by hanging until cancelled (a stalled connection).

class ScriptedBody final : public IBodySource {
public:
    enum class Ending { Clean, Fail, Hang };

    ScriptedBody(asio::any_io_executor executor, std::vector<std::string> chunks, Ending ending)
        : chunks_(chunks.begin(), chunks.end())
        , ending_(ending)
        , timer_(std::move(executor))
    {}

    asio::awaitable<TransportResult<std::optional<std::string>>> async_read_some() override {
        ++reads_;
        if (cancelled_) {
            co_return tl::unexpected(TransportError::cancelled());
        }
        if (chunks_.empty() == false) {
            std::string chunk = std::move(chunks_.front());
            chunks_.pop_front();
            co_return std::optional<std::string>{std::move(chunk)};
        }
        switch (ending_) {
            case Ending::Clean:
                co_return std::optional<std::string>{};
            case Ending::Fail:
                co_return tl::unexpected(TransportError::network("connection reset by peer"));
            case Ending::Hang:
                break;
        }
        timer_.expires_at(asio::steady_timer::time_point::max());
        co_await timer_.async_wait(asio::as_tuple(asio::use_awaitable));
        co_return tl::unexpected(TransportError::cancelled());
    }

    void cancel() noexcept override {
        cancelled_ = true;
        timer_.cancel();
    }

    [[nodiscard]] std::size_t reads() const noexcept { return reads_; }

private:
    std::deque<std::string> chunks_;
    Ending ending_;
    asio::steady_timer timer_;
    bool cancelled_{false};
    std::size_t reads_{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// Response builders
// ═══════════════════════════════════════════════════════════════════════════

inline UpstreamResponse json_response(int status, std::string body, HeaderMap extra = {}) {
    UpstreamResponse response;
    response.status_code = status;
    response.headers = std::move(extra);
    set_header(response.headers, header::kContentType, "application/json");
    set_header(response.headers, header::kContentLength, std::to_string(body.size()));
    response.body = std::make_unique<MemoryBodySource>(std::move(body));
    return response;
}

inline UpstreamResponse status_response(int status) {
    UpstreamResponse response;
    response.status_code = status;
    response.body = std::make_unique<MemoryBodySource>();
    return response;
}

/// Event-stream response without Content-Length.
inline UpstreamResponse stream_response(
    asio::any_io_executor executor,
    std::vector<std::string> chunks,
    ScriptedBody::Ending ending,
    HeaderMap extra = {})
{
    UpstreamResponse response;
    response.status_code = 200;
    response.headers = std::move(extra);
    set_header(response.headers, header::kContentType, "text/event-stream");
    response.body = std::make_unique<ScriptedBody>(std::move(executor), std::move(chunks), ending);
    return response;
}

/// "id: <id>\ndata: <data>\n\n"
inline std::string sse_record(const std::string& id, const std::string& data,
                              const std::string& type = {}) {
    std::string out;
    if (id.empty() == false) {
        out += "id: " + id + "\n";
    }
    if (type.empty() == false) {
        out += "event: " + type + "\n";
    }
    out += "data: " + data + "\n\n";
    return out;
}

inline std::string notification_json(int n) {
    return R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"progress":)"
        + std::to_string(n) + "}}";
}

// ═══════════════════════════════════════════════════════════════════════════
// ScriptedUpstream
// ═══════════════════════════════════════════════════════════════════════════
// Answers each dispatch with the next scripted responder and records the
// requests it saw. An exhausted script answers with a network error.

class ScriptedUpstream final : public IUpstreamDispatcher {
public:
    using Responder = std::function<TransportResult<UpstreamResponse>(const UpstreamRequest&)>;

    explicit ScriptedUpstream(TransportKind kind = TransportKind::StreamableHttp)
        : kind_(kind) {}

    ScriptedUpstream& then(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(responder));
        return *this;
    }

    /// The next dispatch never answers; it ends only when cancelled.
    ScriptedUpstream& then_hang() {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Responder{});
        return *this;
    }

    ScriptedUpstream& then_fail(std::string message = "connection refused") {
        return then([message](const UpstreamRequest&) -> TransportResult<UpstreamResponse> {
            return tl::unexpected(TransportError::network(message));
        });
    }

    asio::awaitable<TransportResult<UpstreamResponse>> async_dispatch(UpstreamRequest request) override {
        Responder responder;
        bool scripted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            if (script_.empty() == false) {
                responder = std::move(script_.front());
                script_.pop_front();
                scripted = true;
            }
        }
        if (scripted == false) {
            co_return tl::unexpected(TransportError::network("no scripted response"));
        }
        if (responder == nullptr) {
            asio::steady_timer silence(co_await asio::this_coro::executor, asio::steady_timer::time_point::max());
            co_await silence.async_wait(asio::as_tuple(asio::use_awaitable));
            co_return tl::unexpected(TransportError::cancelled());
        }
        co_return responder(request);
    }

    [[nodiscard]] TransportKind kind() const noexcept override { return kind_; }

    [[nodiscard]] std::vector<UpstreamRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return script_.size();
    }

private:
    TransportKind kind_;
    mutable std::mutex mutex_;
    std::deque<Responder> script_;
    std::vector<UpstreamRequest> requests_;
};

// ═══════════════════════════════════════════════════════════════════════════
// FlakyStore
// ═══════════════════════════════════════════════════════════════════════════
// MemorySessionStore whose operations can be made to fail with Unavailable.

class FlakyStore final : public ISessionStore {
public:
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_writes{false};
    std::atomic<int> marker_write_failures{0};  ///< next N set_last_event_id calls fail
    std::atomic<int> marker_writes{0};

    asio::awaitable<StoreResult<void>> create_session(Session session) override {
        if (fail_writes) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.create_session(std::move(session));
    }

    asio::awaitable<StoreResult<Session>> get_session(std::string session_id) override {
        if (fail_reads) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.get_session(std::move(session_id));
    }

    asio::awaitable<StoreResult<void>> update_session(Session session) override {
        if (fail_writes) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.update_session(std::move(session));
    }

    asio::awaitable<StoreResult<void>> delete_session(std::string session_id) override {
        if (fail_writes) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.delete_session(std::move(session_id));
    }

    asio::awaitable<StoreResult<std::uint64_t>> append_history(
        std::string session_id, HistoryEntry entry) override {
        if (fail_writes) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.append_history(std::move(session_id), std::move(entry));
    }

    asio::awaitable<StoreResult<std::vector<HistoryEntry>>> list_history(
        std::string session_id, std::size_t limit) override {
        if (fail_reads) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.list_history(std::move(session_id), limit);
    }

    asio::awaitable<StoreResult<void>> delete_history(std::string session_id) override {
        if (fail_writes) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.delete_history(std::move(session_id));
    }

    asio::awaitable<StoreResult<std::optional<std::string>>> get_last_event_id(
        std::string session_id) override {
        if (fail_reads) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.get_last_event_id(std::move(session_id));
    }

    asio::awaitable<StoreResult<void>> set_last_event_id(
        std::string session_id, std::optional<std::string> event_id) override {
        ++marker_writes;
        if (fail_writes) co_return tl::unexpected(StoreError::unavailable("store offline"));
        if (marker_write_failures.load() > 0) {
            --marker_write_failures;
            co_return tl::unexpected(StoreError::unavailable("store timed out"));
        }
        co_return co_await inner_.set_last_event_id(std::move(session_id), std::move(event_id));
    }

    asio::awaitable<StoreResult<std::unordered_map<std::string, Session>>> get_sessions(
        std::vector<std::string> session_ids) override {
        if (fail_reads) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.get_sessions(std::move(session_ids));
    }

    asio::awaitable<std::vector<StoreResult<void>>> update_sessions(std::vector<Session> sessions) override {
        if (fail_writes) {
            co_return std::vector<StoreResult<void>>(
                sessions.size(), tl::unexpected(StoreError::unavailable("store offline")));
        }
        co_return co_await inner_.update_sessions(std::move(sessions));
    }

    asio::awaitable<StoreResult<std::vector<std::string>>> remove_idle_sessions(
        std::chrono::system_clock::time_point cutoff) override {
        if (fail_writes) co_return tl::unexpected(StoreError::unavailable("store offline"));
        co_return co_await inner_.remove_idle_sessions(cutoff);
    }

    [[nodiscard]] MemorySessionStore& inner() noexcept { return inner_; }

private:
    MemorySessionStore inner_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Interceptors
// ═══════════════════════════════════════════════════════════════════════════

/// Decides with a plain function and records every message it was shown.
class FunctionInterceptor final : public IInterceptor {
public:
    using Decide = std::function<InterceptAction(const ProtocolMessage&, const InterceptContext&)>;

    FunctionInterceptor(std::string name, Decide decide)
        : name_(std::move(name)), decide_(std::move(decide)) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    asio::awaitable<InterceptAction> process(
        const ProtocolMessage& message, const InterceptContext& context) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.push_back(message.serialize());
            contexts_.push_back(context);
        }
        co_return decide_(message, context);
    }

    [[nodiscard]] std::vector<std::string> seen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }

    [[nodiscard]] std::vector<InterceptContext> contexts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contexts_;
    }

private:
    std::string name_;
    Decide decide_;
    mutable std::mutex mutex_;
    std::vector<std::string> seen_;
    std::vector<InterceptContext> contexts_;
};

/// Blocks requests for one method and everything whose payload holds `needle`.
inline std::shared_ptr<FunctionInterceptor> make_blocker(std::string method, std::string needle = {}) {
    return std::make_shared<FunctionInterceptor>("blocker",
        [method = std::move(method), needle = std::move(needle)](
            const ProtocolMessage& message, const InterceptContext&) -> InterceptAction {
            if (message.method() == method) {
                return BlockAction{"method " + method + " is not allowed"};
            }
            if (needle.empty() == false && message.serialize().find(needle) != std::string::npos) {
                return BlockAction{"payload matched deny rule"};
            }
            return ContinueAction{};
        });
}

class SlowInterceptor final : public IInterceptor {
public:
    explicit SlowInterceptor(std::chrono::milliseconds delay) : delay_(delay) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "slow"; }

    asio::awaitable<InterceptAction> process(const ProtocolMessage&, const InterceptContext&) override {
        asio::steady_timer timer(co_await asio::this_coro::executor, delay_);
        co_await timer.async_wait(asio::use_awaitable);
        co_return BlockAction{"too late to matter"};
    }

private:
    std::chrono::milliseconds delay_;
};

class ThrowingInterceptor final : public IInterceptor {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "throwing"; }

    asio::awaitable<InterceptAction> process(const ProtocolMessage&, const InterceptContext&) override {
        throw std::runtime_error("rule engine crashed");
        co_return ContinueAction{};
    }
};

}  // namespace mcpx::testing
