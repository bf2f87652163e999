#include "mcpx/upstream/http_upstream.hpp"

#include "mcpx/log/logger.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <system_error>

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>

namespace mcpx {

using namespace asio::experimental::awaitable_operators;

namespace detail {

struct ResponseHead {
    int status_code{0};
    HeaderMap headers;
};

// ─────────────────────────────────────────────────────────────────────────────
// HttpExchange
// ─────────────────────────────────────────────────────────────────────────────
// State shared between the worker running one cpr transfer and the coroutine
// side (dispatch, then body reads). The status/header fields are touched by
// the worker only; everything crossing threads goes through the channels.

class HttpExchange {
public:
    using HeadChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, TransportResult<ResponseHead>)>;
    using BodyChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, std::string)>;

    HttpExchange(const asio::any_io_executor& executor, std::size_t body_capacity)
        : head(executor, 1)
        , body(executor, body_capacity == 0 ? 1 : body_capacity)
    {}

    void cancel() {
        if (cancelled.exchange(true)) {
            return;
        }
        head.close();
        body.close();
    }

    void set_failure(std::string message) {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        failure_ = std::move(message);
    }

    [[nodiscard]] std::string failure() const {
        std::lock_guard<std::mutex> lock(failure_mutex_);
        return failure_;
    }

    HeadChannel head;
    BodyChannel body;
    std::atomic<bool> cancelled{false};

    // Worker-side parse state.
    int status_code{0};
    HeaderMap headers;
    bool head_sent{false};

private:
    mutable std::mutex failure_mutex_;
    std::string failure_;
};

}  // namespace detail

namespace {

using detail::HttpExchange;
using detail::ResponseHead;

// ─────────────────────────────────────────────────────────────────────────────
// HttpBodySource
// ─────────────────────────────────────────────────────────────────────────────

class HttpBodySource final : public IBodySource {
public:
    explicit HttpBodySource(std::shared_ptr<HttpExchange> exchange)
        : exchange_(std::move(exchange)) {}

    ~HttpBodySource() override { cancel(); }

    asio::awaitable<TransportResult<std::optional<std::string>>> async_read_some() override {
        if (exchange_->cancelled.load()) {
            co_return tl::unexpected(TransportError::cancelled());
        }

        auto [ec, chunk] = co_await exchange_->body.async_receive(asio::as_tuple(asio::use_awaitable));
        if (!ec) {
            co_return std::optional<std::string>{std::move(chunk)};
        }
        if (ec == asio::error::eof) {
            co_return std::optional<std::string>{};
        }
        if (exchange_->cancelled.load()) {
            co_return tl::unexpected(TransportError::cancelled());
        }
        co_return tl::unexpected(TransportError::network(exchange_->failure()));
    }

    void cancel() noexcept override {
        exchange_->cancel();
    }

private:
    std::shared_ptr<HttpExchange> exchange_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Worker-side callbacks
// ─────────────────────────────────────────────────────────────────────────────

std::string_view trim(std::string_view text) {
    while (text.empty() == false && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (text.empty() == false &&
           (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    return text;
}

void deliver_head(HttpExchange& exchange) {
    if (exchange.head_sent) {
        return;
    }
    exchange.head_sent = true;
    static_cast<void>(exchange.head.try_send(
        asio::error_code{},
        TransportResult<ResponseHead>{ResponseHead{exchange.status_code, std::move(exchange.headers)}}));
}

bool on_header_line(HttpExchange& exchange, std::string_view raw) {
    if (exchange.cancelled.load()) {
        return false;
    }

    const std::string_view line = trim(raw);
    if (line.starts_with("HTTP/")) {
        // A new status line (after a 1xx) restarts the header block.
        exchange.headers.clear();
        const auto space = line.find(' ');
        if (space != std::string_view::npos) {
            const auto code = line.substr(space + 1, 3);
            int status = 0;
            std::from_chars(code.data(), code.data() + code.size(), status);
            exchange.status_code = status;
        }
        return true;
    }

    if (line.empty()) {
        if (exchange.status_code >= 200) {
            deliver_head(exchange);
        }
        return true;
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return true;
    }
    const std::string name(trim(line.substr(0, colon)));
    std::string value(trim(line.substr(colon + 1)));

    const auto existing = find_header(exchange.headers, name);
    if (existing != exchange.headers.end()) {
        exchange.headers[existing->first] += ", " + value;
    } else {
        exchange.headers.emplace(name, std::move(value));
    }
    return true;
}

/// Blocks the worker while the body channel is full. Returning false makes
/// libcurl abort the transfer.
bool on_body_chunk(HttpExchange& exchange, std::string_view data) {
    if (exchange.cancelled.load()) {
        return false;
    }
    deliver_head(exchange);
    try {
        exchange.body.async_send(asio::error_code{}, std::string(data), asio::use_future).get();
    } catch (const std::system_error&) {
        MCPX_LOG_DEBUG("upstream body reader went away, aborting transfer");
        return false;
    }
    return true;
}

void end_body(HttpExchange& exchange, asio::error_code reason) {
    try {
        exchange.body.async_send(reason, std::string{}, asio::use_future).get();
    } catch (const std::system_error& e) {
        get_logger().debug_fmt("upstream body closed before end of transfer: {}", e.what());
    }
}

TransportError map_error(const cpr::Error& error, bool cancelled) {
    if (cancelled) {
        return TransportError::cancelled();
    }
    if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        return TransportError::timeout(error.message);
    }
    return TransportError::network(error.message);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// HttpUpstreamDispatcher
// ─────────────────────────────────────────────────────────────────────────────

HttpUpstreamDispatcher::HttpUpstreamDispatcher(asio::any_io_executor executor, HttpUpstreamConfig config)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , workers_(config_.worker_count == 0 ? 1 : config_.worker_count)
{
    if (parse_url(config_.url).has_value() == false) {
        throw std::invalid_argument("Invalid upstream url: " + config_.url);
    }
}

HttpUpstreamDispatcher::~HttpUpstreamDispatcher() {
    cancel_all();
    workers_.join();
}

void HttpUpstreamDispatcher::cancel_all() {
    std::vector<std::shared_ptr<detail::HttpExchange>> live;
    {
        std::lock_guard<std::mutex> lock(exchanges_mutex_);
        for (const auto& weak : exchanges_) {
            if (auto exchange = weak.lock()) {
                live.push_back(std::move(exchange));
            }
        }
        exchanges_.clear();
    }
    for (const auto& exchange : live) {
        exchange->cancel();
    }
}

void HttpUpstreamDispatcher::track(const std::shared_ptr<detail::HttpExchange>& exchange) {
    std::lock_guard<std::mutex> lock(exchanges_mutex_);
    std::erase_if(exchanges_, [](const auto& weak) { return weak.expired(); });
    exchanges_.push_back(exchange);
}

asio::awaitable<TransportResult<UpstreamResponse>> HttpUpstreamDispatcher::async_dispatch(UpstreamRequest request) {
    auto exchange = std::make_shared<detail::HttpExchange>(executor_, config_.body_channel_capacity);
    track(exchange);

    const HttpMethod method = request.method;
    asio::post(workers_, [this, exchange, request = std::move(request)]() mutable {
        perform(exchange, std::move(request));
    });

    asio::steady_timer deadline(co_await asio::this_coro::executor, config_.response_timeout);
    auto raced = co_await (
        exchange->head.async_receive(asio::as_tuple(asio::use_awaitable)) ||
        deadline.async_wait(asio::use_awaitable)
    );
    if (raced.index() == 1) {
        exchange->cancel();
        get_logger().warn_fmt("upstream {} {} sent no headers within {}ms",
            to_string(method), config_.url, config_.response_timeout.count());
        co_return tl::unexpected(TransportError::timeout("no response headers from upstream"));
    }

    auto [ec, head] = std::move(std::get<0>(raced));
    if (ec) {
        exchange->cancel();
        co_return tl::unexpected(TransportError::cancelled());
    }
    if (head.has_value() == false) {
        get_logger().warn_fmt("upstream {} {} failed: {}", to_string(method), config_.url, head.error().message);
        co_return tl::unexpected(std::move(head.error()));
    }

    get_logger().debug_fmt("upstream {} {} -> {}", to_string(method), config_.url, head->status_code);
    co_return UpstreamResponse{
        head->status_code,
        std::move(head->headers),
        std::make_unique<HttpBodySource>(std::move(exchange))
    };
}

void HttpUpstreamDispatcher::perform(std::shared_ptr<detail::HttpExchange> exchange, UpstreamRequest request) {
    if (exchange->cancelled.load()) {
        return;
    }

    cpr::Header headers;
    for (const auto& [name, value] : config_.default_headers) {
        headers[name] = value;
    }
    for (const auto& [name, value] : request.headers) {
        headers[name] = value;
    }

    cpr::Session session;
    session.SetUrl(cpr::Url{config_.url});
    session.SetHeader(headers);
    session.SetConnectTimeout(cpr::ConnectTimeout{config_.connect_timeout});
    session.SetVerifySsl(cpr::VerifySsl{config_.verify_ssl});
    session.SetRedirect(cpr::Redirect{false});
    if (request.body.has_value()) {
        session.SetBody(cpr::Body{*request.body});
    }
    session.SetHeaderCallback(cpr::HeaderCallback{
        [exchange](std::string_view line, std::intptr_t) { return on_header_line(*exchange, line); }});
    session.SetWriteCallback(cpr::WriteCallback{
        [exchange](std::string_view data, std::intptr_t) { return on_body_chunk(*exchange, data); }});
    // libcurl polls this about once a second even on a silent connection, so
    // a cancelled exchange frees its worker without waiting for more bytes.
    session.SetProgressCallback(cpr::ProgressCallback{
        [exchange](auto, auto, auto, auto, std::intptr_t) { return exchange->cancelled.load() == false; }});

    cpr::Response response;
    switch (request.method) {
        case HttpMethod::Get:    response = session.Get(); break;
        case HttpMethod::Post:   response = session.Post(); break;
        case HttpMethod::Delete: response = session.Delete(); break;
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        const TransportError error = map_error(response.error, exchange->cancelled.load());
        if (exchange->head_sent == false) {
            exchange->head_sent = true;
            static_cast<void>(exchange->head.try_send(
                asio::error_code{}, TransportResult<ResponseHead>{tl::unexpected(error)}));
            return;
        }
        exchange->set_failure(error.message);
        end_body(*exchange, asio::error::connection_aborted);
        return;
    }

    if (exchange->head_sent == false) {
        if (exchange->status_code == 0) {
            exchange->status_code = static_cast<int>(response.status_code);
        }
        deliver_head(*exchange);
    }
    end_body(*exchange, asio::error::eof);
}

}  // namespace mcpx
