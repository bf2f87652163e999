#pragma once

#include "mcpx/transport/http_types.hpp"
#include "mcpx/upstream/upstream_dispatcher.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/thread_pool.hpp>

namespace mcpx {

struct HttpUpstreamConfig {
    /// Full MCP endpoint, e.g. "https://mcp.example.com/mcp".
    std::string url;

    /// Sent with every request; per-request headers win on conflict.
    HeaderMap default_headers;

    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};

    /// Upper bound on the wait for the status line and headers. Bodies are
    /// not covered: event streams stay open as long as they deliver.
    std::chrono::milliseconds response_timeout{std::chrono::seconds(30)};
    bool verify_ssl{true};

    /// Body chunks buffered between the transfer and its reader. A full
    /// channel stalls the transfer until the reader catches up.
    std::size_t body_channel_capacity{16};

    /// Concurrent transfers. Each open event stream holds one worker; a
    /// cancelled transfer gives its worker back within about a second.
    std::size_t worker_count{8};
};

namespace detail {
class HttpExchange;
}  // namespace detail

// ─────────────────────────────────────────────────────────────────────────────
// HttpUpstreamDispatcher
// ─────────────────────────────────────────────────────────────────────────────
// Streamable HTTP upstream over cpr. Each transfer runs on a worker of an
// internal thread pool; status and headers are handed to the awaiting
// coroutine as soon as the header block ends, and body bytes follow through
// a bounded channel read by the IBodySource in the response.

class HttpUpstreamDispatcher final : public IUpstreamDispatcher {
public:
    /// Throws std::invalid_argument if the URL is not an http(s) URL.
    HttpUpstreamDispatcher(asio::any_io_executor executor, HttpUpstreamConfig config);
    ~HttpUpstreamDispatcher() override;

    HttpUpstreamDispatcher(const HttpUpstreamDispatcher&) = delete;
    HttpUpstreamDispatcher& operator=(const HttpUpstreamDispatcher&) = delete;

    asio::awaitable<TransportResult<UpstreamResponse>> async_dispatch(UpstreamRequest request) override;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::StreamableHttp; }

    [[nodiscard]] const HttpUpstreamConfig& config() const noexcept { return config_; }

    /// Abort every transfer still running.
    void cancel_all();

private:
    void perform(std::shared_ptr<detail::HttpExchange> exchange, UpstreamRequest request);
    void track(const std::shared_ptr<detail::HttpExchange>& exchange);

    asio::any_io_executor executor_;
    HttpUpstreamConfig config_;
    asio::thread_pool workers_;

    std::mutex exchanges_mutex_;
    std::vector<std::weak_ptr<detail::HttpExchange>> exchanges_;
};

}  // namespace mcpx
