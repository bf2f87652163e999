// ─────────────────────────────────────────────────────────────────────────────
// HttpUpstreamDispatcher Tests
// ─────────────────────────────────────────────────────────────────────────────
// Only construction, connection failures and a listener that never answers
// are covered here. Streaming behaviour is exercised through ScriptedUpstream.

#include <catch2/catch_test_macros.hpp>

#include "mcpx/upstream/http_upstream.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <asio/ip/tcp.hpp>

using namespace mcpx;
using namespace mcpx::testing;

TEST_CASE("HTTP upstream rejects URLs it cannot use", "[http]") {
    asio::io_context io;

    SECTION("not a URL") {
        HttpUpstreamConfig config;
        config.url = "not a url";
        REQUIRE_THROWS_AS(HttpUpstreamDispatcher(io.get_executor(), config), std::invalid_argument);
    }

    SECTION("unsupported scheme") {
        HttpUpstreamConfig config;
        config.url = "ftp://example.com/mcp";
        REQUIRE_THROWS_AS(HttpUpstreamDispatcher(io.get_executor(), config), std::invalid_argument);
    }

    SECTION("http and https are accepted") {
        HttpUpstreamConfig config;
        config.url = "https://mcp.example.com/mcp";
        HttpUpstreamDispatcher upstream(io.get_executor(), config);
        REQUIRE(upstream.kind() == TransportKind::StreamableHttp);
        REQUIRE(upstream.config().verify_ssl);
    }
}

TEST_CASE("HTTP upstream reports a refused connection as a network error", "[http]") {
    asio::io_context io;
    HttpUpstreamConfig config;
    config.url = "http://127.0.0.1:1/mcp";
    config.connect_timeout = std::chrono::seconds(2);
    config.worker_count = 1;
    HttpUpstreamDispatcher upstream(io.get_executor(), config);

    UpstreamRequest request;
    request.method = HttpMethod::Post;
    request.body = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
    set_header(request.headers, header::kContentType, "application/json");

    auto response = run_sync(io, upstream.async_dispatch(std::move(request)));

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().category != TransportError::Category::Cancelled);
}

TEST_CASE("HTTP upstream gives up on a server that never sends headers", "[http]") {
    asio::io_context io;

    // Connections complete in the listen backlog; nothing ever reads them.
    asio::ip::tcp::acceptor listener(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    const auto port = listener.local_endpoint().port();

    HttpUpstreamConfig config;
    config.url = "http://127.0.0.1:" + std::to_string(port) + "/mcp";
    config.response_timeout = std::chrono::milliseconds(200);
    config.worker_count = 1;
    HttpUpstreamDispatcher upstream(io.get_executor(), config);

    UpstreamRequest request;
    request.method = HttpMethod::Get;
    set_header(request.headers, header::kAccept, "text/event-stream");

    const auto started = std::chrono::steady_clock::now();
    auto response = run_sync(io, upstream.async_dispatch(std::move(request)));
    const auto waited = std::chrono::steady_clock::now() - started;

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().category == TransportError::Category::Timeout);
    REQUIRE(waited < std::chrono::seconds(5));
}
