// ─────────────────────────────────────────────────────────────────────────────
// mcpx-proxy - MCP reverse proxy front end
// ─────────────────────────────────────────────────────────────────────────────
// Bridges a client speaking line-delimited JSON-RPC on stdin/stdout to one
// upstream MCP server, through the proxy engine (sessions, interception,
// resumable streams).
//
// Usage:
//   # Streamable HTTP upstream
//   mcpx-proxy --upstream-url "https://mcp.example.com/mcp" \
//              --header "Authorization: Bearer xxx"
//
//   # Local server over stdio
//   mcpx-proxy -c npx -a -y -a @modelcontextprotocol/server-everything
//
// Replies and stream payloads are written to stdout one message per line.
// Logs go to stderr (and optionally a file). SIGINT/SIGTERM or end of input
// drains open streams and exits.

#include <cxxopts.hpp>

#include "mcpx/log/logger.hpp"
#include "mcpx/log/spdlog_logger.hpp"
#include "mcpx/proxy/proxy_engine.hpp"
#include "mcpx/session/memory_session_store.hpp"
#include "mcpx/upstream/http_upstream.hpp"
#include "mcpx/upstream/stdio_upstream.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/read_until.hpp>
#include <asio/signal_set.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <spdlog/common.h>

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

using namespace mcpx;
using namespace asio::experimental::awaitable_operators;

namespace {

constexpr std::size_t kMaxInputLine = 4 * 1024 * 1024;

void print_error(const std::string& message) {
    std::cerr << "mcpx-proxy: " << message << "\n";
}

// Parse header string "Name: Value" into pair
std::pair<std::string, std::string> parse_header(const std::string& header) {
    auto colon_pos = header.find(':');
    if (colon_pos == std::string::npos) {
        return {header, ""};
    }
    std::string name = header.substr(0, colon_pos);
    std::string value = header.substr(colon_pos + 1);
    auto start = value.find_first_not_of(" \t");
    value = (start != std::string::npos) ? value.substr(start) : std::string{};
    return {name, value};
}

void log_task_failure(std::exception_ptr error) {
    if (error == nullptr) {
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        get_logger().error_fmt("task failed: {}", e.what());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Bridge
// ═══════════════════════════════════════════════════════════════════════════
// Every input line becomes a POST through the engine. The first exchange runs
// alone so the session id is known before anything else is sent; later ones
// run concurrently. Output lines funnel through one writer so messages never
// interleave.

class StdioBridge {
public:
    StdioBridge(asio::io_context& io, ProxyEngine& engine, bool open_server_stream)
        : io_(io)
        , engine_(engine)
        , open_server_stream_(open_server_stream)
        , input_(io, ::dup(STDIN_FILENO))
        , output_(io, ::dup(STDOUT_FILENO))
        , out_(io.get_executor(), 64)
    {}

    asio::awaitable<void> read_loop() {
        std::string buffer;
        while (true) {
            auto [ec, n] = co_await asio::async_read_until(
                input_, asio::dynamic_buffer(buffer, kMaxInputLine), '\n',
                asio::as_tuple(asio::use_awaitable));
            if (ec) {
                if (ec != asio::error::eof) {
                    get_logger().warn_fmt("stdin read failed: {}", ec.message());
                }
                break;
            }

            std::string line = buffer.substr(0, n);
            buffer.erase(0, n);
            while (line.empty() == false && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }

            if (session_id_.has_value() == false) {
                co_await forward(std::move(line));
            } else {
                asio::co_spawn(io_, forward(std::move(line)), log_task_failure);
            }
        }
        MCPX_LOG_INFO("client input closed");
    }

    asio::awaitable<void> write_loop() {
        while (true) {
            auto [ec, line] = co_await out_.async_receive(asio::as_tuple(asio::use_awaitable));
            if (ec || line.empty()) {
                co_return;
            }
            auto [write_ec, written] = co_await asio::async_write(
                output_, asio::buffer(line), asio::as_tuple(asio::use_awaitable));
            if (write_ec) {
                get_logger().error_fmt("stdout write failed: {}", write_ec.message());
                co_return;
            }
        }
    }

    /// Lets the writer flush what is queued and exit.
    asio::awaitable<void> finish() {
        co_await out_.async_send(asio::error_code{}, std::string{}, asio::as_tuple(asio::use_awaitable));
    }

private:
    asio::awaitable<void> forward(std::string line) {
        ClientRequest request;
        request.method = HttpMethod::Post;
        request.body = std::move(line);
        request.client_transport = TransportKind::Stdio;
        set_header(request.headers, header::kAccept, "application/json, text/event-stream");
        if (session_id_.has_value()) {
            set_header(request.headers, header::kSessionId, *session_id_);
        }
        co_await deliver(co_await engine_.handle(std::move(request)));
    }

    asio::awaitable<void> listen() {
        ClientRequest request;
        request.method = HttpMethod::Get;
        request.client_transport = TransportKind::Stdio;
        set_header(request.headers, header::kAccept, "text/event-stream");
        set_header(request.headers, header::kSessionId, *session_id_);
        co_await deliver(co_await engine_.handle(std::move(request)));
    }

    void adopt_session(const HeaderMap& headers) {
        if (session_id_.has_value()) {
            return;
        }
        session_id_ = get_header(headers, header::kSessionId);
        if (session_id_.has_value() && open_server_stream_) {
            asio::co_spawn(io_, listen(), log_task_failure);
        }
    }

    asio::awaitable<void> deliver(ProxyResponse response) {
        if (auto* reply = std::get_if<ProxyReply>(&response)) {
            if (is_success_status(reply->status_code)) {
                adopt_session(reply->headers);
            }
            if (reply->body.empty() == false) {
                co_await emit(std::move(reply->body));
            } else if (is_success_status(reply->status_code) == false) {
                get_logger().warn_fmt("upstream answered {} with no body", reply->status_code);
            }
            co_return;
        }

        if (auto* stream = std::get_if<ProxyStream>(&response)) {
            adopt_session(stream->headers);
            while (auto event = co_await stream->events->receive()) {
                if (event->data.empty() == false) {
                    co_await emit(std::move(event->data));
                }
            }
            co_return;
        }

        auto& pass_through = std::get<ProxyPassThrough>(response);
        get_logger().warn_fmt("dropping {} body of type {} that is not JSON-RPC",
            pass_through.status_code,
            get_header(pass_through.headers, header::kContentType).value_or("<none>"));
        pass_through.bytes->close();
    }

    asio::awaitable<void> emit(std::string line) {
        line.push_back('\n');
        co_await out_.async_send(asio::error_code{}, std::move(line), asio::as_tuple(asio::use_awaitable));
    }

    using OutputChannel = asio::experimental::concurrent_channel<void(asio::error_code, std::string)>;

    asio::io_context& io_;
    ProxyEngine& engine_;
    bool open_server_stream_;
    asio::posix::stream_descriptor input_;
    asio::posix::stream_descriptor output_;
    OutputChannel out_;
    std::optional<std::string> session_id_;
};

void install_logger(const std::string& level_name, const std::optional<std::string>& log_file) {
    SpdlogConfig config;
    config.with_level(parse_log_level(level_name).value_or(LogLevel::Info));
    if (log_file.has_value()) {
        config.with_file(*log_file);
    }
    set_logger(make_spdlog_logger(config));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpx-proxy", "MCP reverse proxy");

    options.add_options()
        // Upstream
        ("u,upstream-url", "Streamable HTTP upstream URL", cxxopts::value<std::string>())
        ("c,upstream-command", "Upstream server command (stdio)", cxxopts::value<std::string>())
        ("a,args", "Arguments for the upstream command", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("H,header", "Header sent upstream (repeatable, 'Name: Value')", cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("no-verify-ssl", "Do not verify the upstream TLS certificate")
        ("response-timeout-ms", "Wait this long for upstream response headers", cxxopts::value<long>()->default_value("30000"))

        // Streams
        ("server-stream", "Also open a GET stream for server-initiated messages")
        ("idle-timeout-ms", "Stream idle window before reconnecting", cxxopts::value<long>()->default_value("30000"))
        ("reconnect-attempts", "Reconnection attempt ceiling", cxxopts::value<std::size_t>()->default_value("5"))
        ("recency-window", "Event ids remembered per session", cxxopts::value<std::size_t>()->default_value("1024"))
        ("termination-event", "Event type that ends a stream", cxxopts::value<std::string>()->default_value("end"))

        // Limits
        ("max-reply-bytes", "Largest buffered reply", cxxopts::value<std::size_t>()->default_value("4194304"))
        ("session-idle-minutes", "Expire sessions idle this long", cxxopts::value<long>()->default_value("30"))

        // Logging
        ("log-level", "trace, debug, info, warn, error, off", cxxopts::value<std::string>()->default_value("info"))
        ("log-file", "Also log to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        std::optional<std::string> log_file;
        if (result.count("log-file")) {
            log_file = result["log-file"].as<std::string>();
        }
        install_logger(result["log-level"].as<std::string>(), log_file);

        const bool use_http = result.count("upstream-url") > 0;
        const bool use_stdio = result.count("upstream-command") > 0;
        if (use_http == use_stdio) {
            print_error("Specify exactly one of --upstream-url or --upstream-command");
            return 1;
        }

        ProxyConfig config;
        config.with_max_reply_bytes(result["max-reply-bytes"].as<std::size_t>())
              .with_recency_window(result["recency-window"].as<std::size_t>())
              .with_termination_event_type(result["termination-event"].as<std::string>())
              .with_session_idle_timeout(std::chrono::minutes(result["session-idle-minutes"].as<long>()));
        config.reconnect
              .with_max_attempts(result["reconnect-attempts"].as<std::size_t>())
              .with_idle_timeout(std::chrono::milliseconds(result["idle-timeout-ms"].as<long>()))
              .with_attempt_timeout(std::chrono::milliseconds(result["response-timeout-ms"].as<long>()));

        // A child that exits mid-write must surface as EPIPE, not end the proxy.
        std::signal(SIGPIPE, SIG_IGN);

        asio::io_context io;

        UpstreamEndpoint endpoint;
        std::shared_ptr<StdioUpstreamDispatcher> stdio_upstream;
        if (use_http) {
            HttpUpstreamConfig http;
            http.url = result["upstream-url"].as<std::string>();
            http.verify_ssl = result.count("no-verify-ssl") == 0;
            http.response_timeout = std::chrono::milliseconds(result["response-timeout-ms"].as<long>());
            for (const auto& header : result["header"].as<std::vector<std::string>>()) {
                if (header.empty() == false) {
                    auto [name, value] = parse_header(header);
                    set_header(http.default_headers, name, value);
                }
            }
            endpoint.name = http.url;
            endpoint.dispatcher = std::make_shared<HttpUpstreamDispatcher>(io.get_executor(), std::move(http));
        } else {
            StdioUpstreamConfig stdio;
            stdio.command = result["upstream-command"].as<std::string>();
            for (const auto& arg : result["args"].as<std::vector<std::string>>()) {
                if (arg.empty() == false) {
                    stdio.args.push_back(arg);
                }
            }
            endpoint.name = stdio.command;
            stdio_upstream = std::make_shared<StdioUpstreamDispatcher>(io.get_executor(), std::move(stdio));
            auto started = stdio_upstream->start();
            if (started.has_value() == false) {
                print_error("Failed to start upstream: " + started.error().message);
                return 1;
            }
            endpoint.dispatcher = stdio_upstream;
        }

        auto store = std::make_shared<MemorySessionStore>();
        auto interceptors = std::make_shared<InterceptorChain>(config.interceptor_timeout);
        ProxyEngine engine(
            io.get_executor(),
            store,
            std::make_shared<StaticUpstreamSelector>(endpoint),
            interceptors,
            config);

        StdioBridge bridge(io, engine, result.count("server-stream") > 0);
        asio::signal_set signals(io, SIGINT, SIGTERM);

        asio::co_spawn(io, engine.maintenance_loop(), log_task_failure);
        asio::co_spawn(io, bridge.write_loop(), log_task_failure);
        asio::co_spawn(io, [&]() -> asio::awaitable<void> {
            co_await (bridge.read_loop() || signals.async_wait(asio::use_awaitable));
            co_await engine.shutdown(config.shutdown_grace);
            co_await bridge.finish();
        }, log_task_failure);

        get_logger().info_fmt("proxying to {}", endpoint.name);
        io.run();

        if (stdio_upstream != nullptr) {
            stdio_upstream->stop();
        }
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    } catch (const spdlog::spdlog_ex& e) {
        print_error(std::string("Cannot open log file: ") + e.what());
        return 1;
    }
}
