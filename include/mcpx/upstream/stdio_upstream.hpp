#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Upstream
// ═══════════════════════════════════════════════════════════════════════════
// Runs an MCP server as a child process and talks line-delimited JSON-RPC to
// it over its stdin/stdout. Exchanges are answered in the shape an HTTP
// upstream would use, so the engine does not care which kind it talks to.

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StdioUpstreamDispatcher is only available on POSIX-compatible systems"
#endif

#include "mcpx/upstream/upstream_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <sys/types.h>  // pid_t

namespace mcpx {

/// How to handle stderr from the child process
enum class StderrHandling {
    Discard,     // Redirect to /dev/null
    Passthrough  // Inherit from parent
};

struct StdioUpstreamConfig {
    std::string command;
    std::vector<std::string> args;

    /// Longest line accepted from the child.
    std::size_t max_line_size{1 << 20};  // 1 MiB

    StderrHandling stderr_handling{StderrHandling::Passthrough};

    /// How long a request may wait for its response.
    std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};

    /// Graceful shutdown timeout before SIGKILL
    std::chrono::milliseconds shutdown_timeout{std::chrono::seconds(2)};
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioUpstreamDispatcher
// ─────────────────────────────────────────────────────────────────────────────
// One exchange at a time. A POST carrying only notifications or responses is
// answered 202 once written. A POST carrying requests waits for the matching
// response(s):
//
//   - nothing else arrived first   -> 200 application/json, the response
//   - server messages came first   -> 200 text/event-stream, one event per
//                                     message in arrival order, the
//                                     response last
//
// GET is answered 405 (no standalone stream) and DELETE 202.

class StdioUpstreamDispatcher final : public IUpstreamDispatcher {
public:
    StdioUpstreamDispatcher(asio::any_io_executor executor, StdioUpstreamConfig config);
    ~StdioUpstreamDispatcher() override;

    StdioUpstreamDispatcher(const StdioUpstreamDispatcher&) = delete;
    StdioUpstreamDispatcher& operator=(const StdioUpstreamDispatcher&) = delete;

    /// Spawn the child process.
    TransportResult<void> start();

    /// Close the pipes and terminate the child (SIGTERM, then SIGKILL).
    void stop();

    asio::awaitable<TransportResult<UpstreamResponse>> async_dispatch(UpstreamRequest request) override;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::Stdio; }

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] pid_t child_pid() const noexcept { return child_pid_; }
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

private:
    asio::awaitable<TransportResult<UpstreamResponse>> exchange(std::string body);
    asio::awaitable<TransportResult<void>> write_line(const std::string& line);
    asio::awaitable<TransportResult<std::string>> read_line();
    asio::awaitable<TransportResult<UpstreamResponse>> collect_replies(Json sent);

    void terminate_process();

    using Gate = asio::experimental::concurrent_channel<void(asio::error_code)>;

    asio::any_io_executor executor_;
    StdioUpstreamConfig config_;
    Gate gate_;

    std::unique_ptr<asio::posix::stream_descriptor> stdin_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stdout_stream_;
    std::string read_buffer_;

    std::atomic<bool> running_{false};
    pid_t child_pid_{-1};
    std::optional<int> exit_code_;
};

}  // namespace mcpx
