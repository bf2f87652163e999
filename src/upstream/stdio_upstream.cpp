#include "mcpx/upstream/stdio_upstream.hpp"

#include "mcpx/log/logger.hpp"
#include "mcpx/protocol/json_rpc.hpp"
#include "mcpx/stream/stream_event.hpp"

#include <asio/as_tuple.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <asio/read_until.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <algorithm>
#include <cstring>
#include <thread>

namespace mcpx {

using namespace asio::experimental::awaitable_operators;

namespace {

constexpr auto kTerminationPollInterval = std::chrono::milliseconds(20);

/// Releases the exchange gate when the exchange coroutine leaves scope.
class GateRelease {
public:
    using Gate = asio::experimental::concurrent_channel<void(asio::error_code)>;

    explicit GateRelease(Gate& gate) : gate_(gate) {}
    ~GateRelease() {
        static_cast<void>(gate_.try_receive([](asio::error_code) {}));
    }

    GateRelease(const GateRelease&) = delete;
    GateRelease& operator=(const GateRelease&) = delete;

private:
    Gate& gate_;
};

UpstreamResponse local_response(int status) {
    return UpstreamResponse{status, HeaderMap{}, std::make_unique<MemoryBodySource>()};
}

/// Request ids in a single message or a batch.
std::vector<JsonRpcId> pending_request_ids(const Json& sent) {
    std::vector<JsonRpcId> ids;
    auto collect = [&ids](const Json& item) {
        auto message = ProtocolMessage::from_json(item);
        if (message.has_value() && message->is_request() && message->id().has_value()) {
            ids.push_back(*message->id());
        }
    };
    if (sent.is_array()) {
        for (const auto& item : sent) {
            collect(item);
        }
    } else {
        collect(sent);
    }
    return ids;
}

/// Removes the id `message` answers from `pending`. False if it answers none.
bool settle(std::vector<JsonRpcId>& pending, const Json& item) {
    auto message = ProtocolMessage::from_json(item);
    if (message.has_value() == false || message->is_reply() == false) {
        return false;
    }
    const auto it = std::ranges::find_if(pending, [&](const JsonRpcId& id) { return message->answers(id); });
    if (it == pending.end()) {
        return false;
    }
    pending.erase(it);
    return true;
}

}  // namespace

StdioUpstreamDispatcher::StdioUpstreamDispatcher(asio::any_io_executor executor, StdioUpstreamConfig config)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , gate_(executor_, 1)
{}

StdioUpstreamDispatcher::~StdioUpstreamDispatcher() {
    stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// Process Management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> StdioUpstreamDispatcher::start() {
    if (running_.load()) {
        return tl::unexpected(TransportError::protocol("Upstream process already running"));
    }
    if (config_.command.empty()) {
        return tl::unexpected(TransportError::protocol("No upstream command configured"));
    }

    // argv must be built before fork(): the child may not allocate.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    for (const auto& arg : config_.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (pipe(stdin_pipe) == -1) {
        return tl::unexpected(TransportError::network(
            "Failed to create pipes: " + std::string(strerror(errno))));
    }
    if (pipe(stdout_pipe) == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return tl::unexpected(TransportError::network(
            "Failed to create pipes: " + std::string(strerror(errno))));
    }

    const pid_t pid = fork();
    if (pid == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return tl::unexpected(TransportError::network(
            "Failed to fork: " + std::string(strerror(errno))));
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED
        dup2(stdin_pipe[0], STDIN_FILENO);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);

        if (config_.stderr_handling == StderrHandling::Discard) {
            const int devnull = open("/dev/null", O_WRONLY);
            if (devnull != -1) {
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }

        execvp(config_.command.c_str(), argv.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    stdin_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdin_pipe[1]);
    stdout_stream_ = std::make_unique<asio::posix::stream_descriptor>(executor_, stdout_pipe[0]);
    read_buffer_.clear();
    child_pid_ = pid;
    exit_code_.reset();
    running_.store(true);

    get_logger().info_fmt("upstream process started: {} (pid {})", config_.command, pid);
    return {};
}

void StdioUpstreamDispatcher::stop() {
    const bool was_running = running_.exchange(false);

    if (stdin_stream_ && stdin_stream_->is_open()) {
        asio::error_code ec;
        stdin_stream_->close(ec);
    }
    if (stdout_stream_ && stdout_stream_->is_open()) {
        asio::error_code ec;
        stdout_stream_->close(ec);
    }

    terminate_process();

    if (was_running) {
        MCPX_LOG_INFO("upstream process stopped");
    }
}

void StdioUpstreamDispatcher::terminate_process() {
    if (child_pid_ <= 0) {
        return;
    }

    kill(child_pid_, SIGTERM);

    int status = 0;
    pid_t result = waitpid(child_pid_, &status, WNOHANG);
    const auto deadline = std::chrono::steady_clock::now() + config_.shutdown_timeout;
    while (result == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kTerminationPollInterval);
        result = waitpid(child_pid_, &status, WNOHANG);
    }
    if (result == 0) {
        get_logger().warn_fmt("upstream process {} ignored SIGTERM, killing", child_pid_);
        kill(child_pid_, SIGKILL);
        result = waitpid(child_pid_, &status, 0);
    }

    if (result > 0) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        }
    }

    child_pid_ = -1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Dispatch
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<TransportResult<UpstreamResponse>> StdioUpstreamDispatcher::async_dispatch(UpstreamRequest request) {
    switch (request.method) {
        case HttpMethod::Get:
            co_return local_response(405);
        case HttpMethod::Delete:
            co_return local_response(202);
        case HttpMethod::Post:
            break;
    }

    if (request.body.has_value() == false || request.body->empty()) {
        co_return tl::unexpected(TransportError::protocol("POST without a body"));
    }

    auto [ec] = co_await gate_.async_send(asio::error_code{}, asio::as_tuple(asio::use_awaitable));
    if (ec) {
        co_return tl::unexpected(TransportError::cancelled());
    }
    GateRelease release(gate_);

    if (running_.load() == false) {
        co_return tl::unexpected(TransportError::network("Upstream process not running"));
    }

    asio::steady_timer deadline(executor_, config_.request_timeout);
    auto result = co_await (
        exchange(std::move(*request.body)) ||
        deadline.async_wait(asio::use_awaitable)
    );
    if (result.index() == 1) {
        get_logger().warn_fmt("upstream process did not answer within {}ms", config_.request_timeout.count());
        co_return tl::unexpected(TransportError::timeout("No response from upstream process"));
    }
    co_return std::move(std::get<0>(result));
}

asio::awaitable<TransportResult<UpstreamResponse>> StdioUpstreamDispatcher::exchange(std::string body) {
    Json sent;
    try {
        sent = Json::parse(body);
    } catch (const Json::parse_error& e) {
        co_return tl::unexpected(TransportError::protocol("Request body is not JSON: " + std::string(e.what())));
    }

    // Lines are the framing; a compact dump guarantees a single line.
    auto written = co_await write_line(sent.dump());
    if (written.has_value() == false) {
        co_return tl::unexpected(std::move(written.error()));
    }
    co_return co_await collect_replies(std::move(sent));
}

asio::awaitable<TransportResult<UpstreamResponse>> StdioUpstreamDispatcher::collect_replies(Json sent) {
    std::vector<JsonRpcId> pending = pending_request_ids(sent);
    if (pending.empty()) {
        co_return local_response(202);
    }

    const bool batch = sent.is_array();
    Json replies = Json::array();
    std::vector<std::string> server_messages;

    while (pending.empty() == false) {
        auto line = co_await read_line();
        if (line.has_value() == false) {
            co_return tl::unexpected(std::move(line.error()));
        }
        if (line->empty()) {
            continue;
        }

        Json received;
        try {
            received = Json::parse(*line);
        } catch (const Json::parse_error& e) {
            get_logger().warn_fmt("ignoring non-JSON line from upstream process: {}", e.what());
            continue;
        }

        if (received.is_array()) {
            for (auto& item : received) {
                if (settle(pending, item)) {
                    replies.push_back(std::move(item));
                }
            }
            continue;
        }
        if (settle(pending, received)) {
            replies.push_back(std::move(received));
            continue;
        }
        server_messages.push_back(std::move(*line));
    }

    const std::string reply = batch ? replies.dump() : replies.front().dump();

    if (server_messages.empty()) {
        HeaderMap headers;
        set_header(headers, header::kContentType, "application/json");
        set_header(headers, header::kContentLength, std::to_string(reply.size()));
        co_return UpstreamResponse{200, std::move(headers), std::make_unique<MemoryBodySource>(reply)};
    }

    std::vector<std::string> chunks;
    std::size_t total = 0;
    for (auto& message : server_messages) {
        chunks.push_back(to_wire_format(StreamEvent{std::nullopt, std::nullopt, std::move(message), std::nullopt}));
        total += chunks.back().size();
    }
    chunks.push_back(to_wire_format(StreamEvent{std::nullopt, std::nullopt, reply, std::nullopt}));
    total += chunks.back().size();

    HeaderMap headers;
    set_header(headers, header::kContentType, "text/event-stream");
    set_header(headers, header::kContentLength, std::to_string(total));
    co_return UpstreamResponse{200, std::move(headers), std::make_unique<MemoryBodySource>(std::move(chunks))};
}

// ═══════════════════════════════════════════════════════════════════════════
// Line I/O
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<TransportResult<void>> StdioUpstreamDispatcher::write_line(const std::string& line) {
    std::string data = line + "\n";
    try {
        co_await asio::async_write(*stdin_stream_, asio::buffer(data), asio::use_awaitable);
    } catch (const std::system_error& e) {
        co_return tl::unexpected(TransportError::network("Write failed: " + std::string(e.what())));
    }
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<std::string>> StdioUpstreamDispatcher::read_line() {
    std::size_t n = 0;
    try {
        n = co_await asio::async_read_until(
            *stdout_stream_,
            asio::dynamic_buffer(read_buffer_, config_.max_line_size),
            '\n',
            asio::use_awaitable
        );
    } catch (const std::system_error& e) {
        if (e.code() == asio::error::eof) {
            running_.store(false);
            co_return tl::unexpected(TransportError::network("Upstream process closed its output"));
        }
        if (e.code() == asio::error::not_found) {
            read_buffer_.clear();
            co_return tl::unexpected(TransportError::protocol("Line from upstream process too large"));
        }
        co_return tl::unexpected(TransportError::network("Failed to read line: " + std::string(e.what())));
    }

    std::string line = read_buffer_.substr(0, n);
    read_buffer_.erase(0, n);
    while (line.empty() == false && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    co_return line;
}

}  // namespace mcpx
