#pragma once

#include "mcpx/stream/stream_event.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>

#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpx {

/// Bounded hand-off between a producer task (stream pipeline, pass-through
/// relay) and the task serving the client.
///
/// send() suspends while the channel is full, which is what throttles upstream
/// reads when the client is slow. The producer ends the sequence with
/// finish(); the consumer gives up early with close(), after which every
/// send() reports false so the producer can stop and release its upstream.
template <typename T>
class ClientSink {
public:
    ClientSink(asio::any_io_executor executor, std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
        , channel_(std::move(executor), capacity_) {}

    ClientSink(const ClientSink&) = delete;
    ClientSink& operator=(const ClientSink&) = delete;

    /// False once the consumer has closed the sink.
    asio::awaitable<bool> send(T item) {
        co_return co_await push(std::optional<T>{std::move(item)});
    }

    /// Marks the end of the sequence. Items already sent stay readable.
    asio::awaitable<bool> finish() {
        finished_.store(true);
        co_return co_await push(std::optional<T>{});
    }

    /// Next item, or nullopt once the producer finished or the sink closed.
    asio::awaitable<std::optional<T>> receive() {
        auto [ec, item] = co_await channel_.async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            co_return std::nullopt;
        }
        co_return std::move(item);
    }

    /// Consumer side hang-up. Wakes a producer blocked in send().
    void close() {
        closed_.store(true);
        channel_.close();
    }

    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(); }
    [[nodiscard]] bool is_finished() const noexcept { return finished_.load(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    using Channel = asio::experimental::concurrent_channel<void(asio::error_code, std::optional<T>)>;

    asio::awaitable<bool> push(std::optional<T> item) {
        if (closed_.load()) {
            co_return false;
        }
        auto [ec] = co_await channel_.async_send(
            asio::error_code{}, std::move(item), asio::as_tuple(asio::use_awaitable));
        co_return !ec;
    }

    std::size_t capacity_;
    Channel channel_;
    std::atomic<bool> closed_{false};
    std::atomic<bool> finished_{false};
};

using EventSink = ClientSink<StreamEvent>;
using ByteSink = ClientSink<std::string>;

}  // namespace mcpx
