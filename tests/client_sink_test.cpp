#include <catch2/catch_test_macros.hpp>

#include "mcpx/stream/client_sink.hpp"
#include "test_helpers.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>

using namespace mcpx;
using mcpx::testing::run_sync;
using mcpx::testing::settle;

TEST_CASE("ClientSink delivers items in order then ends", "[sink]") {
    asio::io_context io;
    auto sink = std::make_shared<EventSink>(io.get_executor(), 4);

    run_sync(io, [sink]() -> asio::awaitable<void> {
        co_await sink->send(StreamEvent{"1", std::nullopt, "a", std::nullopt});
        co_await sink->send(StreamEvent{"2", std::nullopt, "b", std::nullopt});
        co_await sink->finish();
    }());

    REQUIRE(sink->is_finished());

    auto received = run_sync(io, [sink]() -> asio::awaitable<std::vector<std::string>> {
        std::vector<std::string> out;
        while (auto event = co_await sink->receive()) {
            out.push_back(event->data);
        }
        co_return out;
    }());

    REQUIRE(received == std::vector<std::string>{"a", "b"});
}

TEST_CASE("ClientSink send suspends while full", "[sink][backpressure]") {
    asio::io_context io;
    auto sink = std::make_shared<ByteSink>(io.get_executor(), 2);
    int sent = 0;

    asio::co_spawn(io, [sink, &sent]() -> asio::awaitable<void> {
        for (int i = 0; i < 5; ++i) {
            if (co_await sink->send(std::to_string(i)) == false) {
                co_return;
            }
            ++sent;
        }
    }, asio::detached);

    settle(io);
    REQUIRE(sent == 2);

    auto first = run_sync(io, sink->receive());
    REQUIRE(first == "0");
    settle(io);
    REQUIRE(sent == 3);
}

TEST_CASE("ClientSink close wakes a blocked producer", "[sink]") {
    asio::io_context io;
    auto sink = std::make_shared<ByteSink>(io.get_executor(), 1);
    std::optional<bool> last_send;

    asio::co_spawn(io, [sink, &last_send]() -> asio::awaitable<void> {
        while (true) {
            last_send = co_await sink->send("chunk");
            if (*last_send == false) {
                co_return;
            }
        }
    }, asio::detached);

    settle(io);
    REQUIRE(last_send == true);

    sink->close();
    settle(io);

    REQUIRE(sink->is_closed());
    REQUIRE(last_send == false);
    REQUIRE(run_sync(io, sink->send("late")) == false);
}

TEST_CASE("ClientSink capacity is at least one", "[sink]") {
    asio::io_context io;
    EventSink sink(io.get_executor(), 0);
    REQUIRE(sink.capacity() == 1);
}
