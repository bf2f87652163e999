// ─────────────────────────────────────────────────────────────────────────────
// StreamPipeline Tests
// ─────────────────────────────────────────────────────────────────────────────
// Upstream streams are scripted chunk by chunk; the client side is the
// EventSink drained after the pipeline returns.

#include <catch2/catch_test_macros.hpp>

#include "mcpx/stream/stream_pipeline.hpp"
#include "mocks/mock_upstream.hpp"
#include "mocks/test_logger.hpp"
#include "test_helpers.hpp"

#include <algorithm>

#include <asio/co_spawn.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

using namespace mcpx;
using namespace mcpx::testing;
using Ending = ScriptedBody::Ending;

namespace {

// ═══════════════════════════════════════════════════════════════════════════
// Fixture
// ═══════════════════════════════════════════════════════════════════════════

struct PipelineOptions {
    std::size_t sink_capacity{64};
    std::size_t max_attempts{3};
    std::chrono::milliseconds idle_timeout{std::chrono::seconds(2)};
    std::optional<JsonRpcId> origin{};
    bool with_writer{false};
};

struct PipelineFixture {
    asio::io_context io;
    std::shared_ptr<ScriptedUpstream> upstream = std::make_shared<ScriptedUpstream>();
    std::shared_ptr<FlakyStore> store = std::make_shared<FlakyStore>();
    std::shared_ptr<EventTracker> tracker = std::make_shared<EventTracker>();
    std::shared_ptr<InterceptorChain> interceptors = std::make_shared<InterceptorChain>();
    std::shared_ptr<EventSink> sink;
    std::shared_ptr<ReconnectionManager> reconnection;
    std::unique_ptr<StreamPipeline> pipeline;

    void build(PipelineOptions options = {}) {
        sink = std::make_shared<EventSink>(io.get_executor(), options.sink_capacity);

        ReconnectPolicy policy;
        policy.with_max_attempts(options.max_attempts).with_idle_timeout(options.idle_timeout);
        reconnection = std::make_shared<ReconnectionManager>(
            upstream, HeaderMap{{"Mcp-Session-Id", "up-1"}}, policy, std::make_unique<NoBackoff>());

        std::shared_ptr<WriteBehindWriter> writer;
        if (options.with_writer) {
            Session session;
            session.id = "s1";
            session.protocol_version = "2025-03-26";
            session.last_activity = std::chrono::system_clock::now();
            REQUIRE(run_sync(io, store->create_session(session)).has_value());
            writer = std::make_shared<WriteBehindWriter>(io.get_executor(), store, "s1");
        }

        pipeline = std::make_unique<StreamPipeline>(
            io.get_executor(), "s1", options.origin,
            StreamPipeline::Dependencies{sink, tracker, reconnection, interceptors, writer});
    }

    /// Chunks as the initial upstream response, then run to completion.
    PipelineOutcome run(std::vector<std::string> chunks, Ending ending, HeaderMap headers = {}) {
        return run(stream_response(io.get_executor(), std::move(chunks), ending, std::move(headers)));
    }

    PipelineOutcome run(UpstreamResponse initial) {
        auto routed = ResponseClassifier::classify(std::move(initial));
        return run_sync(io, pipeline->run(std::get<EventStreamResponse>(std::move(routed))));
    }

    /// Everything the client received.
    std::vector<StreamEvent> drain() {
        return drain(sink);
    }

    std::vector<StreamEvent> drain(std::shared_ptr<EventSink> target) {
        return run_sync(io, [sink = std::move(target)]() -> asio::awaitable<std::vector<StreamEvent>> {
            std::vector<StreamEvent> events;
            while (auto event = co_await sink->receive()) {
                events.push_back(std::move(*event));
            }
            co_return events;
        }());
    }

    void then_stream(std::vector<std::string> chunks, Ending ending) {
        upstream->then([this, chunks, ending](const UpstreamRequest&) {
            return TransportResult<UpstreamResponse>(stream_response(io.get_executor(), chunks, ending));
        });
    }
};

std::vector<std::string> ids_of(const std::vector<StreamEvent>& events) {
    std::vector<std::string> ids;
    for (const auto& event : events) {
        if (event.id.has_value()) {
            ids.push_back(*event.id);
        }
    }
    return ids;
}

const std::string kEnd = "event: end\ndata: {}\n\n";

/// Continues after a fixed pause, so the pipeline is suspended mid-event.
class DelayingInterceptor final : public IInterceptor {
public:
    explicit DelayingInterceptor(std::chrono::milliseconds delay) : delay_(delay) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "delay"; }

    asio::awaitable<InterceptAction> process(const ProtocolMessage&, const InterceptContext&) override {
        asio::steady_timer timer(co_await asio::this_coro::executor, delay_);
        co_await timer.async_wait(asio::use_awaitable);
        co_return ContinueAction{};
    }

private:
    std::chrono::milliseconds delay_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Normal completion
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Pipeline forwards events in order until the termination record", "[pipeline]") {
    PipelineFixture f;
    f.build();

    auto outcome = f.run({sse_record("1", notification_json(1)),
                          sse_record("2", notification_json(2)) + kEnd,
                          sse_record("3", notification_json(3))},
                         Ending::Hang);

    REQUIRE(outcome == PipelineOutcome::Completed);
    auto events = f.drain();
    REQUIRE(ids_of(events) == std::vector<std::string>{"1", "2"});
    REQUIRE(events.back().type == "end");
    REQUIRE(f.tracker->last_id() == "2");
    REQUIRE(f.upstream->requests().empty());
}

TEST_CASE("Pipeline ends when the reply to the originating request arrives", "[pipeline]") {
    PipelineFixture f;
    f.build(PipelineOptions{.origin = JsonRpcId::integer(5)});

    auto outcome = f.run({sse_record("1", notification_json(1)),
                          sse_record("2", R"({"jsonrpc":"2.0","id":5,"result":{"ok":true}})"),
                          sse_record("3", notification_json(3))},
                         Ending::Hang);

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"1", "2"});
}

TEST_CASE("Pipeline completes a zero-length stream without events", "[pipeline]") {
    PipelineFixture f;
    f.build();

    auto outcome = f.run({}, Ending::Clean, HeaderMap{{"Content-Length", "0"}});

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(f.drain().empty());
    REQUIRE(f.sink->is_finished());
    REQUIRE(f.upstream->requests().empty());
}

TEST_CASE("Pipeline completes a fully read bounded stream", "[pipeline]") {
    PipelineFixture f;
    f.build();

    const std::string body = sse_record("1", notification_json(1));
    auto outcome = f.run({body}, Ending::Clean, HeaderMap{{"Content-Length", std::to_string(body.size())}});

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"1"});
}

// ═══════════════════════════════════════════════════════════════════════════
// Resumption
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Dropped stream resumes from the last delivered id without duplicates", "[pipeline][resume]") {
    PipelineFixture f;
    f.build(PipelineOptions{.with_writer = true});

    // Upstream replays event 2 after the resume.
    f.then_stream({sse_record("2", notification_json(2)), sse_record("3", notification_json(3)) + kEnd},
                  Ending::Hang);

    auto outcome = f.run({sse_record("1", notification_json(1)), sse_record("2", notification_json(2))},
                         Ending::Fail);

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"1", "2", "3"});

    const auto requests = f.upstream->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].method == HttpMethod::Get);
    REQUIRE(get_header(requests[0].headers, header::kLastEventId) == "2");

    const auto stats = f.pipeline->stats();
    REQUIRE(stats.duplicates == 1);
    REQUIRE(stats.reconnects == 1);
    REQUIRE(run_sync(f.io, f.store->get_last_event_id("s1")).value() == "3");
}

TEST_CASE("Replaying the same upstream bytes forwards nothing new", "[pipeline][resume]") {
    PipelineFixture f;
    const std::string wire = sse_record("1", notification_json(1))
                           + sse_record("2", notification_json(2))
                           + sse_record("3", notification_json(3));
    const HeaderMap bounded{{"Content-Length", std::to_string(wire.size())}};

    f.build();
    REQUIRE(f.run({wire}, Ending::Clean, bounded) == PipelineOutcome::Completed);
    const auto first = ids_of(f.drain());

    // The same bytes cut at different places, through the same tracker.
    f.build();
    REQUIRE(f.run({wire.substr(0, 7), wire.substr(7, 40), wire.substr(47)}, Ending::Clean, bounded)
            == PipelineOutcome::Completed);
    const auto second = ids_of(f.drain());

    REQUIRE(first == std::vector<std::string>{"1", "2", "3"});
    REQUIRE(second.empty());
    REQUIRE(f.pipeline->stats().duplicates == 3);
    REQUIRE(f.tracker->last_id() == "3");
}

TEST_CASE("Streams of one session deliver a replayed id once", "[pipeline][resume]") {
    PipelineFixture f;
    f.interceptors->add(std::make_shared<DelayingInterceptor>(std::chrono::milliseconds(30)));
    f.build();

    // A GET stream next to the POST reply stream: own sink, same tracker.
    auto other_sink = std::make_shared<EventSink>(f.io.get_executor(), 64);
    auto other_reconnection = std::make_shared<ReconnectionManager>(
        f.upstream, HeaderMap{}, ReconnectPolicy{}, std::make_unique<NoBackoff>());
    StreamPipeline other(f.io.get_executor(), "s1", std::nullopt,
        StreamPipeline::Dependencies{other_sink, f.tracker, other_reconnection, f.interceptors, nullptr});

    const std::string wire = sse_record("1", notification_json(1)) + sse_record("2", notification_json(2)) + kEnd;
    auto open = [&f, &wire]() {
        auto routed = ResponseClassifier::classify(stream_response(f.io.get_executor(), {wire}, Ending::Hang));
        return std::get<EventStreamResponse>(std::move(routed));
    };

    std::optional<PipelineOutcome> first;
    std::optional<PipelineOutcome> second;
    asio::co_spawn(f.io, f.pipeline->run(open()),
        [&first](std::exception_ptr, PipelineOutcome result) { first = result; });
    asio::co_spawn(f.io, other.run(open()),
        [&second](std::exception_ptr, PipelineOutcome result) { second = result; });
    settle(f.io, std::chrono::milliseconds(500));

    REQUIRE(first == PipelineOutcome::Completed);
    REQUIRE(second == PipelineOutcome::Completed);

    auto delivered = ids_of(f.drain());
    const auto from_other = ids_of(f.drain(other_sink));
    delivered.insert(delivered.end(), from_other.begin(), from_other.end());
    std::sort(delivered.begin(), delivered.end());

    REQUIRE(delivered == std::vector<std::string>{"1", "2"});
    REQUIRE(f.pipeline->stats().duplicates + other.stats().duplicates == 2);
}

TEST_CASE("Stream that ends mid-record resumes after the last complete event", "[pipeline][resume]") {
    PipelineFixture f;
    f.build();
    f.then_stream({sse_record("2", notification_json(2)) + kEnd}, Ending::Hang);

    auto outcome = f.run({sse_record("1", notification_json(1)) + "id: 2\ndata: {\"jsonrpc\""}, Ending::Clean);

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"1", "2"});
    REQUIRE(get_header(f.upstream->requests()[0].headers, header::kLastEventId) == "1");
}

TEST_CASE("Idle stream is treated as lost and resumed", "[pipeline][resume]") {
    ScopedTestLogger logger(LogLevel::Warn);
    PipelineFixture f;
    f.build(PipelineOptions{.idle_timeout = std::chrono::milliseconds(50)});
    f.then_stream({sse_record("2", notification_json(2)) + kEnd}, Ending::Hang);

    auto outcome = f.run({sse_record("1", notification_json(1))}, Ending::Hang);

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"1", "2"});
    REQUIRE(logger->contains(LogLevel::Warn, "stalled"));
}

TEST_CASE("Exhausted reconnection sends a terminal error and clears the marker", "[pipeline][resume]") {
    PipelineFixture f;
    f.build(PipelineOptions{.max_attempts = 2, .origin = JsonRpcId::integer(9), .with_writer = true});
    f.upstream->then_fail().then_fail();

    auto outcome = f.run({sse_record("1", notification_json(1))}, Ending::Fail);

    REQUIRE(outcome == PipelineOutcome::StreamLost);

    auto events = f.drain();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].id == "1");
    REQUIRE(events[1].type == "error");

    auto error = Json::parse(events[1].data);
    REQUIRE(error["id"] == 9);
    REQUIRE(error["error"]["code"] == rpc_error::kUpstreamStreamLost);
    REQUIRE(error["error"]["data"]["attempts"] == 2);
    REQUIRE(error["error"]["data"]["lastEventId"] == "1");

    REQUIRE(f.upstream->requests().size() == 2);
    REQUIRE(f.tracker->last_id().has_value() == false);
    REQUIRE(run_sync(f.io, f.store->get_last_event_id("s1")).value().has_value() == false);
    REQUIRE(f.pipeline->state() == StreamState::Closed);
}

// ═══════════════════════════════════════════════════════════════════════════
// Interception
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Blocked stream event is skipped and not recorded", "[pipeline][interceptor]") {
    PipelineFixture f;
    auto blocker = make_blocker("tools/delete", "secret");
    f.interceptors->add(blocker);
    f.build();

    auto outcome = f.run({sse_record("1", notification_json(1)),
                          sse_record("2", R"({"jsonrpc":"2.0","method":"log","params":{"text":"secret"}})"),
                          sse_record("3", notification_json(3)) + kEnd},
                         Ending::Hang);

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"1", "3"});
    REQUIRE(f.pipeline->stats().blocked == 1);
    REQUIRE(f.tracker->contains("2") == false);
    REQUIRE(f.tracker->last_id() == "3");

    // Interceptors see stream events in the upstream-to-client direction.
    const auto contexts = blocker->contexts();
    REQUIRE(contexts.empty() == false);
    REQUIRE(contexts[0].direction == HistoryDirection::UpstreamToClient);
    REQUIRE(contexts[0].event_id == "1");
}

TEST_CASE("Modified stream event is forwarded in its new form", "[pipeline][interceptor]") {
    PipelineFixture f;
    f.interceptors->add(std::make_shared<FunctionInterceptor>("rewrite",
        [](const ProtocolMessage& message, const InterceptContext&) -> InterceptAction {
            if (message.is_notification()) {
                return ModifyAction{ProtocolMessage::notification("notifications/message", Json{{"redacted", true}})};
            }
            return ContinueAction{};
        }));
    f.build();

    f.run({sse_record("1", notification_json(1)) + kEnd}, Ending::Hang);

    auto events = f.drain();
    REQUIRE(events[0].id == "1");
    REQUIRE(Json::parse(events[0].data)["params"]["redacted"] == true);
    REQUIRE(f.pipeline->stats().modified == 1);
}

TEST_CASE("Duplicates are dropped before interceptors see them", "[pipeline][interceptor]") {
    PipelineFixture f;
    auto observer = std::make_shared<FunctionInterceptor>("observer",
        [](const ProtocolMessage&, const InterceptContext&) -> InterceptAction { return ContinueAction{}; });
    f.interceptors->add(observer);
    f.build();
    f.tracker->seed("1");

    f.run({sse_record("1", notification_json(1)), sse_record("2", notification_json(2)) + kEnd}, Ending::Hang);

    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"2"});
    // The termination record carries no protocol message.
    REQUIRE(observer->seen().size() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Flow control and shutdown
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Slow client pauses upstream reads", "[pipeline][backpressure]") {
    PipelineFixture f;
    f.build(PipelineOptions{.sink_capacity = 2});

    std::vector<std::string> chunks;
    for (int i = 1; i <= 10; ++i) {
        chunks.push_back(sse_record(std::to_string(i), notification_json(i)));
    }
    auto body = std::make_unique<ScriptedBody>(f.io.get_executor(), std::move(chunks), Ending::Hang);
    auto* body_ptr = body.get();

    UpstreamResponse initial;
    initial.status_code = 200;
    initial.headers = {{"Content-Type", "text/event-stream"}};
    initial.body = std::move(body);
    auto routed = ResponseClassifier::classify(std::move(initial));

    std::optional<PipelineOutcome> outcome;
    asio::co_spawn(f.io, f.pipeline->run(std::get<EventStreamResponse>(std::move(routed))),
        [&outcome](std::exception_ptr, PipelineOutcome result) { outcome = result; });

    settle(f.io, std::chrono::milliseconds(100));

    REQUIRE(outcome.has_value() == false);
    REQUIRE(f.pipeline->stats().forwarded == 2);
    // Two events buffered, the third read is parked in send().
    REQUIRE(body_ptr->reads() == 3);

    f.pipeline->stop();
    settle(f.io, std::chrono::milliseconds(100));

    REQUIRE(outcome == PipelineOutcome::Stopped);
    REQUIRE(f.sink->is_closed());
    REQUIRE(f.reconnection->state() == StreamState::Closed);
}

TEST_CASE("Client hang-up cancels the upstream stream", "[pipeline]") {
    PipelineFixture f;
    f.build(PipelineOptions{.sink_capacity = 1});
    f.sink->close();

    auto outcome = f.run({sse_record("1", notification_json(1))}, Ending::Hang);

    REQUIRE(outcome == PipelineOutcome::ClientGone);
    REQUIRE(f.tracker->last_id().has_value() == false);
    REQUIRE(f.tracker->contains("1") == false);
    REQUIRE(f.upstream->requests().empty());
}

TEST_CASE("Records over the size limit are skipped without ending the stream", "[pipeline]") {
    PipelineFixture f;
    f.build();

    auto outcome = f.run({sse_record("1", notification_json(1)),
                          "id: 2\ndata: " + std::string(2 * 1024 * 1024, 'x') + "\n\n",
                          sse_record("3", notification_json(3)) + kEnd},
                         Ending::Hang);

    REQUIRE(outcome == PipelineOutcome::Completed);
    REQUIRE(ids_of(f.drain()) == std::vector<std::string>{"1", "3"});
    REQUIRE(f.pipeline->stats().skipped_records == 1);
}
