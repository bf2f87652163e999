#include <catch2/catch_test_macros.hpp>
#include "mcpx/stream/sse_parser.hpp"

#include <string>

using mcpx::SseParser;
using mcpx::SseParserConfig;
using mcpx::StreamEvent;

TEST_CASE("SseParser parses event with all fields", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("event: message\nid: 42\nretry: 1500\ndata: {\"test\":true}\n\n");

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type.value() == "message");
    REQUIRE(events[0].id.value() == "42");
    REQUIRE(events[0].retry.value() == 1500);
    REQUIRE(events[0].data == "{\"test\":true}");
    REQUIRE(parser.has_partial_record() == false);
}

TEST_CASE("SseParser concatenates multiple data lines", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("data: line one\ndata: line two\ndata:line three\n\n");

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "line one\nline two\nline three");
}

TEST_CASE("SseParser handles records split at any byte", "[sse][parser]") {
    const std::string wire = "id: 1\r\ndata: hello\r\n\r\nid: 2\ndata: world\n\n";

    SseParser parser;
    std::vector<StreamEvent> events;
    for (char c : wire) {
        for (auto& event : parser.feed(std::string_view(&c, 1))) {
            events.push_back(std::move(event));
        }
    }

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].id == "1");
    REQUIRE(events[0].data == "hello");
    REQUIRE(events[1].id == "2");
    REQUIRE(events[1].data == "world");
}

TEST_CASE("SseParser accepts bare CR line endings", "[sse][parser]") {
    SseParser parser;

    SECTION("CR only") {
        auto events = parser.feed("id: 1\rdata: {}\r\rid: 2\rdata: next\r\r");

        REQUIRE(events.size() == 2);
        REQUIRE(events[0].id == "1");
        REQUIRE(events[0].data == "{}");
        REQUIRE(events[1].id == "2");
        REQUIRE(parser.has_partial_record() == false);
    }

    SECTION("CRLF split between chunks ends one line") {
        REQUIRE(parser.feed("id: 7\r").empty());
        REQUIRE(parser.feed("\ndata: a\r").empty());

        // Had the LF counted as a second line end, the record would already
        // have been dispatched without its data.
        auto events = parser.feed("\ndata: b\r\n\r\n");

        REQUIRE(events.size() == 1);
        REQUIRE(events[0].id == "7");
        REQUIRE(events[0].data == "a\nb");
    }

    SECTION("mixed endings in one stream") {
        auto events = parser.feed("data: one\r\n\ndata: two\r\rdata: three\n\r");

        REQUIRE(events.size() == 3);
        REQUIRE(events[0].data == "one");
        REQUIRE(events[1].data == "two");
        REQUIRE(events[2].data == "three");
    }
}

TEST_CASE("SseParser ignores comment lines and keep-alives", "[sse][parser]") {
    SseParser parser;

    auto keepalive = parser.feed(": ping\n\n");
    REQUIRE(keepalive.empty());

    auto events = parser.feed(": comment\ndata: actual data\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "actual data");
}

TEST_CASE("SseParser emits id-only records", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("id: 9\n\n");

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].id == "9");
    REQUIRE(events[0].data.empty());
}

TEST_CASE("SseParser ignores unknown fields and invalid retry", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("foo: bar\nretry: soon\ndata: x\n\n");

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].retry.has_value() == false);
    REQUIRE(events[0].data == "x");
}

TEST_CASE("SseParser reports partial records", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("id: 3\ndata: half");
    REQUIRE(events.empty());
    REQUIRE(parser.has_partial_record());

    parser.reset();
    REQUIRE(parser.has_partial_record() == false);

    events = parser.feed("data: fresh\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].id.has_value() == false);
}

TEST_CASE("SseParser skips an oversized line and resynchronises", "[sse][parser]") {
    SseParser parser(SseParserConfig{.max_line_size = 16, .max_event_size = 1024});

    auto events = parser.feed("id: 1\ndata: " + std::string(64, 'x'));
    REQUIRE(events.empty());
    REQUIRE(parser.skipped_records() == 1);

    events = parser.feed(std::string(10, 'x') + "\n\nid: 2\ndata: ok\n\n");
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].id == "2");
    REQUIRE(events[0].data == "ok");
    REQUIRE(parser.skipped_records() == 1);
}

TEST_CASE("SseParser skips a record whose data grows too large", "[sse][parser]") {
    SseParser parser(SseParserConfig{.max_line_size = 1024, .max_event_size = 8});

    auto events = parser.feed("data: 12345\ndata: 67890\n\ndata: small\n\n");

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].data == "small");
    REQUIRE(parser.skipped_records() == 1);
}

TEST_CASE("to_wire_format splits data across lines", "[sse][format]") {
    StreamEvent event{"7", "message", "a\nb", std::nullopt};

    REQUIRE(mcpx::to_wire_format(event) == "id: 7\nevent: message\ndata: a\ndata: b\n\n");

    SseParser parser;
    auto parsed = parser.feed(mcpx::to_wire_format(event));
    REQUIRE(parsed.size() == 1);
    REQUIRE(parsed[0] == event);
}
