#include <catch2/catch_test_macros.hpp>

#include "mcpx/session/memory_session_store.hpp"
#include "test_helpers.hpp"

#include <set>
#include <thread>
#include <vector>

using namespace mcpx;
using mcpx::testing::run_sync;

namespace {

Session make_session(std::string id, std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) {
    Session session;
    session.id = std::move(id);
    session.client_transport = TransportKind::Stdio;
    session.upstream_transport = TransportKind::StreamableHttp;
    session.protocol_version = "2025-03-26";
    session.created_at = at;
    session.last_activity = at;
    return session;
}

HistoryEntry entry(std::string payload) {
    return HistoryEntry{0, HistoryDirection::ClientToUpstream, std::nullopt, std::move(payload),
                        std::chrono::system_clock::now()};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Session ids
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("generate_session_id yields distinct valid ids", "[session]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = generate_session_id();
        REQUIRE(id.size() == 32);
        REQUIRE(is_valid_session_id(id));
        ids.insert(std::move(id));
    }
    REQUIRE(ids.size() == 100);
}

TEST_CASE("generate_session_id draws fresh entropy on every thread", "[session]") {
    constexpr int threads = 8;
    constexpr int per_thread = 200;
    std::vector<std::vector<std::string>> batches(threads);
    {
        std::vector<std::thread> workers;
        for (int t = 0; t < threads; ++t) {
            workers.emplace_back([&batches, t] {
                for (int i = 0; i < per_thread; ++i) {
                    batches[t].push_back(generate_session_id());
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    std::set<std::string> ids;
    for (const auto& batch : batches) {
        for (const auto& id : batch) {
            REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
            ids.insert(id);
        }
    }
    REQUIRE(ids.size() == threads * per_thread);
}

TEST_CASE("is_valid_session_id accepts visible ASCII only", "[session]") {
    REQUIRE(is_valid_session_id("abc-123_XYZ~!"));
    REQUIRE(is_valid_session_id("") == false);
    REQUIRE(is_valid_session_id("has space") == false);
    REQUIRE(is_valid_session_id("tab\there") == false);
    REQUIRE(is_valid_session_id("caf\xc3\xa9") == false);
    REQUIRE(is_valid_session_id(std::string(256, 'a')));
    REQUIRE(is_valid_session_id(std::string(257, 'a')) == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// MemorySessionStore
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("MemorySessionStore create, get and delete", "[session][store]") {
    asio::io_context io;
    MemorySessionStore store;

    REQUIRE(run_sync(io, store.create_session(make_session("s1"))).has_value());
    REQUIRE(run_sync(io, store.create_session(make_session("s1"))).error().code
            == StoreError::Code::AlreadyExists);

    auto loaded = run_sync(io, store.get_session("s1"));
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->protocol_version == "2025-03-26");
    REQUIRE(store.session_count() == 1);

    REQUIRE(run_sync(io, store.delete_session("s1")).has_value());
    REQUIRE(run_sync(io, store.get_session("s1")).error().code == StoreError::Code::NotFound);
    REQUIRE(run_sync(io, store.delete_session("s1")).error().code == StoreError::Code::NotFound);
}

TEST_CASE("MemorySessionStore update keeps immutable fields fixed", "[session][store]") {
    asio::io_context io;
    MemorySessionStore store;
    run_sync(io, store.create_session(make_session("s1")));

    SECTION("upstream session id is set, position is left alone") {
        auto session = make_session("s1");
        session.upstream_session_id = "up-1";
        session.last_event_id = "7";
        REQUIRE(run_sync(io, store.update_session(session)).has_value());

        auto loaded = run_sync(io, store.get_session("s1"));
        REQUIRE(loaded->upstream_session_id == "up-1");
        REQUIRE(loaded->last_event_id.has_value() == false);
    }

    SECTION("protocol version cannot change") {
        auto session = make_session("s1");
        session.protocol_version = "2024-11-05";
        REQUIRE(run_sync(io, store.update_session(session)).error().code == StoreError::Code::Conflict);
    }

    SECTION("transport kind cannot change") {
        auto session = make_session("s1");
        session.client_transport = TransportKind::StreamableHttp;
        REQUIRE(run_sync(io, store.update_session(session)).error().code == StoreError::Code::Conflict);
    }

    SECTION("upstream session id is set at most once") {
        auto session = make_session("s1");
        session.upstream_session_id = "up-1";
        run_sync(io, store.update_session(session));

        session.upstream_session_id = "up-2";
        REQUIRE(run_sync(io, store.update_session(session)).error().code == StoreError::Code::Conflict);

        session.upstream_session_id = "up-1";
        REQUIRE(run_sync(io, store.update_session(session)).has_value());
    }

    SECTION("unknown session") {
        REQUIRE(run_sync(io, store.update_session(make_session("nope"))).error().code
                == StoreError::Code::NotFound);
    }
}

TEST_CASE("MemorySessionStore history is ordered and bounded", "[session][store]") {
    asio::io_context io;
    MemorySessionStore store(MemorySessionStoreConfig{4, 3});
    run_sync(io, store.create_session(make_session("s1")));

    for (int i = 1; i <= 5; ++i) {
        auto sequence = run_sync(io, store.append_history("s1", entry("m" + std::to_string(i))));
        REQUIRE(sequence.value() == static_cast<std::uint64_t>(i));
    }

    auto all = run_sync(io, store.list_history("s1", 0));
    REQUIRE(all->size() == 3);
    REQUIRE(all->front().payload == "m3");
    REQUIRE(all->back().payload == "m5");

    // A limit keeps the most recent entries, still oldest first.
    auto limited = run_sync(io, store.list_history("s1", 2));
    REQUIRE(limited->size() == 2);
    REQUIRE(limited->at(0).payload == "m4");
    REQUIRE(limited->at(1).payload == "m5");

    auto generous = run_sync(io, store.list_history("s1", 10));
    REQUIRE(generous->size() == 3);
    REQUIRE(generous->front().payload == "m3");

    REQUIRE(run_sync(io, store.delete_history("s1")).has_value());
    REQUIRE(run_sync(io, store.list_history("s1", 0))->empty());
    REQUIRE(run_sync(io, store.append_history("missing", entry("x"))).has_value() == false);
}

TEST_CASE("MemorySessionStore resumption marker", "[session][store]") {
    asio::io_context io;
    MemorySessionStore store;
    run_sync(io, store.create_session(make_session("s1")));

    REQUIRE(run_sync(io, store.get_last_event_id("s1")).value().has_value() == false);

    REQUIRE(run_sync(io, store.set_last_event_id("s1", "42")).has_value());
    REQUIRE(run_sync(io, store.get_last_event_id("s1")).value() == "42");

    REQUIRE(run_sync(io, store.set_last_event_id("s1", std::nullopt)).has_value());
    REQUIRE(run_sync(io, store.get_last_event_id("s1")).value().has_value() == false);

    REQUIRE(run_sync(io, store.get_last_event_id("missing")).error().code == StoreError::Code::NotFound);
}

TEST_CASE("MemorySessionStore batch operations report per session", "[session][store]") {
    asio::io_context io;
    MemorySessionStore store;
    run_sync(io, store.create_session(make_session("a")));
    run_sync(io, store.create_session(make_session("b")));

    auto found = run_sync(io, store.get_sessions({"a", "missing", "b"}));
    REQUIRE(found->size() == 2);
    REQUIRE(found->contains("missing") == false);

    auto bad = make_session("b");
    bad.protocol_version = "other";
    auto results = run_sync(io, store.update_sessions({make_session("a"), bad, make_session("missing")}));

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].has_value());
    REQUIRE(results[1].error().code == StoreError::Code::Conflict);
    REQUIRE(results[2].error().code == StoreError::Code::NotFound);
}

TEST_CASE("MemorySessionStore removes idle sessions", "[session][store]") {
    asio::io_context io;
    MemorySessionStore store;
    const auto now = std::chrono::system_clock::now();
    run_sync(io, store.create_session(make_session("old", now - std::chrono::hours(2))));
    run_sync(io, store.create_session(make_session("fresh", now)));

    auto removed = run_sync(io, store.remove_idle_sessions(now - std::chrono::hours(1)));

    REQUIRE(removed.value() == std::vector<std::string>{"old"});
    REQUIRE(store.session_count() == 1);
    REQUIRE(run_sync(io, store.get_session("fresh")).has_value());
}
