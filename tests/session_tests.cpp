// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <icnx/core/session.hpp>
#include <icnx/store/persistence.hpp>
#include "test_support.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <thread>

using namespace icnx::core;
using namespace icnx::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

EngineConfig test_config(std::uint32_t max_concurrent = 2) {
    EngineConfig cfg;
    cfg.max_concurrent = max_concurrent;
    cfg.retries = 0;
    cfg.backoff = 10ms;
    return cfg;
}

ScriptedResponse slow_response(std::size_t chunks = 100) {
    auto r = body_response(chunks * 10, chunks);
    r.chunk_delay = 5ms;
    return r;
}

struct Fixture {
    TempDir dir;
    OrchestrationContext context;
    ScriptedTransport transport;
    RecordingEventSink events;
    FakeClock clock;
    EngineConfig config = test_config();
};

} // namespace

TEST_CASE("SessionReport::status", "[session]") {
    SessionReport r;
    CHECK(r.status() == "empty");
    r.completed = 2;
    CHECK(r.status() == "completed");
    r.failed = 1;
    CHECK(r.status() == "mixed");
    r.completed = 0;
    CHECK(r.status() == "failed");
    r.failed = 0;
    r.cancelled = 1;
    CHECK(r.status() == "cancelled");
    r.completed = 3;
    r.was_cancelled = true;
    CHECK(r.status() == "cancelled");
}

TEST_CASE("SessionOrchestrator - lifecycle", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/a.jpg", body_response(100));
    f.transport.add("https://example.com/b.jpg", body_response(200, 2));
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    json items = json::array({
        {{"url", "https://example.com/a.jpg"}},
        {{"title", "no url"}},
        {{"url", "https://example.com/b.jpg"}, {"filename", "second.jpg"}},
    });
    auto id = orch.start_session(items, f.dir.path());
    REQUIRE(id.has_value());
    CHECK(f.context.sessions.contains(*id));
    CHECK(std::filesystem::is_directory(f.dir / ".icnx"));

    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->session_id == *id);
    CHECK(report->submitted == 3);
    CHECK(report->skipped == 1);
    CHECK(report->completed == 2);
    CHECK(report->failed == 0);
    CHECK(report->status() == "completed");
    REQUIRE(report->results.size() == 2);
    CHECK(std::filesystem::file_size(f.dir / "a.jpg") == 100);
    CHECK(std::filesystem::file_size(f.dir / "second.jpg") == 200);

    auto names = f.events.names();
    REQUIRE(!names.empty());
    CHECK(names.front() == events::SESSION_STARTED);
    CHECK(names.back() == events::SESSION_CLEANUP);

    auto started = f.events.named(events::SESSION_STARTED);
    CHECK(started[0]["count"] == 3);
    CHECK(started[0]["session_id"] == *id);

    auto parse_errors = f.events.named(events::ITEM_PARSE_ERROR);
    REQUIRE(parse_errors.size() == 1);
    CHECK(parse_errors[0]["session"] == *id);
    CHECK(parse_errors[0]["error"] == "missing field 'url'");

    CHECK(f.events.count(events::ITEM_QUEUED) == 2);
    CHECK(f.events.count(events::ITEM_STARTED) == 2);
    CHECK(f.events.count(events::ITEM_COMPLETED) == 2);

    auto finished = f.events.named(events::SESSION_FINISHED);
    REQUIRE(finished.size() == 1);
    CHECK(finished[0]["status"] == "completed");
    CHECK(finished[0]["completed"] == 2);

    // Registry entries are gone once the session is done
    CHECK(!f.context.sessions.contains(*id));
    CHECK(!f.context.pauses.contains(*id));
    CHECK(!orch.is_running(*id));
    CHECK(!orch.cancel_session(*id));
    CHECK(!orch.pause_session(*id));
}

TEST_CASE("SessionOrchestrator - rejects non-array input", "[session]") {
    Fixture f;
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    auto id = orch.start_session(json{{"url", "https://example.com/a"}}, f.dir.path());
    REQUIRE(!id.has_value());
    CHECK(id.error() == DownloadErrc::invalid_item);
    CHECK(f.events.count(events::SESSION_STARTED) == 0);
}

TEST_CASE("SessionOrchestrator - empty batch", "[session]") {
    Fixture f;
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    auto id = orch.start_session(json::array(), f.dir.path());
    REQUIRE(id.has_value());
    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->status() == "empty");
    CHECK(f.events.count(events::SESSION_FINISHED) == 1);
}

TEST_CASE("SessionOrchestrator - mixed outcome", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/ok.bin", body_response(10));
    ScriptedResponse missing;
    missing.status = 404;
    f.transport.add("https://example.com/missing.bin", missing);
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    auto id = orch.start_session(json::array({
        {{"url", "https://example.com/ok.bin"}},
        {{"url", "https://example.com/missing.bin"}},
    }), f.dir.path());
    REQUIRE(id.has_value());

    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->completed == 1);
    CHECK(report->failed == 1);
    CHECK(report->status() == "mixed");
    for (const auto& [url, result] : report->results) {
        if (url == "https://example.com/missing.bin") {
            CHECK(result.message == "HTTP 404");
        }
    }
}

TEST_CASE("SessionOrchestrator - cancel", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/a.bin", slow_response());
    f.transport.add("https://example.com/b.bin", slow_response());
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    auto id = orch.start_session(json::array({
        {{"url", "https://example.com/a.bin"}},
        {{"url", "https://example.com/b.bin"}},
    }), f.dir.path());
    REQUIRE(id.has_value());
    REQUIRE(eventually([&] { return f.events.count(events::PROGRESS) >= 2; }));

    CHECK(orch.cancel_session(*id));
    CHECK(!orch.cancel_session(*id));

    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->was_cancelled);
    CHECK(report->cancelled == 2);
    CHECK(report->status() == "cancelled");
    CHECK(f.events.count(events::SESSION_CANCELLED) == 1);
    CHECK(f.events.named(events::SESSION_FINISHED)[0]["status"] == "cancelled");
    CHECK(!std::filesystem::exists(f.dir / "a.bin"));
    CHECK(!std::filesystem::exists(f.dir / "b.bin"));
    CHECK(!f.context.pauses.contains(*id));
}

TEST_CASE("SessionOrchestrator - pause and resume", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/a.bin", slow_response());
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    CHECK(!orch.pause_session("unknown"));
    CHECK(!orch.resume_session("unknown"));

    auto id = orch.start_session(json::array({{{"url", "https://example.com/a.bin"}}}), f.dir.path());
    REQUIRE(id.has_value());
    REQUIRE(eventually([&] { return f.events.count(events::PROGRESS) >= 1; }));

    REQUIRE(orch.pause_session(*id));
    CHECK(orch.is_paused(*id));
    CHECK(f.context.pauses.get(*id));
    REQUIRE(eventually([&] { return f.events.count(events::ITEM_PAUSED) == 1; }));

    REQUIRE(orch.resume_session(*id));
    CHECK(!orch.is_paused(*id));

    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->completed == 1);
    CHECK(f.events.count(events::SESSION_PAUSED) == 1);
    CHECK(f.events.count(events::SESSION_RESUMED) == 1);
    CHECK(f.events.count(events::ITEM_RESUMED) == 1);
    CHECK(std::filesystem::file_size(f.dir / "a.bin") == 1000);
}

TEST_CASE("SessionOrchestrator - concurrency bound", "[session]") {
    Fixture f;
    json items = json::array();
    for (int i = 0; i < 6; ++i) {
        auto url = "https://example.com/" + std::to_string(i) + ".bin";
        f.transport.add(url, slow_response(4));
        items.push_back({{"url", url}});
    }
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, test_config(2));

    auto id = orch.start_session(items, f.dir.path());
    REQUIRE(id.has_value());
    auto report = orch.wait(*id);
    REQUIRE(report);

    CHECK(report->completed == 6);
    CHECK(f.transport.peak() <= 2);
    CHECK(orch.limiter().peak() <= 2);
    CHECK(orch.limiter().active() == 0);
}

TEST_CASE("SessionOrchestrator - sessions are independent", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/slow.bin", slow_response());
    f.transport.add("https://example.com/fast.bin", body_response(10));
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    auto slow = orch.start_session(json::array({{{"url", "https://example.com/slow.bin"}}}), f.dir / "slow");
    auto fast = orch.start_session(json::array({{{"url", "https://example.com/fast.bin"}}}), f.dir / "fast");
    REQUIRE(slow.has_value());
    REQUIRE(fast.has_value());
    CHECK(*slow != *fast);

    CHECK(orch.cancel_session(*slow));
    auto fast_report = orch.wait(*fast);
    auto slow_report = orch.wait(*slow);
    REQUIRE(fast_report);
    REQUIRE(slow_report);
    CHECK(fast_report->status() == "completed");
    CHECK(slow_report->status() == "cancelled");
}

TEST_CASE("SessionOrchestrator - shutdown cancels running sessions", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/a.bin", slow_response(1000));
    {
        SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);
        auto id = orch.start_session(json::array({{{"url", "https://example.com/a.bin"}}}), f.dir.path());
        REQUIRE(id.has_value());
        REQUIRE(eventually([&] { return f.events.count(events::PROGRESS) >= 1; }));
    }
    auto finished = f.events.named(events::SESSION_FINISHED);
    REQUIRE(finished.size() == 1);
    CHECK(finished[0]["status"] == "cancelled");
    CHECK(f.context.sessions.size() == 0);
}

TEST_CASE("SessionOrchestrator - persistence", "[session][store]") {
    Fixture f;
    icnx::store::Persistence persistence(icnx::store::StorePaths{}, f.dir.path());
    f.transport.add("https://example.com/a.bin", body_response(64));
    ScriptedResponse missing;
    missing.status = 404;
    f.transport.add("https://example.com/b.bin", missing);

    std::string id;
    {
        SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config, &persistence);
        auto started = orch.start_session(json::array({
            {{"url", "https://example.com/a.bin"}, {"type", "video"}},
            {{"url", "https://example.com/b.bin"}},
        }), f.dir.path());
        REQUIRE(started.has_value());
        id = *started;
        REQUIRE(orch.wait(id));
    }
    persistence.flush();

    CHECK(std::filesystem::exists(f.dir / ".icnx" / ("session-" + id + ".db")));
    auto rows = persistence.progress().read(id, f.dir.path());
    REQUIRE(rows.has_value());
    CHECK(rows->size() == 2);

    auto history = persistence.history().read_session(id);
    REQUIRE(history.has_value());
    REQUIRE(history->size() == 2);
    auto summaries = icnx::store::summarize_history(*history);
    REQUIRE(summaries.size() == 1);
    CHECK(summaries[0].status == "Mixed");
    CHECK(summaries[0].total_size == "64.00 B");
    for (const auto& rec : *history) {
        if (rec.url == "https://example.com/a.bin") {
            CHECK(rec.file_type == "video");
        }
    }
}

TEST_CASE("SessionOrchestrator - event callback can cancel its own session", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/a.bin", slow_response());
    SessionOrchestrator* orch_ptr = nullptr;
    std::atomic<bool> cancelled{false};
    CallbackEventSink sink([&](std::string_view name, const json& payload) {
        f.events.emit(name, payload);
        if (name == events::PROGRESS && !cancelled.exchange(true)) {
            orch_ptr->cancel_session(payload["session_id"].get<std::string>());
        }
    });
    SessionOrchestrator orch(f.context, f.transport, sink, f.clock, f.config);
    orch_ptr = &orch;

    auto id = orch.start_session(json::array({{{"url", "https://example.com/a.bin"}}}), f.dir.path());
    REQUIRE(id.has_value());
    REQUIRE(eventually([&] { return !orch.is_running(*id); }));

    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->status() == "cancelled");
    CHECK(f.events.count(events::SESSION_CANCELLED) == 1);
    CHECK(f.events.count(events::SESSION_FINISHED) == 1);
}

TEST_CASE("SessionOrchestrator - event callback can pause and resume", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/a.bin", slow_response(20));
    SessionOrchestrator* orch_ptr = nullptr;
    std::atomic<bool> paused{false};
    CallbackEventSink sink([&](std::string_view name, const json& payload) {
        f.events.emit(name, payload);
        if (name == events::PROGRESS && !paused.exchange(true)) {
            orch_ptr->pause_session(payload["session_id"].get<std::string>());
        } else if (name == events::ITEM_PAUSED) {
            orch_ptr->resume_session(payload["session_id"].get<std::string>());
        }
    });
    SessionOrchestrator orch(f.context, f.transport, sink, f.clock, f.config);
    orch_ptr = &orch;

    auto id = orch.start_session(json::array({{{"url", "https://example.com/a.bin"}}}), f.dir.path());
    REQUIRE(id.has_value());
    REQUIRE(eventually([&] { return !orch.is_running(*id); }));

    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->completed == 1);
    CHECK(f.events.count(events::SESSION_PAUSED) == 1);
    CHECK(f.events.count(events::SESSION_RESUMED) == 1);
}

TEST_CASE("SessionOrchestrator - large batch runs on a bounded worker pool", "[session]") {
    Fixture f;
    json items = json::array();
    for (int i = 0; i < 2000; ++i) {
        auto url = "https://example.com/many/" + std::to_string(i) + ".bin";
        f.transport.add(url, body_response(8));
        items.push_back({{"url", url}});
    }

    std::mutex threads_mutex;
    std::set<std::thread::id> threads;
    CallbackEventSink sink([&](std::string_view name, const json&) {
        if (name == events::ITEM_STARTED) {
            std::lock_guard<std::mutex> lock(threads_mutex);
            threads.insert(std::this_thread::get_id());
        }
    });
    SessionOrchestrator orch(f.context, f.transport, sink, f.clock, test_config(3));

    auto id = orch.start_session(items, f.dir.path());
    REQUIRE(id.has_value());
    auto report = orch.wait(*id);
    REQUIRE(report);

    CHECK(report->completed == 2000);
    CHECK(report->results.size() == 2000);
    CHECK(f.transport.peak() <= 3);
    std::lock_guard<std::mutex> lock(threads_mutex);
    CHECK(threads.size() <= 3);
}

TEST_CASE("SessionOrchestrator - finished sessions are released", "[session]") {
    Fixture f;
    f.transport.add("https://example.com/a.bin", body_response(10));
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    SECTION("wait hands over the report once") {
        auto first = orch.start_session(json::array({{{"url", "https://example.com/a.bin"}}}), f.dir / "one");
        auto second = orch.start_session(json::array(), f.dir / "two");
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(orch.tracked_sessions() == 2);

        REQUIRE(orch.wait(*first));
        CHECK(orch.tracked_sessions() == 1);
        REQUIRE(orch.wait(*second));
        CHECK(orch.tracked_sessions() == 0);
        CHECK(!orch.wait(*first));
    }

    SECTION("uncollected sessions are capped") {
        for (std::size_t i = 0; i < FINISHED_SESSION_RETENTION + 10; ++i) {
            REQUIRE(orch.start_session(json::array(), f.dir.path()).has_value());
        }
        orch.wait_all();
        CHECK(orch.tracked_sessions() >= FINISHED_SESSION_RETENTION);

        auto last = orch.start_session(json::array(), f.dir.path());
        REQUIRE(last.has_value());
        CHECK(orch.tracked_sessions() <= FINISHED_SESSION_RETENTION + 1);
        CHECK(orch.wait(*last));
    }
}

TEST_CASE("SessionOrchestrator - unwritable store directory is not fatal", "[session]") {
    Fixture f;
    write_file(f.dir / ".icnx", "not a directory");
    f.transport.add("https://example.com/a.bin", body_response(10));
    SessionOrchestrator orch(f.context, f.transport, f.events, f.clock, f.config);

    auto id = orch.start_session(json::array({{{"url", "https://example.com/a.bin"}}}), f.dir.path());
    REQUIRE(id.has_value());
    auto report = orch.wait(*id);
    REQUIRE(report);
    CHECK(report->completed == 1);
    CHECK(std::filesystem::file_size(f.dir / "a.bin") == 10);
}
