// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <icnx/core/events.hpp>
#include <icnx/log.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace icnx::core;
using json = nlohmann::json;

namespace {

// Captures icnx log lines for the lifetime of the guard
class CapturedLog {
public:
    explicit CapturedLog(spdlog::level::level_enum level)
        : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64))
        , previous_(icnx::logger()->level()) {
        sink_->set_pattern("%v");
        icnx::logger()->sinks().push_back(sink_);
        icnx::logger()->set_level(level);
    }

    ~CapturedLog() {
        auto& sinks = icnx::logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        icnx::logger()->set_level(previous_);
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    [[nodiscard]] std::vector<std::string> lines() const { return sink_->last_formatted(); }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    spdlog::level::level_enum previous_;
};

} // namespace

TEST_CASE("LoggingEventSink - honours the logger level", "[events]") {
    LoggingEventSink sink;
    json progress = {{"url", "https://example.com/a.bin"}, {"downloaded", 10}};

    SECTION("nothing below the active level") {
        CapturedLog log(spdlog::level::info);
        sink.emit(events::PROGRESS, progress);
        sink.emit(events::ITEM_STARTED, {{"url", "https://example.com/a.bin"}});
        CHECK(log.lines().empty());
    }

    SECTION("progress ticks at trace") {
        CapturedLog log(spdlog::level::debug);
        sink.emit(events::PROGRESS, progress);
        sink.emit(events::ITEM_STARTED, {{"url", "https://example.com/a.bin"}});
        auto lines = log.lines();
        REQUIRE(lines.size() == 1);
        CHECK(lines[0].starts_with("event download_item_started "));
    }

    SECTION("payload is rendered when logged") {
        CapturedLog log(spdlog::level::trace);
        sink.emit(events::PROGRESS, progress);
        auto lines = log.lines();
        REQUIRE(lines.size() == 1);
        CHECK(lines[0].find("\"downloaded\":10") != std::string::npos);
    }
}

TEST_CASE("CallbackEventSink - callback may emit again", "[events]") {
    std::vector<std::string> seen;
    CallbackEventSink* self = nullptr;
    CallbackEventSink sink([&](std::string_view name, const json&) {
        seen.emplace_back(name);
        if (name == events::PROGRESS) {
            self->emit(events::SESSION_CANCELLED, {{"session_id", "s1"}});
        }
    });
    self = &sink;

    sink.emit(events::PROGRESS, {{"session_id", "s1"}});
    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == events::PROGRESS);
    CHECK(seen[1] == events::SESSION_CANCELLED);
}
