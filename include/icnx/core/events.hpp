// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace icnx::core {

// Event names delivered to the sink
namespace events {
constexpr std::string_view SESSION_STARTED = "download_session_started";
constexpr std::string_view SESSION_FINISHED = "download_session_finished";
constexpr std::string_view SESSION_CLEANUP = "download_session_cleanup";
constexpr std::string_view SESSION_CANCELLED = "download_session_cancelled";
constexpr std::string_view SESSION_PAUSED = "download_session_paused";
constexpr std::string_view SESSION_RESUMED = "download_session_resumed";
constexpr std::string_view ITEM_QUEUED = "download_item_queued";
constexpr std::string_view ITEM_STARTED = "download_item_started";
constexpr std::string_view ITEM_RESPONSE = "download_item_response";
constexpr std::string_view ITEM_COMPLETED = "download_item_completed";
constexpr std::string_view ITEM_PAUSED = "download_item_paused";
constexpr std::string_view ITEM_RESUMED = "download_item_resumed";
constexpr std::string_view ITEM_PARSE_ERROR = "download_item_parse_error";
constexpr std::string_view PROGRESS = "download_progress";
} // namespace events

// Receiver of named JSON notifications. Called from transfer threads;
// implementations must be thread-safe.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(std::string_view name, const nlohmann::json& payload) = 0;
};

// Writes every event to the icnx logger at debug level (progress ticks at trace)
class LoggingEventSink final : public EventSink {
public:
    void emit(std::string_view name, const nlohmann::json& payload) override;
};

// Forwards events to a callback, one at a time. The callback may call back
// into the orchestrator (cancel, pause, resume) from inside emit.
class CallbackEventSink final : public EventSink {
public:
    using Callback = std::function<void(std::string_view, const nlohmann::json&)>;

    explicit CallbackEventSink(Callback cb) : callback_(std::move(cb)) {}

    void emit(std::string_view name, const nlohmann::json& payload) override;

private:
    Callback callback_;
    std::recursive_mutex mutex_;
};

} // namespace icnx::core
