// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/events.hpp>
#include <icnx/log.hpp>

namespace icnx::core {

void LoggingEventSink::emit(std::string_view name, const nlohmann::json& payload) {
    auto level = name == events::PROGRESS ? spdlog::level::trace : spdlog::level::debug;
    if (!logger()->should_log(level)) {
        return;
    }
    logger()->log(level, "event {} {}", name,
                  payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void CallbackEventSink::emit(std::string_view name, const nlohmann::json& payload) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (callback_) {
        callback_(name, payload);
    }
}

} // namespace icnx::core
