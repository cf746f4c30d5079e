// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace icnx {

namespace {

constexpr const char* LOGGER_NAME = "icnx";
constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v";

std::once_flag g_logger_once;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_logger_once, [] {
        if (!spdlog::get(LOGGER_NAME)) {
            auto log = spdlog::stderr_color_mt(LOGGER_NAME);
            log->set_pattern(LOG_PATTERN);
            log->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(LOGGER_NAME);
}

void init_logging(std::string_view level) {
    auto lvl = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    logger()->set_level(lvl);
}

} // namespace icnx
