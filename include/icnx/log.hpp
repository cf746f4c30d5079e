// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace icnx {

// Shared "icnx" logger, created on first use (stderr, colour)
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Set the level of the shared logger ("trace", "debug", "info", "warn", "error", "off")
void init_logging(std::string_view level);

} // namespace icnx
