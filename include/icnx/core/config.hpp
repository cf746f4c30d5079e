// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string_view>

namespace icnx::core {

constexpr std::uint32_t DEFAULT_MAX_CONCURRENT = 3;
constexpr std::uint32_t DEFAULT_RETRIES = 3;
constexpr std::chrono::milliseconds DEFAULT_BACKOFF{1000};
constexpr std::string_view DEFAULT_USER_AGENT = "ICNX/0.1";

// Finished sessions kept for wait() before the oldest are dropped
constexpr std::size_t FINISHED_SESSION_RETENTION = 32;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

// Pause sleep-loop granularity
constexpr std::chrono::milliseconds PAUSE_POLL_INTERVAL{200};

// Minimum spacing between persisted progress rows for one transfer
constexpr std::chrono::milliseconds PROGRESS_PERSIST_INTERVAL{500};

constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;           // 256 KB

constexpr std::string_view STORE_DIR_NAME = ".icnx";
constexpr std::string_view HISTORY_DB_NAME = "history.db";
constexpr std::string_view SCRAPE_DB_NAME = "scrape.db";

} // namespace icnx::core
