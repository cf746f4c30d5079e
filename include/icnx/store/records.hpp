// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace icnx::store {

// Latest known state of one transfer, keyed by url within a session store
struct ProgressRecord {
    std::string url;
    std::string filename;
    double progress{0.0};
    std::uint64_t downloaded{0};
    std::optional<std::uint64_t> total;
    double speed{0.0};
    std::optional<std::uint64_t> eta;
    std::string status;
    std::int64_t updated_at{0};
};

// Terminal outcome of one transfer
struct HistoryRecord {
    std::string id;
    std::string session_id;
    std::string url;
    std::string filename;
    std::string dir;
    std::optional<std::uint64_t> size;
    std::string status;
    std::optional<std::string> file_type;
    std::optional<std::string> script_name;
    std::optional<std::string> source_url;
    std::int64_t created_at{0};
};

// Item discovered by a producer script, keyed by (session key, url)
struct ScrapeRecord {
    std::string url;
    std::optional<std::string> filename;
    std::optional<std::string> title;
    std::optional<std::string> type;
    nlohmann::json meta;
    std::int64_t updated_at{0};
};

// One row per history session
struct SessionSummary {
    std::string session_id;
    std::string title;
    std::string subtitle;
    std::string total_size;
    std::string status;
    std::int64_t created_at{0};
};

void to_json(nlohmann::json& j, const ProgressRecord& r);
void to_json(nlohmann::json& j, const HistoryRecord& r);
void from_json(const nlohmann::json& j, HistoryRecord& r);
void to_json(nlohmann::json& j, const ScrapeRecord& r);
void to_json(nlohmann::json& j, const SessionSummary& s);

// Seconds since the Unix epoch
[[nodiscard]] std::int64_t unix_now() noexcept;

} // namespace icnx::store
