// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/store/records.hpp>
#include <icnx/store/write_queue.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace icnx::store {

// Durable cross-session log of terminal outcomes (history.db)
class HistoryStore {
public:
    explicit HistoryStore(std::filesystem::path db_path);

    // Insert or replace by id
    void append(HistoryRecord record);

    // History record for a download that never started
    void record_failed(const std::string& session_id,
                       const std::string& url,
                       const std::string& filename,
                       const std::string& dir,
                       std::optional<std::string> file_type = std::nullopt,
                       std::optional<std::string> script_name = std::nullopt,
                       std::optional<std::string> source_url = std::nullopt);

    // Drop every row, or only rows created before `older_than`
    void purge(std::optional<std::int64_t> older_than);

    // Drop a session's rows; optionally delete the downloaded files first
    void delete_session(const std::string& session_id, bool delete_files);

    // Newest first; empty when never written
    [[nodiscard]] std::expected<std::vector<HistoryRecord>, std::error_code> read_all() const;

    [[nodiscard]] std::expected<std::vector<HistoryRecord>, std::error_code>
    read_session(const std::string& session_id) const;

    void flush() { queue_.flush(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return db_path_; }

private:
    [[nodiscard]] std::expected<std::vector<HistoryRecord>, std::error_code>
    query(const std::optional<std::string>& session_id) const;

    std::filesystem::path db_path_;
    WriteQueue queue_;
};

// "0 B", "1.00 KB", "2.50 MB", ...
[[nodiscard]] std::string format_size(std::uint64_t bytes);

// Group records by session; newest session first
[[nodiscard]] std::vector<SessionSummary> summarize_history(const std::vector<HistoryRecord>& records);

} // namespace icnx::store
