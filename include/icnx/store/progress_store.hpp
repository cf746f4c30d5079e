// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/store/paths.hpp>
#include <icnx/store/records.hpp>
#include <icnx/store/write_queue.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace icnx::store {

// Per-session progress tables (session-<id>.db), one row per url
class ProgressStore {
public:
    explicit ProgressStore(StorePaths paths);

    // Fire-and-forget upsert keyed by url
    void upsert(const std::string& session_id,
                const std::filesystem::path& destination,
                ProgressRecord record);

    // Rows of one session, newest first; empty when never written
    [[nodiscard]] std::expected<std::vector<ProgressRecord>, std::error_code>
    read(const std::string& session_id, const std::filesystem::path& destination) const;

    // Close the writer's connection for a finished session
    void release(const std::string& session_id, const std::filesystem::path& destination);

    void flush() { queue_.flush(); }

    [[nodiscard]] const StorePaths& paths() const noexcept { return paths_; }

private:
    StorePaths paths_;
    WriteQueue queue_;
};

} // namespace icnx::store
