// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/store/records.hpp>
#include <icnx/store/write_queue.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace icnx::store {

// "<producer>::<input url>"
[[nodiscard]] std::string make_scrape_key(std::string_view producer, std::string_view input_url);

// Shared cache of producer results (scrape.db)
class ScrapeStore {
public:
    explicit ScrapeStore(std::filesystem::path db_path);

    // Upsert by (session_key, url)
    void upsert(const std::string& session_key, ScrapeRecord record);

    // Rows for one key, newest first; a malformed meta column reads as null
    [[nodiscard]] std::expected<std::vector<ScrapeRecord>, std::error_code>
    read(const std::string& session_key) const;

    void flush() { queue_.flush(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return db_path_; }

private:
    std::filesystem::path db_path_;
    WriteQueue queue_;
};

} // namespace icnx::store
