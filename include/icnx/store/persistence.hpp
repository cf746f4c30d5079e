// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/store/history_store.hpp>
#include <icnx/store/paths.hpp>
#include <icnx/store/progress_store.hpp>
#include <icnx/store/scrape_store.hpp>
#include <filesystem>

namespace icnx::store {

// The three stores, each behind its own writer thread. Shared stores live
// under the app-data root, or under `fallback_destination` without one.
class Persistence {
public:
    Persistence(StorePaths paths, const std::filesystem::path& fallback_destination);

    Persistence(const Persistence&) = delete;
    Persistence& operator=(const Persistence&) = delete;

    [[nodiscard]] ProgressStore& progress() noexcept { return progress_; }
    [[nodiscard]] HistoryStore& history() noexcept { return history_; }
    [[nodiscard]] ScrapeStore& scrape() noexcept { return scrape_; }

    [[nodiscard]] const StorePaths& paths() const noexcept { return paths_; }

    // Wait for all three writers
    void flush();

private:
    StorePaths paths_;
    ProgressStore progress_;
    HistoryStore history_;
    ScrapeStore scrape_;
};

} // namespace icnx::store
