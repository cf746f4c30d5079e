// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/persistence.hpp>
#include <icnx/log.hpp>

namespace icnx::store {

Persistence::Persistence(StorePaths paths, const std::filesystem::path& fallback_destination)
    : paths_(std::move(paths))
    , progress_(paths_)
    , history_(paths_.history_db(fallback_destination))
    , scrape_(paths_.scrape_db(fallback_destination)) {
    logger()->debug("stores at {}", paths_.root(fallback_destination).string());
}

void Persistence::flush() {
    progress_.flush();
    history_.flush();
    scrape_.flush();
}

} // namespace icnx::store
