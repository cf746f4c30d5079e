// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/store/history_store.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>

namespace icnx::store {

// Replay a legacy JSON history file (array, or {"items": [...]}) into the
// history store, then truncate it to "[]". Malformed records are skipped.
// Returns the number of records migrated; a missing or blank file migrates 0.
[[nodiscard]] std::expected<std::size_t, std::error_code>
migrate_json_history(const std::filesystem::path& legacy_path, HistoryStore& history);

} // namespace icnx::store
