// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/paths.hpp>
#include <icnx/core/config.hpp>

namespace icnx::store {

namespace fs = std::filesystem;

std::string session_db_name(const std::string& session_id) {
    return "session-" + session_id + ".db";
}

fs::path StorePaths::root(const fs::path& destination) const {
    const auto& base = app_data_dir_ ? *app_data_dir_ : destination;
    return base / core::STORE_DIR_NAME;
}

fs::path StorePaths::session_db(const std::string& session_id, const fs::path& destination) const {
    return root(destination) / session_db_name(session_id);
}

fs::path StorePaths::history_db(const fs::path& destination) const {
    return root(destination) / core::HISTORY_DB_NAME;
}

fs::path StorePaths::scrape_db(const fs::path& destination) const {
    return root(destination) / core::SCRAPE_DB_NAME;
}

std::optional<fs::path> StorePaths::find_session_db(const std::string& session_id,
                                                    const fs::path& destination) const {
    std::error_code ec;
    if (app_data_dir_) {
        auto candidate = *app_data_dir_ / core::STORE_DIR_NAME / session_db_name(session_id);
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    auto candidate = destination / core::STORE_DIR_NAME / session_db_name(session_id);
    if (fs::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

} // namespace icnx::store
