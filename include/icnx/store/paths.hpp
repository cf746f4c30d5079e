// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace icnx::store {

// Resolves store files: <app-data>/.icnx when an application data
// directory is known, <destination>/.icnx otherwise.
class StorePaths {
public:
    explicit StorePaths(std::optional<std::filesystem::path> app_data_dir = std::nullopt)
        : app_data_dir_(std::move(app_data_dir)) {}

    [[nodiscard]] std::filesystem::path root(const std::filesystem::path& destination) const;

    [[nodiscard]] std::filesystem::path session_db(const std::string& session_id,
                                                   const std::filesystem::path& destination) const;
    [[nodiscard]] std::filesystem::path history_db(const std::filesystem::path& destination) const;
    [[nodiscard]] std::filesystem::path scrape_db(const std::filesystem::path& destination) const;

    // Existing session store: app-data copy first, then the destination copy
    [[nodiscard]] std::optional<std::filesystem::path>
    find_session_db(const std::string& session_id, const std::filesystem::path& destination) const;

    [[nodiscard]] const std::optional<std::filesystem::path>& app_data_dir() const noexcept {
        return app_data_dir_;
    }

private:
    std::optional<std::filesystem::path> app_data_dir_;
};

// "session-<id>.db"
[[nodiscard]] std::string session_db_name(const std::string& session_id);

} // namespace icnx::store
