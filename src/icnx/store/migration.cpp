// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/migration.hpp>
#include <icnx/log.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace icnx::store {

std::expected<std::size_t, std::error_code>
migrate_json_history(const std::filesystem::path& legacy_path, HistoryStore& history) {
    std::error_code ec;
    if (!std::filesystem::exists(legacy_path, ec)) {
        return 0;
    }

    std::string content;
    {
        std::ifstream file(legacy_path, std::ios::binary);
        if (!file.is_open()) {
            return std::unexpected(make_error_code(StoreErrc::io_error));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        content = buffer.str();
    }

    if (std::all_of(content.begin(), content.end(), [](unsigned char c) { return std::isspace(c) != 0; })) {
        return 0;
    }

    auto doc = nlohmann::json::parse(content, nullptr, false);
    if (doc.is_discarded()) {
        logger()->error("legacy history {} is not valid JSON", legacy_path.string());
        return std::unexpected(make_error_code(StoreErrc::parse_error));
    }

    const nlohmann::json* items = &doc;
    if (doc.is_object() && doc.contains("items")) {
        items = &doc["items"];
    }
    if (!items->is_array()) {
        logger()->error("legacy history {} has no record list", legacy_path.string());
        return std::unexpected(make_error_code(StoreErrc::parse_error));
    }

    std::size_t migrated = 0;
    for (const auto& item : *items) {
        try {
            history.append(item.get<HistoryRecord>());
            ++migrated;
        } catch (const nlohmann::json::exception& e) {
            logger()->warn("skipping legacy history record: {}", e.what());
        }
    }
    history.flush();

    std::ofstream out(legacy_path, std::ios::trunc);
    out << "[]";
    if (!out.good()) {
        logger()->warn("cannot truncate legacy history {}", legacy_path.string());
        return std::unexpected(make_error_code(StoreErrc::io_error));
    }

    logger()->info("migrated {} legacy history records from {}", migrated, legacy_path.string());
    return migrated;
}

} // namespace icnx::store
