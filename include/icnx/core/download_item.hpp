// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/error.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace icnx::core {

// One file to fetch, as described by the upstream producer
struct DownloadItem {
    std::string url;
    std::optional<std::string> filename;
    std::optional<std::string> title;
    std::optional<std::string> type;
    std::map<std::string, std::string> headers;
};

// A DownloadItem bound to its session destination
struct QueueItem {
    std::string id;
    DownloadItem item;
    std::filesystem::path dir;
};

// Item parse failure with a human-readable reason
struct ItemError {
    std::error_code code;
    std::string message;
};

[[nodiscard]] std::expected<DownloadItem, ItemError> parse_download_item(const nlohmann::json& j);

void to_json(nlohmann::json& j, const DownloadItem& item);

// Random RFC 4122 version-4 identifier, lowercase hex
[[nodiscard]] std::string make_uuid();

} // namespace icnx::core
