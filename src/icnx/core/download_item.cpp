// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/download_item.hpp>
#include <icnx/core/url.hpp>
#include <array>
#include <random>

namespace icnx::core {

namespace {

std::unexpected<ItemError> item_error(std::string message) {
    return std::unexpected(ItemError{make_error_code(DownloadErrc::invalid_item), std::move(message)});
}

// Optional string field; present-but-null counts as absent
std::expected<std::optional<std::string>, ItemError>
optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::optional<std::string>{};
    }
    if (!j[key].is_string()) {
        return item_error(std::string("field '") + key + "' must be a string");
    }
    return std::optional<std::string>{j[key].get<std::string>()};
}

} // namespace

std::expected<DownloadItem, ItemError> parse_download_item(const nlohmann::json& j) {
    if (!j.is_object()) {
        return item_error("download item must be an object");
    }
    if (!j.contains("url") || !j["url"].is_string()) {
        return item_error("missing field 'url'");
    }

    DownloadItem item;
    item.url = j["url"].get<std::string>();
    if (item.url.empty()) {
        return item_error("field 'url' is empty");
    }
    if (!Url::parse(item.url)) {
        return item_error("invalid url: " + item.url);
    }

    auto filename = optional_string(j, "filename");
    if (!filename) return std::unexpected(filename.error());
    item.filename = std::move(*filename);

    auto title = optional_string(j, "title");
    if (!title) return std::unexpected(title.error());
    item.title = std::move(*title);

    auto type = optional_string(j, "type");
    if (!type) return std::unexpected(type.error());
    item.type = std::move(*type);

    if (j.contains("headers") && !j["headers"].is_null()) {
        const auto& headers = j["headers"];
        if (!headers.is_object()) {
            return item_error("field 'headers' must be an object");
        }
        for (auto it = headers.begin(); it != headers.end(); ++it) {
            if (!it.value().is_string()) {
                return item_error("header '" + it.key() + "' must be a string");
            }
            item.headers[it.key()] = it.value().get<std::string>();
        }
    }

    // An empty filename would resolve to the directory itself
    if (item.filename && item.filename->empty()) {
        item.filename.reset();
    }

    return item;
}

void to_json(nlohmann::json& j, const DownloadItem& item) {
    j = nlohmann::json{{"url", item.url}};
    if (item.filename) j["filename"] = *item.filename;
    if (item.title) j["title"] = *item.title;
    if (item.type) j["type"] = *item.type;
    if (!item.headers.empty()) j["headers"] = item.headers;
}

std::string make_uuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);
    constexpr std::array<char, 16> HEX = {'0', '1', '2', '3', '4', '5', '6', '7',
                                          '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string id;
    id.reserve(36);
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            id += '-';
        } else if (i == 14) {
            id += '4';
        } else if (i == 19) {
            id += HEX[static_cast<std::size_t>(8 + (nibble(rng) & 0x3))];
        } else {
            id += HEX[static_cast<std::size_t>(nibble(rng))];
        }
    }
    return id;
}

} // namespace icnx::core
