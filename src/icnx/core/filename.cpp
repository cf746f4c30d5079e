// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/filename.hpp>
#include <icnx/core/url.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace icnx::core {

namespace {

constexpr std::string_view DEFAULT_STEM = "download";
constexpr std::string_view DEFAULT_EXTENSION = "bin";

// First match wins
constexpr std::array<std::pair<std::string_view, std::string_view>, 11> CONTENT_TYPE_EXTENSIONS = {{
    {"jpeg", "jpg"},
    {"jpg", "jpg"},
    {"png", "png"},
    {"gif", "gif"},
    {"webp", "webp"},
    {"mp4", "mp4"},
    {"webm", "webm"},
    {"pdf", "pdf"},
    {"zip", "zip"},
    {"json", "json"},
    {"text", "txt"},
}};

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::string extension_from_content_type(std::string_view content_type) {
    auto lower = to_lower(content_type);
    for (const auto& [needle, ext] : CONTENT_TYPE_EXTENSIONS) {
        if (lower.find(needle) != std::string::npos) {
            return std::string(ext);
        }
    }
    return {};
}

std::string extension_from_type(std::string_view declared_type) {
    auto ext = extension_from_content_type(declared_type);
    if (!ext.empty()) {
        return ext;
    }
    // Tags that are already extensions
    auto lower = to_lower(declared_type);
    if (lower == "txt" || lower == "mp3" || lower == "mkv" || lower == "svg") {
        return lower;
    }
    return std::string(DEFAULT_EXTENSION);
}

std::string url_filename(std::string_view url) {
    if (auto parsed = Url::parse(url)) {
        return parsed->last_segment();
    }

    auto end = url.find_first_of("?#");
    auto path = url.substr(0, end);
    auto slash = path.rfind('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

std::string resolve_filename(const std::optional<std::string>& explicit_name,
                             std::string_view url,
                             std::string_view content_type,
                             const std::optional<std::string>& declared_type) {
    if (explicit_name && !explicit_name->empty()) {
        return *explicit_name;
    }

    auto segment = url_filename(url);
    if (segment.find('.') != std::string::npos && segment.back() != '.') {
        return segment;
    }

    while (!segment.empty() && segment.back() == '.') {
        segment.pop_back();
    }
    if (segment.empty()) {
        segment = DEFAULT_STEM;
    }

    auto ext = extension_from_content_type(content_type);
    if (ext.empty()) {
        ext = declared_type ? extension_from_type(*declared_type) : std::string(DEFAULT_EXTENSION);
    }
    return segment + "." + ext;
}

} // namespace icnx::core
