// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace icnx::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    url.scheme_.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (url.scheme_ != "http" && url.scheme_ != "https") {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto rest_start = scheme_end + 3;
    auto find_or_end = [&](char c) {
        auto pos = url_str.find(c, rest_start);
        return pos == std::string_view::npos ? url_str.length() : pos;
    };

    auto path_start = find_or_end('/');
    auto query_start = find_or_end('?');
    auto fragment_start = find_or_end('#');
    auto host_end = std::min({path_start, query_start, fragment_start});

    // Skip user:pass@
    auto authority_start = rest_start;
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto authority = url_str.substr(authority_start, host_end - authority_start);
    if (!authority.empty() && authority.front() == '[') {
        // [v6]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    url.str_ = std::string(url_str);
    return url;
}

std::string Url::last_segment() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return path_;
    }
    return path_.substr(last_slash + 1);
}

} // namespace icnx::core
