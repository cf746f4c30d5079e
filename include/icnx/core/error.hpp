// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace icnx::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    connection_lost,
    http_status,
    incomplete,
    filesystem_error,
    invalid_url,
    invalid_item,
    cancelled,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "icnx::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:            return "Success";
            case DownloadErrc::network_error:      return "Network error";
            case DownloadErrc::timeout:            return "Operation timed out";
            case DownloadErrc::refused:            return "Connection refused";
            case DownloadErrc::dns_error:          return "DNS resolution failed";
            case DownloadErrc::ssl_error:          return "SSL/TLS error";
            case DownloadErrc::too_many_redirects: return "Too many redirects";
            case DownloadErrc::connection_lost:    return "Connection lost";
            case DownloadErrc::http_status:        return "Unsuccessful HTTP status";
            case DownloadErrc::incomplete:         return "Incomplete download";
            case DownloadErrc::filesystem_error:   return "Filesystem error";
            case DownloadErrc::invalid_url:        return "Invalid URL";
            case DownloadErrc::invalid_item:       return "Invalid download item";
            case DownloadErrc::cancelled:          return "Download cancelled";
            default:                               return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Transport and integrity failures are worth another attempt; filesystem,
// input and cancellation failures are not.
[[nodiscard]] inline bool is_retryable(const std::error_code& ec) noexcept {
    if (ec.category() != download_errc_category()) {
        return false;
    }
    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::refused:
        case DownloadErrc::dns_error:
        case DownloadErrc::ssl_error:
        case DownloadErrc::too_many_redirects:
        case DownloadErrc::connection_lost:
        case DownloadErrc::http_status:
        case DownloadErrc::incomplete:
            return true;
        default:
            return false;
    }
}

} // namespace icnx::core

namespace std {

template<>
struct is_error_code_enum<icnx::core::DownloadErrc> : true_type {};

} // namespace std
