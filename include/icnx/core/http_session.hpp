// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/config.hpp>
#include <icnx/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

namespace icnx::core {

// HTTP response status line and headers (names lowercased)
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;
    std::optional<std::uint64_t> content_length;
    std::string content_type;

    [[nodiscard]] bool is_success() const noexcept {
        return status_code >= 200 && status_code < 300;
    }
};

struct HttpRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string user_agent{DEFAULT_USER_AGENT};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
};

// Receives one streamed response. Returning false from either hook aborts
// the transfer, which then reports DownloadErrc::cancelled.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    // Called once before the first body chunk
    virtual bool on_response(const HttpResponse& response) = 0;

    virtual bool on_chunk(std::span<const std::byte> data) = 0;
};

// Performs a single GET, streaming the body into a handler
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual std::error_code get(const HttpRequest& request,
                                              ResponseHandler& handler,
                                              std::stop_token stoken) = 0;
};

// libcurl-backed transport; one easy handle per request
class HttpSession final : public HttpTransport {
public:
    HttpSession() = default;

    [[nodiscard]] std::error_code get(const HttpRequest& request,
                                      ResponseHandler& handler,
                                      std::stop_token stoken) override;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;
};

} // namespace icnx::core
