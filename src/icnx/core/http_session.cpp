// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/http_session.hpp>
#include <icnx/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <string_view>

namespace icnx::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct CurlHeaders {
    curl_slist* list = nullptr;

    ~CurlHeaders() { if (list) curl_slist_free_all(list); }

    void append(const std::string& line) {
        if (auto* next = curl_slist_append(list, line.c_str())) {
            list = next;
        }
    }
};

// State shared with the C callbacks for one request
struct TransferContext {
    ResponseHandler* handler{nullptr};
    CURL* curl{nullptr};
    std::stop_token stoken;
    HttpResponse response;
    bool dispatched{false};
    bool aborted{false};
};

// Fill in status and entity headers, then hand the response over once
bool dispatch_response(TransferContext& ctx) {
    if (ctx.dispatched) {
        return !ctx.aborted;
    }
    ctx.dispatched = true;

    long http_code = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &http_code);
    ctx.response.status_code = static_cast<std::int32_t>(http_code);

    curl_off_t cl = -1;
    if (curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
        ctx.response.content_length = static_cast<std::uint64_t>(cl);
    }

    char* ct = nullptr;
    if (curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        ctx.response.content_type = ct;
    }

    if (!ctx.handler->on_response(ctx.response)) {
        ctx.aborted = true;
    }
    return !ctx.aborted;
}

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return total;

    std::string_view header(buffer, total);

    // A new status line starts the headers of a redirect target
    if (header.starts_with("HTTP/")) {
        ctx->response.headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    ctx->response.headers[lower_name] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx) return 0;

    std::size_t total = size * nitems;
    if (!dispatch_response(*ctx)) {
        return 0;
    }

    std::span<const std::byte> chunk(reinterpret_cast<const std::byte*>(ptr), total);
    if (!ctx->handler->on_chunk(chunk)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

// Abort while waiting on a silent server once stop is requested
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return (ctx && ctx->stoken.stop_requested()) ? 1 : 0;
}

DownloadErrc map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return DownloadErrc::dns_error;
        case CURLE_COULDNT_CONNECT:
            return DownloadErrc::refused;
        case CURLE_OPERATION_TIMEDOUT:
            return DownloadErrc::timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
            return DownloadErrc::ssl_error;
        case CURLE_TOO_MANY_REDIRECTS:
            return DownloadErrc::too_many_redirects;
        case CURLE_PARTIAL_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            return DownloadErrc::connection_lost;
        case CURLE_WRITE_ERROR:
        case CURLE_ABORTED_BY_CALLBACK:
            return DownloadErrc::cancelled;
        default:
            return DownloadErrc::network_error;
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

std::error_code HttpSession::get(const HttpRequest& request,
                                 ResponseHandler& handler,
                                 std::stop_token stoken) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(DownloadErrc::network_error);
    }

    TransferContext ctx;
    ctx.handler = &handler;
    ctx.curl = curl.ptr;
    ctx.stoken = std::move(stoken);

    CurlHeaders headers;
    for (const auto& [name, value] : request.headers) {
        headers.append(name + ": " + value);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, request.user_agent.c_str());
    if (headers.list) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.aborted) {
        return make_error_code(DownloadErrc::cancelled);
    }

    // Bodyless responses never reach the write callback
    if (result == CURLE_OK || result == CURLE_PARTIAL_FILE) {
        if (!dispatch_response(ctx)) {
            return make_error_code(DownloadErrc::cancelled);
        }
    }

    if (result != CURLE_OK) {
        logger()->debug("curl GET {} failed: {}", request.url, curl_easy_strerror(result));
        return make_error_code(map_curl_error(result));
    }
    return {};
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace icnx::core
