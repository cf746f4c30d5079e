// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/download_item.hpp>
#include <icnx/core/events.hpp>
#include <icnx/core/http_session.hpp>
#include <icnx/core/limiter.hpp>
#include <icnx/core/registry.hpp>
#include <icnx/core/retry.hpp>
#include <icnx/core/settings.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace icnx::store {
class Persistence;
} // namespace icnx::store

namespace icnx::core {

enum class TransferStatus : std::uint8_t {
    completed,
    failed,
    cancelled,
};

[[nodiscard]] std::string_view to_string(TransferStatus status) noexcept;

// Terminal result of a transfer after all attempts
struct TransferResult {
    TransferStatus status{TransferStatus::failed};
    std::uint64_t size{0};
    std::filesystem::path path;
    std::string message;
    std::error_code error;
    std::uint32_t attempts{0};
};

// Successful single attempt
struct CompletedTransfer {
    std::uint64_t size{0};
    std::filesystem::path path;
};

// Failed single attempt; DownloadErrc::cancelled when stopped
struct TransferError {
    std::error_code code;
    std::string message;
};

// Live metrics of one transfer, sent as "download_progress"
struct ProgressSnapshot {
    double progress{0.0};
    std::uint64_t downloaded{0};
    std::optional<std::uint64_t> total;
    double speed{0.0};
    std::optional<std::uint64_t> eta;
    std::string status;
    std::string url;
    std::string filename;
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const ProgressSnapshot& p);

// Fill progress ratio, speed and eta from byte counts and elapsed time
[[nodiscard]] ProgressSnapshot make_snapshot(std::uint64_t downloaded,
                                             std::optional<std::uint64_t> total,
                                             double elapsed_sec);

struct TransferOptions {
    RetryPolicy retry;
    std::string user_agent{DEFAULT_USER_AGENT};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
};

[[nodiscard]] TransferOptions make_transfer_options(const EngineConfig& cfg);

// Streams one QueueItem to disk. run() wraps run_once() in the retry
// policy and holds a limiter permit for each attempt.
class TransferExecutor {
public:
    TransferExecutor(HttpTransport& transport,
                     ConcurrencyLimiter& limiter,
                     EventSink& events,
                     Clock& clock,
                     TransferOptions options = {});

    TransferExecutor(const TransferExecutor&) = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    // Progress rows and history records go here when a session id is given
    void persistence(store::Persistence* p) noexcept { persistence_ = p; }
    [[nodiscard]] store::Persistence* persistence() const noexcept { return persistence_; }

    // `pause` may be null; `session_id` may be empty
    [[nodiscard]] TransferResult run(const QueueItem& item,
                                     std::stop_token stoken,
                                     const PauseFlag& pause,
                                     const std::string& session_id);

    [[nodiscard]] std::expected<CompletedTransfer, TransferError>
    run_once(const QueueItem& item,
             std::stop_token stoken,
             const PauseFlag& pause,
             const std::string& session_id);

private:
    class Attempt;

    // Emit a progress event and persist it; terminal statuses also land in history
    void report(const QueueItem& item,
                const std::string& session_id,
                const ProgressSnapshot& snapshot,
                bool persist);

    HttpTransport& transport_;
    ConcurrencyLimiter& limiter_;
    EventSink& events_;
    Clock& clock_;
    TransferOptions options_;
    store::Persistence* persistence_{nullptr};
};

} // namespace icnx::core
