// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/retry.hpp>
#include <icnx/core/error.hpp>
#include <condition_variable>
#include <mutex>

namespace icnx::core {

bool SystemClock::sleep_for(std::chrono::milliseconds duration, std::stop_token stoken) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stoken, duration, [] { return false; });
    return !stoken.stop_requested();
}

bool RetryPolicy::is_retryable(const std::error_code& ec) const noexcept {
    if (ec == DownloadErrc::filesystem_error) {
        return retry_filesystem_errors;
    }
    return core::is_retryable(ec);
}

std::optional<std::chrono::milliseconds> RetryState::fail(const std::error_code& ec) noexcept {
    if (phase_ != Phase::attempting) {
        return std::nullopt;
    }
    if (!policy_.is_retryable(ec) || attempt_ > policy_.retries) {
        phase_ = Phase::failed;
        return std::nullopt;
    }
    auto delay = policy_.base_delay * attempt_;
    ++attempt_;
    return delay;
}

} // namespace icnx::core
