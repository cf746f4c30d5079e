// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <system_error>

namespace icnx::core {

// Time source for backoff and pause sleeps; replaceable in tests
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;

    // Sleep for up to `duration`; false when woken by a stop request
    virtual bool sleep_for(std::chrono::milliseconds duration, std::stop_token stoken) = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::steady_clock::now(); }
    bool sleep_for(std::chrono::milliseconds duration, std::stop_token stoken) override;
};

struct RetryPolicy {
    std::uint32_t retries{DEFAULT_RETRIES};
    std::chrono::milliseconds base_delay{DEFAULT_BACKOFF};
    bool retry_filesystem_errors{false};

    [[nodiscard]] bool is_retryable(const std::error_code& ec) const noexcept;
};

// Attempt bookkeeping for one transfer.
// attempting(n) -> succeeded | attempting(n + 1) after n * base_delay | failed
class RetryState {
public:
    enum class Phase : std::uint8_t {
        attempting,
        succeeded,
        failed,
    };

    explicit RetryState(RetryPolicy policy) noexcept : policy_(policy) {}

    [[nodiscard]] Phase phase() const noexcept { return phase_; }

    // 1-based number of the current (or last) attempt
    [[nodiscard]] std::uint32_t attempt() const noexcept { return attempt_; }

    void succeed() noexcept { phase_ = Phase::succeeded; }

    // Record a failed attempt. Returns the delay before the next attempt,
    // or nullopt when the error is terminal or retries are exhausted.
    [[nodiscard]] std::optional<std::chrono::milliseconds> fail(const std::error_code& ec) noexcept;

private:
    RetryPolicy policy_;
    Phase phase_{Phase::attempting};
    std::uint32_t attempt_{1};
};

} // namespace icnx::core
