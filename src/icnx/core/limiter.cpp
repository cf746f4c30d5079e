// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/core/limiter.hpp>
#include <algorithm>

namespace icnx::core {

//=============================================================================
// Permit
//=============================================================================

ConcurrencyLimiter::Permit& ConcurrencyLimiter::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        if (owner_) owner_->release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

ConcurrencyLimiter::Permit::~Permit() {
    if (owner_) owner_->release();
}

//=============================================================================
// ConcurrencyLimiter
//=============================================================================

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::acquire(std::stop_token stoken) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait(lock, stoken, [this] { return active_ < capacity_; })) {
        return std::nullopt;
    }
    ++active_;
    peak_ = std::max(peak_, active_);
    return Permit(this);
}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ >= capacity_) {
        return std::nullopt;
    }
    ++active_;
    peak_ = std::max(peak_, active_);
    return Permit(this);
}

std::size_t ConcurrencyLimiter::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t ConcurrencyLimiter::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

void ConcurrencyLimiter::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    cv_.notify_one();
}

} // namespace icnx::core
