// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stop_token>

namespace icnx::core {

// Counting permit pool shared by every transfer of an orchestrator
class ConcurrencyLimiter {
public:
    // RAII permit; releases its slot on destruction
    class Permit {
    public:
        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;
        ~Permit();

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        friend class ConcurrencyLimiter;
        explicit Permit(ConcurrencyLimiter* owner) noexcept : owner_(owner) {}

        ConcurrencyLimiter* owner_;
    };

    // Capacity is clamped to at least one
    explicit ConcurrencyLimiter(std::size_t capacity);

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    // Block until a permit frees; nullopt once stop is requested
    [[nodiscard]] std::optional<Permit> acquire(std::stop_token stoken);

    [[nodiscard]] std::optional<Permit> try_acquire();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t active() const;

    // Highest number of permits held at once
    [[nodiscard]] std::size_t peak() const;

private:
    void release() noexcept;

    const std::size_t capacity_;
    std::size_t active_{0};
    std::size_t peak_{0};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

} // namespace icnx::core
