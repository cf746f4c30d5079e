// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <icnx/core/limiter.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace icnx::core;

TEST_CASE("ConcurrencyLimiter - permits", "[limiter]") {
    SECTION("Capacity is clamped to one") {
        ConcurrencyLimiter limiter(0);
        CHECK(limiter.capacity() == 1);
    }

    SECTION("try_acquire respects capacity") {
        ConcurrencyLimiter limiter(2);
        auto a = limiter.try_acquire();
        auto b = limiter.try_acquire();
        REQUIRE(a);
        REQUIRE(b);
        CHECK(!limiter.try_acquire());
        CHECK(limiter.active() == 2);

        a.reset();
        CHECK(limiter.active() == 1);
        CHECK(limiter.try_acquire());
    }

    SECTION("Moved permit releases once") {
        ConcurrencyLimiter limiter(1);
        {
            auto a = limiter.try_acquire();
            REQUIRE(a);
            auto b = std::move(*a);
            CHECK(limiter.active() == 1);
        }
        CHECK(limiter.active() == 0);
    }
}

TEST_CASE("ConcurrencyLimiter - acquire blocks until release", "[limiter]") {
    ConcurrencyLimiter limiter(1);
    auto held = limiter.try_acquire();
    REQUIRE(held);

    std::atomic<bool> acquired{false};
    std::jthread waiter([&](std::stop_token st) {
        auto p = limiter.acquire(st);
        acquired = p.has_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(!acquired);

    held.reset();
    waiter.join();
    CHECK(acquired);
}

TEST_CASE("ConcurrencyLimiter - stop interrupts a waiting acquire", "[limiter]") {
    ConcurrencyLimiter limiter(1);
    auto held = limiter.try_acquire();
    REQUIRE(held);

    std::stop_source source;
    std::atomic<bool> returned{false};
    std::atomic<bool> got_permit{true};
    std::thread waiter([&] {
        auto p = limiter.acquire(source.get_token());
        got_permit = p.has_value();
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(!returned);
    source.request_stop();
    waiter.join();
    CHECK(returned);
    CHECK(!got_permit);
    CHECK(limiter.active() == 1);
}

TEST_CASE("ConcurrencyLimiter - never exceeds capacity", "[limiter]") {
    constexpr std::size_t capacity = 3;
    ConcurrencyLimiter limiter(capacity);
    std::atomic<std::size_t> inside{0};
    std::atomic<std::size_t> max_inside{0};
    std::atomic<int> missing{0};

    {
        std::vector<std::jthread> workers;
        for (int i = 0; i < 12; ++i) {
            workers.emplace_back([&](std::stop_token st) {
                auto p = limiter.acquire(st);
                if (!p) {
                    ++missing;
                    return;
                }
                auto now = ++inside;
                auto prev = max_inside.load();
                while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                --inside;
            });
        }
    }

    CHECK(missing == 0);
    CHECK(max_inside <= capacity);
    CHECK(limiter.peak() <= capacity);
    CHECK(limiter.peak() >= 1);
    CHECK(limiter.active() == 0);
}
