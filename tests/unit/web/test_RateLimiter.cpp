#include <doctest/doctest.h>
#include <playerlog/web/ingest/RateLimiter.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using PL::Ingest::FixedWindowRateLimiter;
using namespace std::chrono_literals;

TEST_CASE("RateLimiter admits up to the ceiling within one window") {
    FixedWindowRateLimiter limiter{10, 60s};
    auto const             start = FixedWindowRateLimiter::Clock::now();

    for (int i = 0; i < 10; ++i) {
        CHECK(limiter.admit("203.0.113.7", start + std::chrono::seconds{i}));
    }
    CHECK_FALSE(limiter.admit("203.0.113.7", start + 30s));

    auto counter = limiter.counter("203.0.113.7");
    REQUIRE(counter.has_value());
    CHECK(counter->count == 10);
    CHECK(counter->window_start == start);
}

TEST_CASE("RateLimiter denials do not extend the count") {
    FixedWindowRateLimiter limiter{2, 60s};
    auto const             start = FixedWindowRateLimiter::Clock::now();
    CHECK(limiter.admit("a", start));
    CHECK(limiter.admit("a", start));
    for (int i = 0; i < 5; ++i) {
        CHECK_FALSE(limiter.admit("a", start + 1s));
    }
    CHECK(limiter.counter("a")->count == 2);
}

TEST_CASE("RateLimiter resets an exhausted identity after the window") {
    FixedWindowRateLimiter limiter{10, 60s};
    auto const             start = FixedWindowRateLimiter::Clock::now();
    for (int i = 0; i < 10; ++i) {
        REQUIRE(limiter.admit("198.51.100.1", start));
    }
    REQUIRE_FALSE(limiter.admit("198.51.100.1", start + 59s));

    SUBCASE("exactly at the boundary is still the same window") {
        CHECK_FALSE(limiter.admit("198.51.100.1", start + 60s));
    }
    SUBCASE("past the boundary restarts at one") {
        auto const later = start + 61s;
        CHECK(limiter.admit("198.51.100.1", later));
        auto counter = limiter.counter("198.51.100.1");
        REQUIRE(counter.has_value());
        CHECK(counter->count == 1);
        CHECK(counter->window_start == later);
    }
}

TEST_CASE("RateLimiter keeps identities independent") {
    FixedWindowRateLimiter limiter{1, 60s};
    auto const             now = FixedWindowRateLimiter::Clock::now();
    CHECK(limiter.admit("a", now));
    CHECK_FALSE(limiter.admit("a", now));
    CHECK(limiter.admit("b", now));
    CHECK(limiter.identity_count() == 2);
}

TEST_CASE("RateLimiter maps missing identities to unknown") {
    CHECK(PL::Ingest::NormalizeIdentity("") == "unknown");
    CHECK(PL::Ingest::NormalizeIdentity("   ") == "unknown");
    CHECK(PL::Ingest::NormalizeIdentity(" 10.0.0.1 ") == "10.0.0.1");

    FixedWindowRateLimiter limiter{1, 60s};
    auto const             now = FixedWindowRateLimiter::Clock::now();
    CHECK(limiter.admit("", now));
    CHECK_FALSE(limiter.admit("unknown", now));
    CHECK(limiter.counter("").has_value());
}

TEST_CASE("RateLimiter with a zero ceiling admits everything") {
    FixedWindowRateLimiter limiter{0, 60s};
    for (int i = 0; i < 100; ++i) {
        CHECK(limiter.admit("flood"));
    }
    CHECK(limiter.identity_count() == 0);
}

TEST_CASE("RateLimiter never admits more than the ceiling under contention") {
    constexpr int          kThreads   = 8;
    constexpr int          kPerThread = 50;
    FixedWindowRateLimiter limiter{10, 60s};
    auto const             now = FixedWindowRateLimiter::Clock::now();

    std::atomic<int>         admitted{0};
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kPerThread; ++i) {
                if (limiter.admit("shared", now)) {
                    admitted.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(admitted.load() == 10);
    CHECK(limiter.counter("shared")->count == 10);
}
