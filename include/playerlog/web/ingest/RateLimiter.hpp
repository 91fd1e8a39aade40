#pragma once

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace PL::Ingest {

inline constexpr std::string_view kUnknownIdentity = "unknown";

// Empty or unparseable caller addresses collapse onto one shared identity.
auto NormalizeIdentity(std::string_view identity) -> std::string;

/**
 * Fixed-window admission control keyed by caller identity.
 *
 * - A counter is created on the first request from an identity and never removed.
 * - Once more than `window` has elapsed since window_start the counter restarts at 1.
 * - Within a window at most `max_requests` calls are admitted; denials do not count.
 * - max_requests == 0 or a zero window disables limiting (everything is admitted).
 *
 * Concurrency: counters live in a sharded map whose submaps carry their own mutex,
 * so identities on different shards never contend and the read-modify-write of one
 * identity runs under its shard lock.
 */
class FixedWindowRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Counter {
        Clock::time_point window_start{};
        std::int64_t      count{0};
    };

    FixedWindowRateLimiter(std::int64_t max_requests, std::chrono::seconds window);

    auto admit(std::string_view identity, Clock::time_point now = Clock::now()) -> bool;

    auto counter(std::string_view identity) const -> std::optional<Counter>;
    auto identity_count() const -> std::size_t;

    auto max_requests() const -> std::int64_t { return max_requests_; }
    auto window() const -> std::chrono::seconds { return window_; }

private:
    static constexpr int kSubmaps = 8;

    using CounterMap = phmap::parallel_flat_hash_map<
        std::string,
        Counter,
        phmap::Hash<std::string>,
        phmap::EqualTo<std::string>,
        std::allocator<std::pair<const std::string, Counter>>,
        kSubmaps,
        std::mutex>;

    auto enabled() const -> bool;

    std::int64_t         max_requests_{0};
    std::chrono::seconds window_{0};
    CounterMap           counters_;
};

} // namespace PL::Ingest
