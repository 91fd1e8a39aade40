#include <playerlog/web/ingest/RateLimiter.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cctype>

namespace PL::Ingest {

auto NormalizeIdentity(std::string_view identity) -> std::string {
    while (!identity.empty() && std::isspace(static_cast<unsigned char>(identity.front())) != 0) {
        identity.remove_prefix(1);
    }
    while (!identity.empty() && std::isspace(static_cast<unsigned char>(identity.back())) != 0) {
        identity.remove_suffix(1);
    }
    if (identity.empty()) {
        return std::string{kUnknownIdentity};
    }
    return std::string{identity};
}

FixedWindowRateLimiter::FixedWindowRateLimiter(std::int64_t max_requests, std::chrono::seconds window)
    : max_requests_{std::max<std::int64_t>(max_requests, 0)}
    , window_{std::max(window, std::chrono::seconds{0})} {}

auto FixedWindowRateLimiter::admit(std::string_view identity, Clock::time_point now) -> bool {
    if (!enabled()) {
        return true;
    }

    auto const key      = NormalizeIdentity(identity);
    bool       admitted = false;

    auto const admitExisting = [&](CounterMap::value_type& entry) {
        auto& counter = entry.second;
        if ((now - counter.window_start) > window_) {
            counter.window_start = now;
            counter.count        = 1;
            admitted             = true;
        } else if (counter.count < max_requests_) {
            ++counter.count;
            admitted = true;
        }
    };
    auto const createCounter = [&](CounterMap::constructor const& constructor) {
        constructor(key, Counter{.window_start = now, .count = 1});
        admitted = true;
    };
    counters_.lazy_emplace_l(key, admitExisting, createCounter);

    if (!admitted) {
        pl_log("denied " + key, "RateLimiter");
    }
    return admitted;
}

auto FixedWindowRateLimiter::counter(std::string_view identity) const -> std::optional<Counter> {
    std::optional<Counter> result;
    counters_.if_contains(NormalizeIdentity(identity),
                          [&](CounterMap::value_type const& entry) { result = entry.second; });
    return result;
}

auto FixedWindowRateLimiter::identity_count() const -> std::size_t {
    return counters_.size();
}

auto FixedWindowRateLimiter::enabled() const -> bool {
    return max_requests_ > 0 && window_.count() > 0;
}

} // namespace PL::Ingest
