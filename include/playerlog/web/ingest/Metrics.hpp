#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

namespace httplib {
class Response;
}

namespace PL::Ingest {

enum class RouteMetric : std::size_t {
    Logger = 0,
    Healthz,
    Metrics,
    Count,
};

enum class IngestOutcome : std::size_t {
    Accepted = 0,
    ValidationFailure,
    StorageFailure,
    RateLimited,
    MethodNotAllowed,
    Count,
};

class MetricsCollector {
public:
    struct HistogramSnapshot {
        static constexpr std::size_t kBucketCount = 10;
        std::array<std::uint64_t, kBucketCount>   buckets{};
        std::uint64_t                             count{0};
        std::uint64_t                             sum_micros{0};
    };

    struct MetricsSnapshot {
        struct RouteCounters {
            HistogramSnapshot latency;
            std::uint64_t     total{0};
            std::uint64_t     errors{0};
        };

        std::chrono::system_clock::time_point                                   captured_at{};
        std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)> routes{};
        std::array<std::uint64_t, static_cast<std::size_t>(IngestOutcome::Count)> outcomes{};
        std::uint64_t                                                           rotations{0};
        std::uint64_t                                                           bytes_written{0};
    };

    void record_request(RouteMetric route, int status, std::chrono::microseconds latency);
    void record_outcome(IngestOutcome outcome);
    void record_rotation();
    void record_bytes_written(std::size_t bytes);

    auto outcome_count(IngestOutcome outcome) const -> std::uint64_t;

    auto capture_snapshot() const -> MetricsSnapshot;
    auto render_prometheus() const -> std::string;
    auto render_prometheus(MetricsSnapshot const& snapshot) const -> std::string;
    auto snapshot_json() const -> nlohmann::json;
    auto snapshot_json(MetricsSnapshot const& snapshot) const -> nlohmann::json;

private:
    class Histogram {
    public:
        void observe(std::chrono::microseconds value);
        auto snapshot() const -> HistogramSnapshot;
        static auto bucket_boundaries() -> std::array<double, HistogramSnapshot::kBucketCount> const&;

    private:
        static constexpr std::array<double, HistogramSnapshot::kBucketCount> kLatencyBucketsMs{
            1.0,   5.0,    20.0,   50.0,   100.0,
            250.0, 500.0,  1000.0, 2500.0, std::numeric_limits<double>::infinity()};

        std::array<std::atomic<std::uint64_t>, HistogramSnapshot::kBucketCount> buckets_{};
        std::atomic<std::uint64_t>                                               count_{0};
        std::atomic<std::uint64_t>                                               sum_micros_{0};
    };

    struct RouteCounters {
        Histogram                  latency;
        std::atomic<std::uint64_t> total{0};
        std::atomic<std::uint64_t> errors{0};
    };

    std::array<RouteCounters, static_cast<std::size_t>(RouteMetric::Count)>                routes_{};
    std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(IngestOutcome::Count)> outcomes_{};
    std::atomic<std::uint64_t>                                                             rotations_{0};
    std::atomic<std::uint64_t>                                                             bytes_written_{0};
    mutable std::atomic<std::uint64_t>                                                     metrics_scrapes_{0};
};

class RequestMetricsScope {
public:
    RequestMetricsScope(MetricsCollector& metrics, RouteMetric route, httplib::Response& res);
    ~RequestMetricsScope();

private:
    MetricsCollector&                     metrics_;
    RouteMetric                           route_;
    httplib::Response&                    response_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace PL::Ingest
