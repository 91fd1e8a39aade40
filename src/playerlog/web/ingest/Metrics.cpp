#include <playerlog/web/ingest/Metrics.hpp>

#include <playerlog/web/ingest/TimeUtils.hpp>

#include <httplib.h>

#include <cmath>
#include <sstream>
#include <utility>

namespace PL::Ingest {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<RouteMetric, char const*>, static_cast<std::size_t>(RouteMetric::Count)>
    kRouteMetricNames{{
        {RouteMetric::Logger, "logger"},
        {RouteMetric::Healthz, "healthz"},
        {RouteMetric::Metrics, "metrics"},
    }};

constexpr std::array<std::pair<IngestOutcome, char const*>, static_cast<std::size_t>(IngestOutcome::Count)>
    kOutcomeNames{{
        {IngestOutcome::Accepted, "accepted"},
        {IngestOutcome::ValidationFailure, "validation_failure"},
        {IngestOutcome::StorageFailure, "storage_failure"},
        {IngestOutcome::RateLimited, "rate_limited"},
        {IngestOutcome::MethodNotAllowed, "method_not_allowed"},
    }};

auto bucket_label(double boundary_ms) -> std::string {
    return std::isinf(boundary_ms) ? std::string{"+Inf"} : std::to_string(boundary_ms / 1000.0);
}

} // namespace

void MetricsCollector::Histogram::observe(std::chrono::microseconds value) {
    auto const micros = static_cast<std::uint64_t>(value.count());
    sum_micros_.fetch_add(micros, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    double const millis = static_cast<double>(micros) / 1000.0;
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (millis <= kLatencyBucketsMs[i]) {
            buckets_[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    buckets_.back().fetch_add(1, std::memory_order_relaxed);
}

auto MetricsCollector::Histogram::snapshot() const -> HistogramSnapshot {
    HistogramSnapshot snapshot{};
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        snapshot.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
    }
    snapshot.count      = count_.load(std::memory_order_relaxed);
    snapshot.sum_micros = sum_micros_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::Histogram::bucket_boundaries()
    -> std::array<double, HistogramSnapshot::kBucketCount> const& {
    return kLatencyBucketsMs;
}

void MetricsCollector::record_request(RouteMetric route, int status, std::chrono::microseconds latency) {
    auto const index = static_cast<std::size_t>(route);
    if (index >= routes_.size()) {
        return;
    }
    auto& counters = routes_[index];
    counters.latency.observe(latency);
    counters.total.fetch_add(1, std::memory_order_relaxed);
    int effective_status = status == 0 ? 200 : status;
    if (effective_status >= 400) {
        counters.errors.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_outcome(IngestOutcome outcome) {
    auto const index = static_cast<std::size_t>(outcome);
    if (index >= outcomes_.size()) {
        return;
    }
    outcomes_[index].fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_rotation() {
    rotations_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_bytes_written(std::size_t bytes) {
    bytes_written_.fetch_add(bytes, std::memory_order_relaxed);
}

auto MetricsCollector::outcome_count(IngestOutcome outcome) const -> std::uint64_t {
    auto const index = static_cast<std::size_t>(outcome);
    if (index >= outcomes_.size()) {
        return 0;
    }
    return outcomes_[index].load(std::memory_order_relaxed);
}

auto MetricsCollector::capture_snapshot() const -> MetricsSnapshot {
    MetricsSnapshot snapshot;
    snapshot.captured_at = std::chrono::system_clock::now();
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        snapshot.routes[i].latency = routes_[i].latency.snapshot();
        snapshot.routes[i].total   = routes_[i].total.load(std::memory_order_relaxed);
        snapshot.routes[i].errors  = routes_[i].errors.load(std::memory_order_relaxed);
    }
    for (std::size_t i = 0; i < outcomes_.size(); ++i) {
        snapshot.outcomes[i] = outcomes_[i].load(std::memory_order_relaxed);
    }
    snapshot.rotations     = rotations_.load(std::memory_order_relaxed);
    snapshot.bytes_written = bytes_written_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::render_prometheus() const -> std::string {
    auto snapshot = capture_snapshot();
    return render_prometheus(snapshot);
}

auto MetricsCollector::render_prometheus(MetricsSnapshot const& snapshot) const -> std::string {
    metrics_scrapes_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream out;

    out << "# HELP playerlog_ingest_request_duration_seconds Request latency histogram\n";
    out << "# TYPE playerlog_ingest_request_duration_seconds histogram\n";
    auto const& buckets = Histogram::bucket_boundaries();
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const&   route_stats = snapshot.routes[i];
        auto const*   name        = kRouteMetricNames[i].second;
        std::uint64_t cumulative  = 0;
        for (std::size_t b = 0; b < buckets.size(); ++b) {
            cumulative += route_stats.latency.buckets[b];
            out << "playerlog_ingest_request_duration_seconds_bucket{route=\"" << name
                << "\",le=\"" << bucket_label(buckets[b]) << "\"} " << cumulative << "\n";
        }
        double sum_seconds = route_stats.latency.sum_micros / 1'000'000.0;
        out << "playerlog_ingest_request_duration_seconds_sum{route=\"" << name << "\"} "
            << sum_seconds << "\n";
        out << "playerlog_ingest_request_duration_seconds_count{route=\"" << name << "\"} "
            << route_stats.latency.count << "\n";
    }

    out << "# HELP playerlog_ingest_requests_total Total HTTP requests\n";
    out << "# TYPE playerlog_ingest_requests_total counter\n";
    out << "# HELP playerlog_ingest_request_errors_total HTTP requests returning >=400\n";
    out << "# TYPE playerlog_ingest_request_errors_total counter\n";
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name = kRouteMetricNames[i].second;
        out << "playerlog_ingest_requests_total{route=\"" << name << "\"} "
            << snapshot.routes[i].total << "\n";
        out << "playerlog_ingest_request_errors_total{route=\"" << name << "\"} "
            << snapshot.routes[i].errors << "\n";
    }

    out << "# HELP playerlog_ingest_reports_total Client error reports by outcome\n";
    out << "# TYPE playerlog_ingest_reports_total counter\n";
    for (std::size_t i = 0; i < snapshot.outcomes.size(); ++i) {
        out << "playerlog_ingest_reports_total{outcome=\"" << kOutcomeNames[i].second << "\"} "
            << snapshot.outcomes[i] << "\n";
    }

    out << "# HELP playerlog_ingest_log_rotations_total Log files rotated\n";
    out << "# TYPE playerlog_ingest_log_rotations_total counter\n";
    out << "playerlog_ingest_log_rotations_total " << snapshot.rotations << "\n";

    out << "# HELP playerlog_ingest_log_bytes_written_total Bytes appended to log files\n";
    out << "# TYPE playerlog_ingest_log_bytes_written_total counter\n";
    out << "playerlog_ingest_log_bytes_written_total " << snapshot.bytes_written << "\n";

    out << "# HELP playerlog_ingest_metrics_scrapes_total Metrics scrapes\n";
    out << "# TYPE playerlog_ingest_metrics_scrapes_total counter\n";
    out << "playerlog_ingest_metrics_scrapes_total "
        << metrics_scrapes_.load(std::memory_order_relaxed) << "\n";

    return out.str();
}

auto MetricsCollector::snapshot_json() const -> json {
    auto snapshot = capture_snapshot();
    return snapshot_json(snapshot);
}

auto MetricsCollector::snapshot_json(MetricsSnapshot const& snapshot) const -> json {
    json payload;
    payload["captured_at"] = format_timestamp(snapshot.captured_at);

    json request_stats;
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name   = kRouteMetricNames[i].second;
        auto const& stats  = snapshot.routes[i];
        double      avg_ms = stats.latency.count == 0
                                 ? 0.0
                                 : static_cast<double>(stats.latency.sum_micros) / 1000.0
                                       / static_cast<double>(stats.latency.count);
        request_stats[name] = json{{"total", stats.total}, {"errors", stats.errors}, {"avg_ms", avg_ms}};
    }
    payload["requests"] = std::move(request_stats);

    json outcomes;
    for (std::size_t i = 0; i < snapshot.outcomes.size(); ++i) {
        outcomes[kOutcomeNames[i].second] = snapshot.outcomes[i];
    }
    payload["reports"] = std::move(outcomes);

    payload["log"] = json{{"rotations", snapshot.rotations}, {"bytes_written", snapshot.bytes_written}};
    return payload;
}

RequestMetricsScope::RequestMetricsScope(MetricsCollector& metrics, RouteMetric route, httplib::Response& res)
    : metrics_{metrics}
    , route_{route}
    , response_{res}
    , start_{std::chrono::steady_clock::now()} {}

RequestMetricsScope::~RequestMetricsScope() {
    auto duration = std::chrono::steady_clock::now() - start_;
    metrics_.record_request(route_,
                            response_.status,
                            std::chrono::duration_cast<std::chrono::microseconds>(duration));
}

} // namespace PL::Ingest
