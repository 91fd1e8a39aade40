#pragma once

#include <playerlog/core/Error.hpp>
#include <playerlog/web/IngestOptions.hpp>
#include <playerlog/web/ingest/LogStore.hpp>
#include <playerlog/web/ingest/Metrics.hpp>
#include <playerlog/web/ingest/RateLimiter.hpp>
#include <playerlog/web/ingest/routing/HttpHelpers.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace httplib {
class Server;
}

namespace PL::Ingest {

struct IngestLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

class LoggerController;

auto MakeLogStoreConfig(IngestOptions const& options) -> LogStoreConfig;

/**
 * The ingestion endpoint plus /healthz and /metrics.
 *
 * Owns the process's rate limiter, log store and metrics for its whole
 * lifetime. Port 0 binds an ephemeral port, reported by port() after start().
 */
class IngestServer {
public:
    explicit IngestServer(IngestOptions options, IngestLogHooks log_hooks = {});
    ~IngestServer();

    IngestServer(IngestServer const&)                    = delete;
    auto operator=(IngestServer const&) -> IngestServer& = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;
    auto join() -> void;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto port() const -> std::uint16_t;

    auto options() const -> IngestOptions const& { return options_; }
    auto log_store() -> LogStore& { return log_store_; }
    auto rate_limiter() -> FixedWindowRateLimiter& { return rate_limiter_; }
    auto metrics() -> MetricsCollector& { return metrics_; }

private:
    auto configure_routes(httplib::Server& server) -> void;

    IngestOptions                     options_;
    IngestLogHooks                    log_hooks_;
    LogStore                          log_store_;
    FixedWindowRateLimiter            rate_limiter_;
    MetricsCollector                  metrics_;
    HttpRequestContext                context_;
    std::unique_ptr<LoggerController> logger_controller_;
    std::unique_ptr<httplib::Server>  server_;
    std::thread                       server_thread_;
    std::atomic<bool>                 running_{false};
    std::uint16_t                     bound_port_ = 0;
    mutable std::mutex                mutex_;
};

int RunIngestServer(IngestOptions const& options);

int RunIngestServerWithStopFlag(IngestOptions const&                     options,
                                std::atomic<bool>&                       should_stop,
                                IngestLogHooks const&                    log_hooks = {},
                                std::function<void(PL::Expected<void>)> on_listen = {});

void RequestIngestStop();
void ResetIngestStopFlag();

} // namespace PL::Ingest
