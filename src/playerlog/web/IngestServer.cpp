#include <httplib.h>

#include <playerlog/web/IngestServer.hpp>
#include <playerlog/web/ingest/routing/LoggerController.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace PL::Ingest {

static std::atomic<bool> g_should_stop{false};

namespace {

auto describe_configuration(IngestOptions const& options) -> std::string {
    std::string summary = "Client error ingestion started: route=" + options.route;
    summary += " rate_limit=" + std::to_string(options.rate_limit_max_requests) + "/"
               + std::to_string(options.rate_limit_window_seconds) + "s";
    summary += " max_log_bytes=" + std::to_string(options.max_log_bytes);
    return summary;
}

} // namespace

auto MakeLogStoreConfig(IngestOptions const& options) -> LogStoreConfig {
    return LogStoreConfig{
        .application_log = options.application_log,
        .runtime_log     = options.runtime_log,
        .database_log    = options.database_log,
        .max_file_bytes  = static_cast<std::uint64_t>(options.max_log_bytes < 0 ? 0 : options.max_log_bytes),
        .events_enabled  = options.event_log_enabled,
    };
}

IngestServer::IngestServer(IngestOptions options, IngestLogHooks log_hooks)
    : options_(std::move(options))
    , log_hooks_(std::move(log_hooks))
    , log_store_(MakeLogStoreConfig(options_))
    , rate_limiter_(options_.rate_limit_max_requests, std::chrono::seconds{options_.rate_limit_window_seconds})
    , context_{
          .options      = options_,
          .log_store    = log_store_,
          .rate_limiter = rate_limiter_,
          .metrics      = metrics_,
          .log_hooks    = log_hooks_,
      } {}

IngestServer::~IngestServer() {
    this->stop();
    this->join();
}

auto IngestServer::start() -> Expected<void> {
    std::unique_lock lock(mutex_);
    if (server_) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "Ingest server already running"});
    }

    server_ = std::make_unique<httplib::Server>();
    server_->set_payload_max_length(static_cast<std::size_t>(options_.max_body_bytes));
    this->configure_routes(*server_);

    int bound_port = options_.port;
    if (options_.port <= 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            return std::unexpected(Error{Error::Code::TransportFailure,
                                         "Failed to bind " + options_.host + " on an ephemeral port"});
        }
    } else if (!server_->bind_to_port(options_.host, options_.port)) {
        server_.reset();
        return std::unexpected(Error{Error::Code::TransportFailure,
                                     "Failed to bind " + options_.host + ":" + std::to_string(options_.port)});
    }

    bound_port_ = static_cast<std::uint16_t>(bound_port);
    running_.store(true);

    server_thread_ = std::thread([this]() {
        if (server_) {
            server_->listen_after_bind();
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();
    lock.lock();
    if (!server_ || !server_->is_running()) {
        if (server_) {
            server_->stop();
        }
        lock.unlock();
        this->join();
        lock.lock();
        server_.reset();
        bound_port_ = 0;
        running_.store(false);
        return std::unexpected(Error{Error::Code::TransportFailure, "Ingest server failed to start listening"});
    }

    if (auto noted = log_store_.write_event(LogCategory::Application, LogLevel::Info, describe_configuration(options_));
        !noted) {
        log_error(context_, "[playerlog_ingest] " + describeError(noted.error()));
    }
    pl_log("listening on port " + std::to_string(bound_port_), "IngestServer");
    return {};
}

auto IngestServer::stop() -> void {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    server_->stop();
    lock.unlock();
    this->join();
    lock.lock();
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

auto IngestServer::join() -> void {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

auto IngestServer::is_running() const -> bool {
    return running_.load();
}

auto IngestServer::port() const -> std::uint16_t {
    return bound_port_;
}

auto IngestServer::configure_routes(httplib::Server& server) -> void {
    logger_controller_ = LoggerController::Create(context_);
    logger_controller_->register_routes(server);

    server.Get("/healthz", [this](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics_, RouteMetric::Healthz, res};
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Get("/metrics", [this](httplib::Request const& req, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{metrics_, RouteMetric::Metrics, res};
        auto snapshot = metrics_.capture_snapshot();
        res.set_header("Cache-Control", "no-store");
        if (req.has_param("format") && req.get_param_value("format") == "json") {
            res.set_content(metrics_.snapshot_json(snapshot).dump(), "application/json");
            return;
        }
        res.set_content(metrics_.render_prometheus(snapshot), "text/plain; version=0.0.4");
    });
}

void RequestIngestStop() {
    g_should_stop.store(true);
}

void ResetIngestStopFlag() {
    g_should_stop.store(false);
}

int RunIngestServerWithStopFlag(IngestOptions const&                     options,
                                std::atomic<bool>&                       should_stop,
                                IngestLogHooks const&                    log_hooks,
                                std::function<void(PL::Expected<void>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    IngestServer server{options, log_hooks};
    auto         started = server.start();
    if (!started) {
        log_error("[playerlog_ingest] " + describeError(started.error()));
        if (on_listen) {
            on_listen(std::unexpected(started.error()));
        }
        return EXIT_FAILURE;
    }

    log_info("[playerlog_ingest] Listening on http://" + options.host + ":" + std::to_string(server.port())
             + options.route);
    if (on_listen) {
        on_listen({});
    }

    bool listener_died = false;
    while (!should_stop.load(std::memory_order_acquire)) {
        if (!server.is_running()) {
            listener_died = true;
            log_error("[playerlog_ingest] Listener stopped unexpectedly");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    log_info("[playerlog_ingest] Stopped");
    return listener_died ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunIngestServer(IngestOptions const& options) {
    return RunIngestServerWithStopFlag(options, g_should_stop, {}, {});
}

} // namespace PL::Ingest
