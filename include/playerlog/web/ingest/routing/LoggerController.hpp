#pragma once

#include <memory>

#include <playerlog/core/Error.hpp>
#include <playerlog/web/IngestOptions.hpp>
#include <playerlog/web/ingest/ErrorRecord.hpp>
#include <playerlog/web/ingest/LogEntryFormat.hpp>
#include <playerlog/web/ingest/LogStore.hpp>
#include <playerlog/web/ingest/Metrics.hpp>
#include <playerlog/web/ingest/RateLimiter.hpp>
#include <playerlog/web/ingest/Sanitizer.hpp>
#include <playerlog/web/ingest/routing/HttpHelpers.hpp>

#include <httplib.h>

#include <chrono>
#include <string>

namespace PL::Ingest {

// Served in addition to the configured route so existing clients keep working.
inline constexpr std::string_view kLegacyLoggerRoute = "/logger.php";

namespace detail {

inline constexpr std::string_view kStorageFailureReason = "Unable to write log entry";

inline void record_storage_failure(HttpRequestContext& ctx, PL::Error const& error, httplib::Response& res) {
    ctx.metrics.record_outcome(IngestOutcome::StorageFailure);
    log_error(ctx, "[playerlog_ingest] " + describeError(error));
    // Best effort: the runtime log may live on the same failing disk.
    if (auto noted = ctx.log_store.write_event(LogCategory::Runtime,
                                               LogLevel::Error,
                                               "Failed to log client error: " + describeError(error));
        !noted) {
        log_error(ctx, "[playerlog_ingest] " + describeError(noted.error()));
    }
    respond_log_failure(res, kStorageFailureReason);
}

/*
 * POST handling order:
 *   1. admit the caller, 429 on deny (the log is not touched)
 *   2. rotate the application log when oversize
 *   3. parse, 500 on a missing message or malformed body
 *   4. sanitize
 *   5. format and append exactly one entry
 *   6. acknowledge with the accepted timestamp
 */
inline void handle_logger_request(HttpRequestContext& ctx,
                                  httplib::Request const& req,
                                  httplib::Response&      res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx.metrics, RouteMetric::Logger, res};

    if (req.method == "OPTIONS") {
        respond_preflight(res);
        return;
    }
    if (req.method != "POST") {
        ctx.metrics.record_outcome(IngestOutcome::MethodNotAllowed);
        respond_method_not_allowed(res);
        return;
    }

    auto const identity = get_client_address(req);
    if (!ctx.rate_limiter.admit(identity)) {
        ctx.metrics.record_outcome(IngestOutcome::RateLimited);
        if (ctx.options.log_rate_limit_denials) {
            if (auto noted = ctx.log_store.write_event(LogCategory::Application,
                                                       LogLevel::Warning,
                                                       "Rate limit exceeded for IP: " + SanitizeText(identity));
                !noted) {
                log_error(ctx, "[playerlog_ingest] " + describeError(noted.error()));
            }
        }
        respond_rate_limited(res);
        return;
    }

    auto rotated = ctx.log_store.rotate_if_oversize(LogCategory::Application);
    if (!rotated) {
        record_storage_failure(ctx, rotated.error(), res);
        return;
    }
    if (rotated->has_value()) {
        ctx.metrics.record_rotation();
        log_info(ctx, "[playerlog_ingest] Log file rotated to: " + rotated->value().string());
    }

    auto parsed = ParseErrorRecord(req.body);
    if (!parsed) {
        ctx.metrics.record_outcome(IngestOutcome::ValidationFailure);
        auto reason = parsed.error().message.value_or(std::string{errorCodeToString(parsed.error().code)});
        if (auto noted = ctx.log_store.write_event(LogCategory::Runtime,
                                                   LogLevel::Error,
                                                   "Failed to log client error: " + reason);
            !noted) {
            log_error(ctx, "[playerlog_ingest] " + describeError(noted.error()));
        }
        respond_log_failure(res, reason);
        return;
    }

    auto record = SanitizeRecord(std::move(*parsed));
    ResolveTimestamp(record, std::chrono::system_clock::now());

    auto entry    = FormatClientErrorEntry(record, SanitizeText(identity));
    auto appended = ctx.log_store.append(LogCategory::Application, entry);
    if (!appended) {
        record_storage_failure(ctx, appended.error(), res);
        return;
    }

    ctx.metrics.record_outcome(IngestOutcome::Accepted);
    ctx.metrics.record_bytes_written(entry.size());
    respond_logged(res, record.timestamp.value_or(std::string{}));
}

} // namespace detail

class LoggerController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<LoggerController> {
        return std::unique_ptr<LoggerController>(new LoggerController(ctx));
    }

    void register_routes(httplib::Server& server) {
        register_route(server, ctx_.options.route);
        if (ctx_.options.route != kLegacyLoggerRoute) {
            register_route(server, std::string{kLegacyLoggerRoute});
        }
    }

    ~LoggerController() = default;

private:
    explicit LoggerController(HttpRequestContext& ctx)
        : ctx_(ctx) {}

    void register_route(httplib::Server& server, std::string const& route) {
        auto handler = [this](httplib::Request const& req, httplib::Response& res) {
            detail::handle_logger_request(ctx_, req, res);
        };
        server.Post(route, handler);
        server.Options(route, handler);
        server.Get(route, handler);
        server.Put(route, handler);
        server.Patch(route, handler);
        server.Delete(route, handler);
    }

    HttpRequestContext& ctx_;
};

} // namespace PL::Ingest
