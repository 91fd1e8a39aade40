#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace httplib {
class Request;
class Response;
}

namespace PL::Ingest {

struct IngestOptions;
struct IngestLogHooks;
class LogStore;
class FixedWindowRateLimiter;
class MetricsCollector;

// Services one request handler needs. Every member outlives the HTTP server.
struct HttpRequestContext {
    IngestOptions const&    options;
    LogStore&               log_store;
    FixedWindowRateLimiter& rate_limiter;
    MetricsCollector&       metrics;
    IngestLogHooks const&   log_hooks;
};

inline constexpr std::string_view kJsonContentType = "application/json";

// The transport peer address; falls back to X-Forwarded-For, then "unknown".
auto get_client_address(httplib::Request const& req) -> std::string;

void apply_cors_headers(httplib::Response& res);

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status);

void respond_error(httplib::Response& res, int status, std::string_view message);
void respond_method_not_allowed(httplib::Response& res);
void respond_rate_limited(httplib::Response& res);
void respond_log_failure(httplib::Response& res, std::string_view reason);
void respond_logged(httplib::Response& res, std::string_view timestamp);
void respond_preflight(httplib::Response& res);

void log_info(HttpRequestContext const& ctx, std::string_view message);
void log_error(HttpRequestContext const& ctx, std::string_view message);

} // namespace PL::Ingest
