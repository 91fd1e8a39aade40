#include <playerlog/web/ingest/routing/HttpHelpers.hpp>

#include <playerlog/web/IngestServer.hpp>
#include <playerlog/web/ingest/RateLimiter.hpp>

#include <httplib.h>

#include <iostream>

namespace PL::Ingest {

auto get_client_address(httplib::Request const& req) -> std::string {
    if (!req.remote_addr.empty()) {
        return NormalizeIdentity(req.remote_addr);
    }
    auto forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) {
        // First hop only; later entries were appended by proxies.
        auto comma = forwarded.find(',');
        return NormalizeIdentity(std::string_view{forwarded}.substr(0, comma));
    }
    return std::string{kUnknownIdentity};
}

void apply_cors_headers(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "POST");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status) {
    res.status = status;
    apply_cors_headers(res);
    res.set_content(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    std::string{kJsonContentType});
}

void respond_error(httplib::Response& res, int status, std::string_view message) {
    write_json_response(res, nlohmann::json{{"status", "error"}, {"message", message}}, status);
}

void respond_method_not_allowed(httplib::Response& res) {
    respond_error(res, 405, "Method not allowed");
}

void respond_rate_limited(httplib::Response& res) {
    respond_error(res, 429, "Rate limit exceeded");
}

void respond_log_failure(httplib::Response& res, std::string_view reason) {
    respond_error(res, 500, std::string{"Failed to log error: "} + std::string{reason});
}

void respond_logged(httplib::Response& res, std::string_view timestamp) {
    write_json_response(res,
                        nlohmann::json{{"status", "success"},
                                       {"message", "Error logged successfully"},
                                       {"timestamp", timestamp}},
                        200);
}

void respond_preflight(httplib::Response& res) {
    res.status = 200;
    apply_cors_headers(res);
    res.set_header("Content-Type", std::string{kJsonContentType});
}

void log_info(HttpRequestContext const& ctx, std::string_view message) {
    if (ctx.log_hooks.info) {
        ctx.log_hooks.info(message);
        return;
    }
    std::cout << message << '\n';
}

void log_error(HttpRequestContext const& ctx, std::string_view message) {
    if (ctx.log_hooks.error) {
        ctx.log_hooks.error(message);
        return;
    }
    std::cerr << message << '\n';
}

} // namespace PL::Ingest
