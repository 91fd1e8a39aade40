#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace PL::Ingest {

struct IngestOptions {
    std::string  host{"127.0.0.1"};
    int          port{8080};
    std::string  route{"/logger"};
    std::string  application_log{"logs/app_errors.log"};
    std::string  runtime_log{"logs/php_errors.log"};
    std::string  database_log{"logs/database_errors.log"};
    std::int64_t rate_limit_window_seconds{60};
    std::int64_t rate_limit_max_requests{10};
    std::int64_t max_log_bytes{10 * 1024 * 1024};
    std::int64_t max_body_bytes{1024 * 1024};
    bool         event_log_enabled{true};
    bool         log_rate_limit_denials{false};
    bool         show_help{false};
};

auto ParseIngestArguments(int argc, char** argv) -> std::optional<IngestOptions>;

void PrintIngestUsage();

bool ApplyIngestEnvOverrides(IngestOptions& options);

auto ValidateIngestOptions(IngestOptions const& options) -> std::optional<std::string>;

bool IsValidIngestPort(int port);
bool IsValidIngestRoute(std::string_view route);

} // namespace PL::Ingest
