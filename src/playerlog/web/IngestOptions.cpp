#include <playerlog/web/IngestOptions.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>

namespace PL::Ingest {

namespace {

constexpr std::string_view kReservedRoutes[] = {"/healthz", "/metrics"};

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidIngestPort(int port) {
    return port > 0 && port <= 65535;
}

bool IsValidIngestRoute(std::string_view route) {
    if (route.size() < 2 || route.front() != '/') {
        return false;
    }
    for (auto ch : route) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == '?' || ch == '#') {
            return false;
        }
    }
    return std::find(std::begin(kReservedRoutes), std::end(kReservedRoutes), route)
           == std::end(kReservedRoutes);
}

auto ValidateIngestOptions(IngestOptions const& options) -> std::optional<std::string> {
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidIngestPort(options.port)) {
        return std::string{"--port must be within 1-65535"};
    }
    if (!IsValidIngestRoute(options.route)) {
        return std::string{"--route must be an absolute path other than /healthz and /metrics"};
    }
    if (options.application_log.empty()) {
        return std::string{"--app-log must not be empty"};
    }
    if (options.runtime_log.empty()) {
        return std::string{"--error-log must not be empty"};
    }
    if (options.database_log.empty()) {
        return std::string{"--db-log must not be empty"};
    }
    if (options.application_log == options.runtime_log || options.application_log == options.database_log
        || options.runtime_log == options.database_log) {
        return std::string{"--app-log, --error-log and --db-log must name different files"};
    }
    if (options.rate_limit_window_seconds <= 0) {
        return std::string{"--rate-limit-window must be > 0"};
    }
    if (options.rate_limit_max_requests < 0) {
        return std::string{"--rate-limit-max must be >= 0"};
    }
    if (options.max_log_bytes < 0) {
        return std::string{"--max-log-bytes must be >= 0"};
    }
    if (options.max_body_bytes <= 0) {
        return std::string{"--max-body-bytes must be > 0"};
    }
    return std::nullopt;
}

bool ApplyIngestEnvOverrides(IngestOptions& options) {
    auto apply_non_empty = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << key << " must not be empty\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    auto apply_i64 = [&](char const* key, std::int64_t& target, std::int64_t min, char const* message) {
        return apply_env(key, [&](std::string_view value) {
            std::int64_t parsed = target;
            if (!parse_integer_in_range<std::int64_t>(value, min, std::numeric_limits<std::int64_t>::max(), parsed)) {
                std::cerr << key << ' ' << message << "\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    auto apply_flag = [&](char const* key, bool& target) {
        return apply_env(key, [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed) {
                std::cerr << key << " must be a boolean (1/0, true/false, yes/no, on/off)\n";
                return false;
            }
            target = *parsed;
            return true;
        });
    };

    if (!apply_non_empty("PLAYERLOG_INGEST_HOST", options.host)) {
        return false;
    }

    if (!apply_env("PLAYERLOG_INGEST_PORT", [&](std::string_view value) {
            int parsed = options.port;
            if (!parse_integer_in_range<int>(value, 1, 65535, parsed)) {
                std::cerr << "PLAYERLOG_INGEST_PORT must be within 1-65535\n";
                return false;
            }
            options.port = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("PLAYERLOG_INGEST_ROUTE", [&](std::string_view value) {
            if (!IsValidIngestRoute(value)) {
                std::cerr << "PLAYERLOG_INGEST_ROUTE must be an absolute path other than /healthz and /metrics\n";
                return false;
            }
            options.route = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_non_empty("PLAYERLOG_INGEST_APP_LOG", options.application_log)
        || !apply_non_empty("PLAYERLOG_INGEST_ERROR_LOG", options.runtime_log)
        || !apply_non_empty("PLAYERLOG_INGEST_DB_LOG", options.database_log)) {
        return false;
    }

    if (!apply_i64("PLAYERLOG_INGEST_RATE_LIMIT_WINDOW", options.rate_limit_window_seconds, 1, "must be > 0")
        || !apply_i64("PLAYERLOG_INGEST_RATE_LIMIT_MAX", options.rate_limit_max_requests, 0, "must be >= 0")
        || !apply_i64("PLAYERLOG_INGEST_MAX_LOG_BYTES", options.max_log_bytes, 0, "must be >= 0")
        || !apply_i64("PLAYERLOG_INGEST_MAX_BODY_BYTES", options.max_body_bytes, 1, "must be > 0")) {
        return false;
    }

    if (!apply_flag("PLAYERLOG_INGEST_EVENT_LOG", options.event_log_enabled)
        || !apply_flag("PLAYERLOG_INGEST_LOG_RATE_LIMIT_DENIALS", options.log_rate_limit_denials)) {
        return false;
    }

    return true;
}

void PrintIngestUsage() {
    std::cout << "Usage: playerlog_ingest [options]\n"
              << "  --host <host>                 Bind address (default 127.0.0.1)\n"
              << "  --port <port>                 Bind port (default 8080)\n"
              << "  --route <path>                Ingestion route (default /logger, /logger.php is always served)\n"
              << "  --app-log <file>              Application log (default logs/app_errors.log)\n"
              << "  --error-log <file>            Runtime error log (default logs/php_errors.log)\n"
              << "  --db-log <file>               Database error log (default logs/database_errors.log)\n"
              << "  --rate-limit-window <sec>     Rate-limit window in seconds (default 60)\n"
              << "  --rate-limit-max <n>          Reports per window per client, 0 disables (default 10)\n"
              << "  --max-log-bytes <n>           Rotate a log once it exceeds n bytes, 0 disables (default 10485760)\n"
              << "  --max-body-bytes <n>          Largest accepted request body (default 1048576)\n"
              << "  --disable-event-log           Do not write INFO/WARNING/ERROR event lines\n"
              << "  --log-rate-limit-denials      Write a WARNING event for every rate-limited report\n"
              << "  --help                        Show this help\n"
              << "Environment: PLAYERLOG_INGEST_<FLAG> (e.g. PLAYERLOG_INGEST_PORT) is applied before flags.\n"
              << "             PLAYERLOG_LOG=1 enables debug logging when built with PLAYERLOG_DEBUG_LOG.\n";
}

std::optional<IngestOptions> ParseIngestArguments(int argc, char** argv) {
    IngestOptions options{};
    if (!ApplyIngestEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto parse_path = [&](int& index, std::string_view flag, std::string& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        if (value->empty()) {
            std::cerr << flag << " must not be empty\n";
            return false;
        }
        target = std::string{*value};
        return true;
    };

    auto parse_i64 = [&](int& index, std::string_view flag, std::int64_t min, std::int64_t& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        std::int64_t parsed = target;
        if (!parse_integer_in_range<std::int64_t>(*value, min, std::numeric_limits<std::int64_t>::max(), parsed)) {
            std::cerr << flag << " must be >= " << min << "\n";
            return false;
        }
        target = parsed;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--host") {
            if (!parse_path(i, "--host", options.host)) {
                return std::nullopt;
            }
        } else if (arg == "--port") {
            if (auto value = require_value(i, "--port")) {
                int parsed = options.port;
                if (!parse_integer_in_range<int>(*value, 1, 65535, parsed)) {
                    std::cerr << "--port must be within 1-65535\n";
                    return std::nullopt;
                }
                options.port = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--route") {
            if (auto value = require_value(i, "--route")) {
                if (!IsValidIngestRoute(*value)) {
                    std::cerr << "--route must be an absolute path other than /healthz and /metrics\n";
                    return std::nullopt;
                }
                options.route = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--app-log") {
            if (!parse_path(i, "--app-log", options.application_log)) {
                return std::nullopt;
            }
        } else if (arg == "--error-log") {
            if (!parse_path(i, "--error-log", options.runtime_log)) {
                return std::nullopt;
            }
        } else if (arg == "--db-log") {
            if (!parse_path(i, "--db-log", options.database_log)) {
                return std::nullopt;
            }
        } else if (arg == "--rate-limit-window") {
            if (!parse_i64(i, "--rate-limit-window", 1, options.rate_limit_window_seconds)) {
                return std::nullopt;
            }
        } else if (arg == "--rate-limit-max") {
            if (!parse_i64(i, "--rate-limit-max", 0, options.rate_limit_max_requests)) {
                return std::nullopt;
            }
        } else if (arg == "--max-log-bytes") {
            if (!parse_i64(i, "--max-log-bytes", 0, options.max_log_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--max-body-bytes") {
            if (!parse_i64(i, "--max-body-bytes", 1, options.max_body_bytes)) {
                return std::nullopt;
            }
        } else if (arg == "--disable-event-log") {
            options.event_log_enabled = false;
        } else if (arg == "--log-rate-limit-denials") {
            options.log_rate_limit_denials = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.show_help) {
        return options;
    }

    if (auto error = ValidateIngestOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace PL::Ingest
