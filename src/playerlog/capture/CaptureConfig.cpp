#include <playerlog/capture/CaptureConfig.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <iterator>

namespace PL::Capture {

namespace {

bool is_http_url(std::string_view value) {
    return value.starts_with("http://") || value.starts_with("https://");
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

bool parse_positive(std::string_view text, std::uint64_t& out) {
    std::uint64_t value{};
    auto          result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || value == 0) {
        return false;
    }
    out = value;
    return true;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

auto to_string(IssueSeverity severity) -> std::string_view {
    switch (severity) {
    case IssueSeverity::Warning:
        return "WARNING";
    case IssueSeverity::Error:
        return "ERROR";
    }
    return "WARNING";
}

auto ValidateCaptureConfig(CaptureConfig const& config) -> std::vector<ConfigIssue> {
    std::vector<ConfigIssue> issues;
    bool const placeholder_dns = config.dns && *config.dns == kPlaceholderDns;

    if (placeholder_dns) {
        issues.push_back(ConfigIssue{
            .severity = IssueSeverity::Warning,
            .message  = "DNS is set to default value. Please configure your IPTV provider URL.",
            .setting  = "dns",
        });
    }
    if (placeholder_dns && config.cors.value_or(false)) {
        issues.push_back(ConfigIssue{
            .severity = IssueSeverity::Error,
            .message  = "CORS is enabled but DNS is not configured. Player will not work.",
            .setting  = "dns and cors",
        });
    }
    if (!is_http_url(config.endpoint_url)) {
        issues.push_back(ConfigIssue{
            .severity = IssueSeverity::Error,
            .message  = "Report endpoint must be an http(s) URL.",
            .setting  = "endpoint_url",
        });
    }
    return issues;
}

bool ApplyCaptureEnvOverrides(CaptureConfig& config) {
    auto apply_text = [&](char const* key, std::optional<std::string>& target) {
        return apply_env(key, [&](std::string_view value) {
            target = std::string{value};
            return true;
        });
    };

    auto apply_flag = [&](char const* key, auto& target) {
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

    if (!apply_env("PLAYERLOG_CAPTURE_ENDPOINT", [&](std::string_view value) {
            if (!is_http_url(value)) {
                std::cerr << "PLAYERLOG_CAPTURE_ENDPOINT must be an http(s) URL\n";
                return false;
            }
            config.endpoint_url = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_text("PLAYERLOG_CAPTURE_DNS", config.dns)
        || !apply_text("PLAYERLOG_CAPTURE_USER_AGENT", config.user_agent)
        || !apply_text("PLAYERLOG_CAPTURE_PAGE_URL", config.page_url)) {
        return false;
    }

    if (!apply_flag("PLAYERLOG_CAPTURE_CORS", config.cors) || !apply_flag("PLAYERLOG_CAPTURE_HTTPS", config.https)
        || !apply_flag("PLAYERLOG_CAPTURE_ENABLED", config.enabled)
        || !apply_flag("PLAYERLOG_CAPTURE_DEBUG", config.debug_mode)) {
        return false;
    }

    if (!apply_env("PLAYERLOG_CAPTURE_TIMEOUT_MS", [&](std::string_view value) {
            std::uint64_t parsed = 0;
            if (!parse_positive(value, parsed)) {
                std::cerr << "PLAYERLOG_CAPTURE_TIMEOUT_MS must be > 0\n";
                return false;
            }
            config.timeout = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(parsed)};
            return true;
        })) {
        return false;
    }

    if (!apply_env("PLAYERLOG_CAPTURE_MAX_QUEUE", [&](std::string_view value) {
            std::uint64_t parsed = 0;
            if (!parse_positive(value, parsed)) {
                std::cerr << "PLAYERLOG_CAPTURE_MAX_QUEUE must be > 0\n";
                return false;
            }
            config.max_queue = static_cast<std::size_t>(parsed);
            return true;
        })) {
        return false;
    }

    return true;
}

} // namespace PL::Capture
