#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PL::Capture {

// The unconfigured provider address shipped in sample configurations.
inline constexpr std::string_view kPlaceholderDns = "http://domain.com:80";

/**
 * Client-side settings attached to every report. The ambient fields (dns,
 * cors, https, user_agent, page_url) are sent as-is; unset ones render as
 * "Unknown" on the server.
 */
struct CaptureConfig {
    std::string                endpoint_url{"http://127.0.0.1:8080/logger"};
    std::optional<std::string> dns;
    std::optional<bool>        cors;
    std::optional<bool>        https;
    std::optional<std::string> user_agent{"playerlog-capture/1.0"};
    std::optional<std::string> page_url;
    bool                       enabled{true};
    bool                       debug_mode{false};
    std::chrono::milliseconds  timeout{std::chrono::seconds{5}};
    std::size_t                max_queue{256};
};

enum class IssueSeverity {
    Warning,
    Error,
};

auto to_string(IssueSeverity severity) -> std::string_view;

struct ConfigIssue {
    IssueSeverity severity;
    std::string   message;
    std::string   setting;
};

auto ValidateCaptureConfig(CaptureConfig const& config) -> std::vector<ConfigIssue>;

// Reads PLAYERLOG_CAPTURE_{ENDPOINT,DNS,CORS,HTTPS,USER_AGENT,PAGE_URL,ENABLED,
// DEBUG,TIMEOUT_MS,MAX_QUEUE}. Returns false and prints to stderr on a bad value.
bool ApplyCaptureEnvOverrides(CaptureConfig& config);

} // namespace PL::Capture
