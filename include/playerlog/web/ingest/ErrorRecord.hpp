#pragma once

#include <playerlog/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PL::Ingest {

inline constexpr std::string_view kDefaultSource  = "Unknown";
inline constexpr std::string_view kDefaultContext = "General";
inline constexpr std::string_view kUnknownField   = "Unknown";

/**
 * One client-observed failure. Built once by the capture agent, parsed and
 * sanitized by the ingestion endpoint, then written as a single log entry.
 *
 * Optional members are "absent" on the wire (missing key or JSON null) and
 * render as "Unknown" in the log.
 */
struct ErrorRecord {
    std::optional<std::string> timestamp;
    std::string                message;
    std::string                source{kDefaultSource};
    std::string                context{kDefaultContext};
    std::optional<std::string> user_agent;
    std::optional<std::string> page_url;
    std::optional<std::string> endpoint_dns;
    std::optional<bool>        cors_enabled;
    std::optional<bool>        https_enabled;
    std::vector<std::string>   stack_trace;
};

// Wire keys, shared by the capture agent and the ingestion endpoint.
namespace WireKey {
inline constexpr char const* Timestamp = "timestamp";
inline constexpr char const* Message   = "message";
inline constexpr char const* Source    = "source";
inline constexpr char const* Context   = "context";
inline constexpr char const* UserAgent = "userAgent";
inline constexpr char const* Url       = "url";
inline constexpr char const* Dns       = "dns";
inline constexpr char const* Cors      = "cors";
inline constexpr char const* Https     = "https";
inline constexpr char const* Stack     = "stack";
} // namespace WireKey

auto ParseErrorRecord(std::string_view body) -> PL::Expected<ErrorRecord>;
auto ParseErrorRecord(nlohmann::json const& payload) -> PL::Expected<ErrorRecord>;

auto ErrorRecordToJson(ErrorRecord const& record) -> nlohmann::json;

// Fills in the server-side timestamp when the client did not send one.
void ResolveTimestamp(ErrorRecord& record, std::chrono::system_clock::time_point now);

// Splits a browser-style stack string into lines; a trailing empty line is dropped.
auto SplitStackTrace(std::string_view stack) -> std::vector<std::string>;

} // namespace PL::Ingest
