#pragma once

#include <playerlog/core/Error.hpp>
#include <playerlog/web/ingest/ErrorRecord.hpp>
#include <playerlog/web/ingest/LogStore.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace PL::Ingest {

inline constexpr std::string_view kClientErrorTag   = "CLIENT ERROR";
inline constexpr std::size_t      kSeparatorWidth   = 80;
inline constexpr std::string_view kStackTraceLabel  = "Stack Trace";

namespace FieldLabel {
inline constexpr std::string_view Source    = "Source";
inline constexpr std::string_view Context   = "Context";
inline constexpr std::string_view Message   = "Message";
inline constexpr std::string_view Url       = "URL";
inline constexpr std::string_view UserAgent = "User Agent";
inline constexpr std::string_view Dns       = "DNS";
inline constexpr std::string_view Cors      = "CORS";
inline constexpr std::string_view Https     = "HTTPS";
inline constexpr std::string_view Ip        = "IP";
} // namespace FieldLabel

/*
 * Client error entry layout; log viewers depend on the label order:
 *
 *   [<timestamp>] [CLIENT ERROR]
 *     Source: ...
 *     Context: ...
 *     Message: ...
 *     URL: ...
 *     User Agent: ...
 *     DNS: ...
 *     CORS: true|false|Unknown
 *     HTTPS: true|false|Unknown
 *     Stack Trace:          (only when a trace was sent)
 *       <trimmed line>
 *     IP: ...
 *   <80 dashes>
 */
auto FormatClientErrorEntry(ErrorRecord const& record, std::string_view client_ip) -> std::string;

auto FormatEventLine(std::string_view timestamp, LogLevel level, std::string_view message)
    -> std::string;

struct ParsedLogEntry {
    std::string                                      timestamp;
    std::string                                      level;
    std::string                                      message; // event lines only
    std::vector<std::pair<std::string, std::string>> fields;
    std::vector<std::string>                         stack_trace;

    auto field(std::string_view label) const -> std::optional<std::string>;
    auto is_client_error() const -> bool { return level == kClientErrorTag; }
};

// Splits log text back into entries. Fails on a line that belongs to no entry
// or on a client error entry that is missing its separator.
auto ParseLogEntries(std::string_view text) -> PL::Expected<std::vector<ParsedLogEntry>>;

} // namespace PL::Ingest
