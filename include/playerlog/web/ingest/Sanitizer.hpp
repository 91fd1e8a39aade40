#pragma once

#include <playerlog/web/ingest/ErrorRecord.hpp>

#include <string>
#include <string_view>

namespace PL::Ingest {

// Removes tag-like markup (<...>, comments, processing instructions). A '<'
// that cannot open a tag, e.g. "a < b", is kept as text.
auto StripTags(std::string_view text) -> std::string;

// HTML-escapes & < > " ' and escapes control characters (\n, \r, \xNN) so the
// value stays on one log line.
auto EscapeText(std::string_view text) -> std::string;

// StripTags followed by EscapeText.
auto SanitizeText(std::string_view text) -> std::string;

// SanitizeText plus entity-escaped brackets; the timestamp sits inside the
// bracketed entry header, where a ']' would end it early.
auto SanitizeTimestamp(std::string_view text) -> std::string;

// Sanitizes every string member of the record, each stack line included.
auto SanitizeRecord(ErrorRecord record) -> ErrorRecord;

} // namespace PL::Ingest
