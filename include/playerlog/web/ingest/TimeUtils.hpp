#pragma once

#include <chrono>
#include <string>

namespace PL::Ingest {

// ISO-8601 UTC with milliseconds, e.g. 2026-01-11T09:30:00.123Z.
auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

// Server-local "dd/mm/YYYY HH:MM:SS", the fallback timestamp of log entries.
auto format_log_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

// Client-local "dd/mm/YYYY, HH:MM:SS", the timestamp the capture agent sends.
auto format_client_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

// Compact UTC "YYYYmmdd_HHMMSS" used in rotated file names.
auto format_rotation_stamp(std::chrono::system_clock::time_point tp) -> std::string;

} // namespace PL::Ingest
