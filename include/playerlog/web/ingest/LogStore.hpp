#pragma once

#include <playerlog/core/Error.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PL::Ingest {

enum class LogCategory : std::size_t {
    Application = 0, // accepted client errors and general events
    Runtime,         // failures of the ingestion service itself
    Database,
    Count,
};

enum class LogLevel {
    Info,
    Warning,
    Error,
};

auto to_string(LogCategory category) -> std::string_view;
auto to_string(LogLevel level) -> std::string_view;

inline constexpr std::uint64_t kDefaultMaxLogFileBytes = 10ull * 1024ull * 1024ull;

struct LogStoreConfig {
    std::filesystem::path application_log{"logs/app_errors.log"};
    std::filesystem::path runtime_log{"logs/php_errors.log"};
    std::filesystem::path database_log{"logs/database_errors.log"};
    std::uint64_t         max_file_bytes{kDefaultMaxLogFileBytes}; // 0 disables rotation
    bool                  events_enabled{true};
};

/**
 * Append-only, size-rotated plain-text log files, one per category.
 *
 * Every append runs "rotate if oversize, then append" under the category's
 * mutex, and the write itself holds flock(LOCK_EX) on the active file so other
 * processes appending to the same file never interleave with us. Active files
 * and their directories are created lazily by the first write. A rotated file
 * is renamed to `<active>.<YYYYmmdd_HHMMSS>.old` and never written again.
 */
class LogStore {
public:
    using Clock = std::chrono::system_clock;

    explicit LogStore(LogStoreConfig config);

    LogStore(LogStore const&)            = delete;
    LogStore& operator=(LogStore const&) = delete;

    auto append(LogCategory category, std::string_view entry_text) -> PL::Expected<void>;

    // Returns the rotated file's path when a rotation happened.
    auto rotate_if_oversize(LogCategory category) -> PL::Expected<std::optional<std::filesystem::path>>;

    // Appends "[timestamp] [LEVEL] message". No-op when events are disabled.
    auto write_event(LogCategory category, LogLevel level, std::string_view message)
        -> PL::Expected<void>;

    auto active_path(LogCategory category) const -> std::filesystem::path const&;
    auto rotated_files(LogCategory category) const -> std::vector<std::filesystem::path>;
    auto config() const -> LogStoreConfig const& { return config_; }

private:
    struct Channel {
        std::filesystem::path path;
        std::mutex            mutex;
    };

    auto channel(LogCategory category) -> Channel&;
    auto rotate_locked(Channel& channel) -> PL::Expected<std::optional<std::filesystem::path>>;
    auto append_locked(Channel& channel, std::string_view text) -> PL::Expected<void>;

    LogStoreConfig config_;
    std::array<Channel, static_cast<std::size_t>(LogCategory::Count)> channels_;
};

} // namespace PL::Ingest
