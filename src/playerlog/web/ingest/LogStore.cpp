#include <playerlog/web/ingest/LogStore.hpp>

#include <playerlog/web/ingest/LogEntryFormat.hpp>
#include <playerlog/web/ingest/TimeUtils.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace PL::Ingest {

namespace {

inline auto errnoMessage(std::string_view prefix, std::filesystem::path const& path) -> Error {
    return Error{Error::Code::StorageFailure,
                 std::string(prefix) + " " + path.string() + ": " + std::strerror(errno)};
}

inline auto fsError(std::string_view prefix, std::filesystem::path const& path, std::error_code const& ec)
    -> Error {
    return Error{Error::Code::StorageFailure, std::string(prefix) + " " + path.string() + ": " + ec.message()};
}

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FileDescriptor(FileDescriptor const&)            = delete;
    FileDescriptor& operator=(FileDescriptor const&) = delete;

    auto get() const -> int { return fd_; }
    auto valid() const -> bool { return fd_ >= 0; }

private:
    int fd_{-1};
};

// Holds flock(LOCK_EX) for the lifetime of the guard; close() would drop it too,
// but unlocking first keeps the critical section explicit.
class FileLockGuard {
public:
    explicit FileLockGuard(int fd) : fd_(fd) {}
    ~FileLockGuard() {
        if (locked_) {
            ::flock(fd_, LOCK_UN);
        }
    }
    FileLockGuard(FileLockGuard const&)            = delete;
    FileLockGuard& operator=(FileLockGuard const&) = delete;

    auto lock() -> bool {
        int rc = 0;
        do {
            rc = ::flock(fd_, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        locked_ = (rc == 0);
        return locked_;
    }

private:
    int  fd_{-1};
    bool locked_{false};
};

auto write_all(int fd, std::string_view text) -> bool {
    auto const* data      = text.data();
    std::size_t remaining = text.size();
    while (remaining > 0) {
        auto written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

auto next_rotation_target(std::filesystem::path const& active, std::string const& stamp)
    -> std::filesystem::path {
    auto base      = active.string() + "." + stamp;
    auto candidate = std::filesystem::path{base + ".old"};
    std::error_code ec;
    for (int suffix = 1; std::filesystem::exists(candidate, ec); ++suffix) {
        candidate = std::filesystem::path{base + "." + std::to_string(suffix) + ".old"};
    }
    return candidate;
}

} // namespace

auto to_string(LogCategory category) -> std::string_view {
    switch (category) {
    case LogCategory::Application:
        return "application";
    case LogCategory::Runtime:
        return "runtime";
    case LogCategory::Database:
        return "database";
    case LogCategory::Count:
        break;
    }
    return "unknown";
}

auto to_string(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

LogStore::LogStore(LogStoreConfig config)
    : config_(std::move(config)) {
    channels_[static_cast<std::size_t>(LogCategory::Application)].path = config_.application_log;
    channels_[static_cast<std::size_t>(LogCategory::Runtime)].path     = config_.runtime_log;
    channels_[static_cast<std::size_t>(LogCategory::Database)].path    = config_.database_log;
}

auto LogStore::channel(LogCategory category) -> Channel& {
    return channels_[static_cast<std::size_t>(category)];
}

auto LogStore::active_path(LogCategory category) const -> std::filesystem::path const& {
    return channels_[static_cast<std::size_t>(category)].path;
}

auto LogStore::append(LogCategory category, std::string_view entry_text) -> PL::Expected<void> {
    auto&                       ch = channel(category);
    std::lock_guard<std::mutex> lock(ch.mutex);
    if (auto rotated = rotate_locked(ch); !rotated) {
        return std::unexpected(rotated.error());
    }
    return append_locked(ch, entry_text);
}

auto LogStore::rotate_if_oversize(LogCategory category)
    -> PL::Expected<std::optional<std::filesystem::path>> {
    auto&                       ch = channel(category);
    std::lock_guard<std::mutex> lock(ch.mutex);
    return rotate_locked(ch);
}

auto LogStore::write_event(LogCategory category, LogLevel level, std::string_view message)
    -> PL::Expected<void> {
    if (!config_.events_enabled) {
        return {};
    }
    auto line = FormatEventLine(format_log_timestamp(Clock::now()), level, message);
    return append(category, line);
}

auto LogStore::rotate_locked(Channel& ch) -> PL::Expected<std::optional<std::filesystem::path>> {
    if (config_.max_file_bytes == 0) {
        return std::optional<std::filesystem::path>{};
    }

    std::error_code ec;
    auto            size = std::filesystem::file_size(ch.path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return std::optional<std::filesystem::path>{};
        }
        return std::unexpected(fsError("Failed to stat log file", ch.path, ec));
    }
    if (size <= config_.max_file_bytes) {
        return std::optional<std::filesystem::path>{};
    }

    auto target = next_rotation_target(ch.path, format_rotation_stamp(Clock::now()));
    std::filesystem::rename(ch.path, target, ec);
    if (ec) {
        return std::unexpected(fsError("Failed to rotate log file", ch.path, ec));
    }
    pl_log("rotated " + ch.path.string() + " -> " + target.string(), "LogStore");

    if (config_.events_enabled) {
        auto notice = FormatEventLine(format_log_timestamp(Clock::now()),
                                      LogLevel::Info,
                                      "Log file rotated to: " + target.string());
        if (auto written = append_locked(ch, notice); !written) {
            return std::unexpected(written.error());
        }
    }
    return std::optional<std::filesystem::path>{std::move(target)};
}

auto LogStore::append_locked(Channel& ch, std::string_view text) -> PL::Expected<void> {
    auto parent = ch.path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(fsError("Failed to create log directory", parent, ec));
        }
    }

    FileDescriptor fd{::open(ch.path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644)};
    if (!fd.valid()) {
        return std::unexpected(errnoMessage("Failed to open log file", ch.path));
    }
    FileLockGuard guard{fd.get()};
    if (!guard.lock()) {
        return std::unexpected(errnoMessage("Failed to lock log file", ch.path));
    }
    if (!write_all(fd.get(), text)) {
        return std::unexpected(errnoMessage("Failed to write log file", ch.path));
    }
    return {};
}

auto LogStore::rotated_files(LogCategory category) const -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> files;
    auto const&                        active = active_path(category);
    auto                               dir    = active.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    auto const prefix = active.filename().string() + ".";

    std::error_code ec;
    std::filesystem::directory_iterator it{dir, ec};
    if (ec) {
        return files;
    }
    for (auto const& entry : it) {
        auto name = entry.path().filename().string();
        if (name.size() > prefix.size() && name.starts_with(prefix) && name.ends_with(".old")) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace PL::Ingest
