#include <playerlog/web/ingest/TimeUtils.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace PL::Ingest {

namespace {

bool gmtime_utc(std::time_t value, std::tm& out) {
#if defined(_WIN32)
    return gmtime_s(&out, &value) == 0;
#else
    return gmtime_r(&value, &out) != nullptr;
#endif
}

bool localtime_local(std::time_t value, std::tm& out) {
#if defined(_WIN32)
    return localtime_s(&out, &value) == 0;
#else
    return localtime_r(&value, &out) != nullptr;
#endif
}

std::string put_time_string(std::tm const& tm, char const* format) {
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace

auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    auto seconds_part = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis       = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds_part);
    std::time_t raw   = std::chrono::system_clock::to_time_t(seconds_part);
    std::tm tm{};
    if (!gmtime_utc(raw, tm)) {
        return "1970-01-01T00:00:00.000Z";
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setw(3) << std::setfill('0') << millis.count();
    oss << 'Z';
    return oss.str();
}

auto format_log_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    std::time_t raw = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!localtime_local(raw, tm)) {
        return "01/01/1970 00:00:00";
    }
    return put_time_string(tm, "%d/%m/%Y %H:%M:%S");
}

auto format_client_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
    std::time_t raw = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!localtime_local(raw, tm)) {
        return "01/01/1970, 00:00:00";
    }
    return put_time_string(tm, "%d/%m/%Y, %H:%M:%S");
}

auto format_rotation_stamp(std::chrono::system_clock::time_point tp) -> std::string {
    std::time_t raw = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!gmtime_utc(raw, tm)) {
        return "19700101_000000";
    }
    return put_time_string(tm, "%Y%m%d_%H%M%S");
}

} // namespace PL::Ingest
