#include <playerlog/capture/CaptureAgent.hpp>

#include <playerlog/capture/GlobalHandlers.hpp>
#include <playerlog/web/ingest/TimeUtils.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <iostream>
#include <typeinfo>
#include <utility>

#include <execinfo.h>

namespace PL::Capture {

namespace {

constexpr int kMaxStackFrames = 64;

auto or_default(std::string_view value, std::string_view fallback) -> std::string {
    return std::string{value.empty() ? fallback : value};
}

auto exception_message(std::exception const& error) -> std::string {
    auto const* what = error.what();
    if (what != nullptr && *what != '\0') {
        return what;
    }
    return typeid(error).name();
}

} // namespace

auto CaptureStackTrace(std::size_t skip_frames) -> std::vector<std::string> {
    std::vector<std::string> frames;
    void*                    buffer[kMaxStackFrames];
    int const                count = ::backtrace(buffer, kMaxStackFrames);
    // +1 hides this function itself.
    int const skip = static_cast<int>(skip_frames) + 1;
    if (count <= skip) {
        return frames;
    }
    char** symbols = ::backtrace_symbols(buffer + skip, count - skip);
    if (symbols == nullptr) {
        return frames;
    }
    frames.reserve(static_cast<std::size_t>(count - skip));
    for (int i = 0; i < count - skip; ++i) {
        frames.emplace_back(symbols[i]);
    }
    std::free(symbols);
    return frames;
}

TracedError::TracedError(std::string const& message)
    : std::runtime_error(message)
    , stack_(CaptureStackTrace(2)) {}

CaptureAgent::CaptureAgent(CaptureConfig config, std::unique_ptr<ReportTransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport)) {
    worker_ = std::thread([this]() { this->run(); });
}

CaptureAgent::~CaptureAgent() {
    ReleaseGlobalHandlers(*this);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto CaptureAgent::Create(CaptureConfig config) -> PL::Expected<std::unique_ptr<CaptureAgent>> {
    auto transport = HttpReportTransport::Create(config.endpoint_url, config.timeout);
    if (!transport) {
        return std::unexpected(transport.error());
    }
    return std::make_unique<CaptureAgent>(std::move(config), std::move(*transport));
}

auto CaptureAgent::make_record(std::string              message,
                               std::vector<std::string> stack_trace,
                               std::string_view         source,
                               std::string_view         context) const -> Ingest::ErrorRecord {
    Ingest::ErrorRecord record{};
    record.timestamp     = Ingest::format_client_timestamp(std::chrono::system_clock::now());
    record.message       = std::move(message);
    record.source        = or_default(source, Ingest::kDefaultSource);
    record.context       = or_default(context, Ingest::kDefaultContext);
    record.user_agent    = config_.user_agent;
    record.page_url      = config_.page_url;
    record.endpoint_dns  = config_.dns;
    record.cors_enabled  = config_.cors;
    record.https_enabled = config_.https;
    record.stack_trace   = std::move(stack_trace);
    return record;
}

void CaptureAgent::report(std::exception const& error, std::string_view source, std::string_view context) noexcept {
    if (!config_.enabled) {
        return;
    }
    try {
        std::vector<std::string> stack;
        if (auto const* traced = dynamic_cast<TracedError const*>(&error)) {
            stack = traced->stack_trace();
        }
        enqueue(make_record(exception_message(error), std::move(stack), source, context));
    } catch (std::exception const& failure) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        pl_log(std::string{"dropped report: "} + failure.what(), "CaptureAgent");
    }
}

void CaptureAgent::report(std::exception_ptr error, std::string_view source, std::string_view context) noexcept {
    if (!config_.enabled || !error) {
        return;
    }
    try {
        std::rethrow_exception(error);
    } catch (std::exception const& failure) {
        report(failure, source, context);
    } catch (std::string const& reason) {
        report(std::string_view{reason}, source, context);
    } catch (char const* reason) {
        report(std::string_view{reason != nullptr ? reason : "null"}, source, context);
    } catch (...) {
        // A thrown value with no message still becomes a report.
        report(std::string_view{"Unknown exception"}, source, context);
    }
}

void CaptureAgent::report(std::string_view message, std::string_view source, std::string_view context) noexcept {
    if (!config_.enabled) {
        return;
    }
    try {
        enqueue(make_record(std::string{message}, {}, source, context));
    } catch (std::exception const& failure) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        pl_log(std::string{"dropped report: "} + failure.what(), "CaptureAgent");
    }
}

void CaptureAgent::enqueue(Ingest::ErrorRecord record) noexcept {
    reported_.fetch_add(1, std::memory_order_relaxed);
    if (config_.debug_mode) {
        std::cerr << "[playerlog_capture] " << record.source << " / " << record.context << ": " << record.message
                  << '\n';
    }
    try {
        auto body = Ingest::ErrorRecordToJson(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || queue_.size() >= config_.max_queue) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                pl_log("queue full, dropped report", "CaptureAgent");
                return;
            }
            queue_.push_back(std::move(body));
        }
        work_cv_.notify_one();
    } catch (std::exception const& failure) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        pl_log(std::string{"dropped report: "} + failure.what(), "CaptureAgent");
    }
}

void CaptureAgent::run() {
#ifdef PL_LOG_DEBUG
    PL::set_thread_name("CaptureDelivery");
#endif
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (stopping_) {
            break;
        }
        auto body = std::move(queue_.front());
        queue_.pop_front();
        ++in_flight_;
        lock.unlock();

        deliver(body);

        lock.lock();
        --in_flight_;
        if (queue_.empty() && in_flight_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

void CaptureAgent::deliver(std::string const& body) {
    PL::Expected<void> status;
    try {
        status = transport_ ? transport_->send(body)
                            : PL::Expected<void>{std::unexpected(Error{Error::Code::TransportFailure, "no transport"})};
    } catch (std::exception const& failure) {
        status = std::unexpected(Error{Error::Code::TransportFailure, failure.what()});
    }

    if (status) {
        sent_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    failed_.fetch_add(1, std::memory_order_relaxed);
    pl_log("report not delivered: " + describeError(status.error()), "CaptureAgent");
    if (config_.debug_mode) {
        std::cerr << "[playerlog_capture] Could not send error to server logger: " << describeError(status.error())
                  << '\n';
    }
}

auto CaptureAgent::flush(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return stopping_ || (queue_.empty() && in_flight_ == 0); });
}

auto CaptureAgent::validate_config() -> std::vector<ConfigIssue> {
    auto issues = ValidateCaptureConfig(config_);
    if (config_.debug_mode) {
        for (auto const& issue : issues) {
            std::cerr << "[playerlog_capture] " << to_string(issue.severity) << ": " << issue.message
                      << " (setting: " << issue.setting << ")\n";
        }
    }
    if (!issues.empty()) {
        report(std::to_string(issues.size()) + " configuration issue(s) detected",
               kConfigValidationSource,
               kConfigValidationContext);
    }
    return issues;
}

auto CaptureAgent::stats() const -> Stats {
    return Stats{
        .reported = reported_.load(std::memory_order_relaxed),
        .sent     = sent_.load(std::memory_order_relaxed),
        .failed   = failed_.load(std::memory_order_relaxed),
        .dropped  = dropped_.load(std::memory_order_relaxed),
    };
}

} // namespace PL::Capture
