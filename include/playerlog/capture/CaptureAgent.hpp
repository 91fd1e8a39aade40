#pragma once

#include <playerlog/capture/CaptureConfig.hpp>
#include <playerlog/capture/ReportTransport.hpp>
#include <playerlog/core/Error.hpp>
#include <playerlog/web/ingest/ErrorRecord.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace PL::Capture {

inline constexpr std::string_view kConfigValidationSource  = "config";
inline constexpr std::string_view kConfigValidationContext = "Configuration Validation";

// Symbolized frames of the calling thread, innermost first.
auto CaptureStackTrace(std::size_t skip_frames = 1) -> std::vector<std::string>;

// An exception that remembers where it was thrown; report() sends its frames
// as the record's stack trace.
class TracedError : public std::runtime_error {
public:
    explicit TracedError(std::string const& message);

    auto stack_trace() const -> std::vector<std::string> const& { return stack_; }

private:
    std::vector<std::string> stack_;
};

/**
 * Turns failures into error records and relays them to the ingestion endpoint.
 *
 * report() never throws and never waits on the network: it builds the record,
 * serializes it and hands it to a worker thread owned by the agent. When the
 * queue already holds max_queue reports the new one is dropped. Transport
 * failures are counted, mirrored to the debug log (and to stderr in debug
 * mode) and otherwise discarded.
 *
 * Reports still queued when the agent is destroyed are discarded; call
 * flush() first to give them a bounded chance to leave.
 */
class CaptureAgent {
public:
    struct Stats {
        std::uint64_t reported{0};
        std::uint64_t sent{0};
        std::uint64_t failed{0};
        std::uint64_t dropped{0};
    };

    CaptureAgent(CaptureConfig config, std::unique_ptr<ReportTransport> transport);
    ~CaptureAgent();

    CaptureAgent(CaptureAgent const&)            = delete;
    CaptureAgent& operator=(CaptureAgent const&) = delete;

    // Agent posting to config.endpoint_url over HTTP(S).
    static auto Create(CaptureConfig config) -> PL::Expected<std::unique_ptr<CaptureAgent>>;

    void report(std::exception const& error, std::string_view source = {}, std::string_view context = {}) noexcept;
    void report(std::exception_ptr error, std::string_view source = {}, std::string_view context = {}) noexcept;
    void report(std::string_view message, std::string_view source = {}, std::string_view context = {}) noexcept;

    auto make_record(std::string              message,
                     std::vector<std::string> stack_trace,
                     std::string_view         source,
                     std::string_view         context) const -> Ingest::ErrorRecord;

    // Waits until every queued report has been handed to the transport.
    auto flush(std::chrono::milliseconds timeout) -> bool;

    // Runs ValidateCaptureConfig and reports a summary when issues exist.
    auto validate_config() -> std::vector<ConfigIssue>;

    auto stats() const -> Stats;
    auto config() const -> CaptureConfig const& { return config_; }

private:
    void enqueue(Ingest::ErrorRecord record) noexcept;
    void run();
    void deliver(std::string const& body);

    CaptureConfig                    config_;
    std::unique_ptr<ReportTransport> transport_;

    mutable std::mutex      mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::string> queue_;
    std::size_t             in_flight_{0};
    bool                    stopping_{false};

    std::atomic<std::uint64_t> reported_{0};
    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> dropped_{0};

    std::thread worker_;
};

} // namespace PL::Capture
