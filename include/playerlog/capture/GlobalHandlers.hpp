#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <thread>
#include <utility>

namespace PL::Capture {

class CaptureAgent;

inline constexpr std::string_view kTerminateSource         = "std::terminate";
inline constexpr std::string_view kGlobalHandlerContext    = "Global Error Handler";
inline constexpr std::string_view kAsyncSource             = "async";
inline constexpr std::string_view kUnhandledAsyncContext   = "Unhandled Promise Rejection";
inline constexpr std::chrono::milliseconds kTerminateFlush{2000};

/*
 * Process-wide failure hooks, routed to one agent:
 *   - an exception reaching std::terminate (the previous terminate handler
 *     still runs afterwards)
 *   - an exception escaping a task started with SpawnDetached
 * Installing again only rebinds the agent; the terminate handler is never
 * stacked twice. Destroying the bound agent unbinds it and waits for any hook
 * still reporting through it.
 */
void InstallGlobalHandlers(CaptureAgent& agent);
void UninstallGlobalHandlers();
auto GlobalHandlersInstalled() -> bool;

// Unbinds `agent` if it is the bound one, then blocks until no hook is
// reporting.
void ReleaseGlobalHandlers(CaptureAgent const& agent);

// Reports a failure that escaped an asynchronous task. No-op when unbound.
void ReportUnhandledRejection(std::exception_ptr error) noexcept;

// Runs `task` on a detached thread. A failure it does not handle is reported
// as an unhandled rejection instead of terminating the process.
template <typename Task>
void SpawnDetached(Task&& task) {
    std::thread([work = std::forward<Task>(task)]() mutable {
        try {
            work();
        } catch (...) {
            ReportUnhandledRejection(std::current_exception());
        }
    }).detach();
}

} // namespace PL::Capture
