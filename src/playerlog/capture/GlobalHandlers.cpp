#include <playerlog/capture/GlobalHandlers.hpp>

#include <playerlog/capture/CaptureAgent.hpp>

#include "log/TaggedLogger.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdlib>
#include <mutex>

namespace PL::Capture {

namespace {

std::mutex              g_install_mutex;
std::condition_variable g_release_cv;
CaptureAgent*           g_agent{nullptr};        // guarded by g_install_mutex
std::size_t             g_active_reports{0};     // guarded by g_install_mutex
std::atomic<bool>       g_installed{false};
std::terminate_handler  g_previous_handler = nullptr;
std::atomic<bool>       g_terminating{false};

// Keeps the bound agent alive while a hook reports through it;
// ReleaseGlobalHandlers waits until every lease is gone.
class AgentLease {
public:
    AgentLease() {
        std::lock_guard<std::mutex> lock(g_install_mutex);
        agent_ = g_agent;
        if (agent_ != nullptr) {
            ++g_active_reports;
        }
    }

    ~AgentLease() {
        if (agent_ == nullptr) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(g_install_mutex);
            --g_active_reports;
        }
        g_release_cv.notify_all();
    }

    AgentLease(AgentLease const&)            = delete;
    AgentLease& operator=(AgentLease const&) = delete;

    auto get() const -> CaptureAgent* { return agent_; }

private:
    CaptureAgent* agent_{nullptr};
};

[[noreturn]] void terminate_with_report() noexcept {
    // A failure inside the report path must not recurse into reporting.
    bool expected = false;
    if (g_terminating.compare_exchange_strong(expected, true)) {
        AgentLease lease;
        if (auto* agent = lease.get()) {
            if (auto current = std::current_exception()) {
                agent->report(current, kTerminateSource, kGlobalHandlerContext);
            } else {
                agent->report(std::string_view{"std::terminate called without an active exception"},
                              kTerminateSource,
                              kGlobalHandlerContext);
            }
            agent->flush(kTerminateFlush);
        }
    }
    if (g_previous_handler != nullptr) {
        g_previous_handler();
    }
    std::abort();
}

} // namespace

void InstallGlobalHandlers(CaptureAgent& agent) {
    std::lock_guard<std::mutex> lock(g_install_mutex);
    g_agent = &agent;
    if (g_installed.load()) {
        pl_log("global handlers rebound", "CaptureAgent");
        return;
    }
    g_previous_handler = std::set_terminate(terminate_with_report);
    g_installed.store(true);
}

void UninstallGlobalHandlers() {
    std::lock_guard<std::mutex> lock(g_install_mutex);
    g_agent = nullptr;
    if (!g_installed.load()) {
        return;
    }
    std::set_terminate(g_previous_handler);
    g_previous_handler = nullptr;
    g_installed.store(false);
}

auto GlobalHandlersInstalled() -> bool {
    return g_installed.load();
}

void ReleaseGlobalHandlers(CaptureAgent const& agent) {
    std::unique_lock<std::mutex> lock(g_install_mutex);
    if (g_agent == &agent) {
        g_agent = nullptr;
    }
    // A lease taken before the unbind may still point at `agent`.
    g_release_cv.wait(lock, []() { return g_active_reports == 0; });
}

void ReportUnhandledRejection(std::exception_ptr error) noexcept {
    AgentLease lease;
    if (auto* agent = lease.get()) {
        agent->report(error, kAsyncSource, kUnhandledAsyncContext);
        return;
    }
    pl_log("unhandled asynchronous failure with no agent bound", "CaptureAgent");
}

} // namespace PL::Capture
