#include "../PlayerlogTestHelper.hpp"

#include <doctest/doctest.h>
#include <playerlog/capture/CaptureAgent.hpp>
#include <playerlog/capture/GlobalHandlers.hpp>
#include <playerlog/web/IngestServer.hpp>
#include <playerlog/web/ingest/LogEntryFormat.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

using namespace PL::Capture;
using namespace std::chrono_literals;

namespace {

// Shared with the test after ownership of the transport moves into the agent.
struct TransportLog {
    std::mutex               mutex;
    std::condition_variable  cv;
    std::vector<std::string> bodies;
    bool                     gate_open{true};
    bool                     fail{false};
    std::size_t              entered{0};

    auto wait_for_count(std::size_t count, std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]() { return bodies.size() >= count; });
    }

    // Calls to send() so far, including ones still held at the gate.
    auto wait_for_entered(std::size_t count, std::chrono::milliseconds timeout) -> bool {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]() { return entered >= count; });
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            gate_open = true;
        }
        cv.notify_all();
    }

    auto payloads() -> std::vector<nlohmann::json> {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<nlohmann::json> out;
        for (auto const& body : bodies) {
            out.push_back(nlohmann::json::parse(body));
        }
        return out;
    }
};

class RecordingTransport final : public ReportTransport {
public:
    explicit RecordingTransport(std::shared_ptr<TransportLog> log)
        : log_(std::move(log)) {}

    auto send(std::string const& body) -> PL::Expected<void> override {
        std::unique_lock<std::mutex> lock(log_->mutex);
        ++log_->entered;
        log_->cv.notify_all();
        log_->cv.wait(lock, [&]() { return log_->gate_open; });
        if (log_->fail) {
            log_->bodies.push_back(body);
            log_->cv.notify_all();
            return std::unexpected(PL::Error{PL::Error::Code::TransportFailure, "connection refused"});
        }
        log_->bodies.push_back(body);
        log_->cv.notify_all();
        return {};
    }

private:
    std::shared_ptr<TransportLog> log_;
};

// Writes each report as one line to a pipe; used from a forked child.
class PipeTransport final : public ReportTransport {
public:
    explicit PipeTransport(int fd)
        : fd_(fd) {}

    auto send(std::string const& body) -> PL::Expected<void> override {
        auto line = body + "\n";
        if (::write(fd_, line.data(), line.size()) != static_cast<ssize_t>(line.size())) {
            return std::unexpected(PL::Error{PL::Error::Code::TransportFailure, "pipe write failed"});
        }
        return {};
    }

private:
    int fd_;
};

// An exception whose what() holds until the test opens the gate.
struct GatedFailure : std::exception {
    struct Gate {
        std::mutex              mutex;
        std::condition_variable cv;
        bool                    entered{false};
        bool                    open{false};
        std::atomic<bool>       returned{false};
    };

    explicit GatedFailure(std::shared_ptr<Gate> gate)
        : gate_(std::move(gate)) {}

    auto what() const noexcept -> char const* override {
        {
            std::unique_lock<std::mutex> lock(gate_->mutex);
            gate_->entered = true;
            gate_->cv.notify_all();
            gate_->cv.wait(lock, [&]() { return gate_->open; });
        }
        gate_->returned.store(true);
        return "gated failure";
    }

    std::shared_ptr<Gate> gate_;
};

int g_terminate_pipe_fd = -1;
int g_terminate_depth   = 0;

// Installed before the capture handlers so they chain into it. The first call
// re-enters std::terminate to check the nested call skips reporting.
[[noreturn]] void chained_terminate_handler() {
    if (g_terminate_depth++ == 0) {
        std::terminate();
    }
    char const marker[] = "chained\n";
    [[maybe_unused]] auto written = ::write(g_terminate_pipe_fd, marker, sizeof(marker) - 1);
    ::_exit(3);
}

auto make_agent(std::shared_ptr<TransportLog> const& log, CaptureConfig config = {}) -> std::unique_ptr<CaptureAgent> {
    return std::make_unique<CaptureAgent>(std::move(config), std::make_unique<RecordingTransport>(log));
}

} // namespace

TEST_CASE("CaptureAgent sends a record with defaults and ambient fields") {
    auto          log = std::make_shared<TransportLog>();
    CaptureConfig config{};
    config.dns      = "https://provider.example:8080";
    config.cors     = false;
    config.https    = true;
    config.page_url = "https://player.example/live";
    auto agent      = make_agent(log, config);

    agent->report(std::string_view{"stream stalled"});
    REQUIRE(agent->flush(2s));

    auto payloads = log->payloads();
    REQUIRE(payloads.size() == 1);
    auto const& payload = payloads.front();
    CHECK(payload["message"] == "stream stalled");
    CHECK(payload["source"] == "Unknown");
    CHECK(payload["context"] == "General");
    CHECK(payload["dns"] == "https://provider.example:8080");
    CHECK(payload["cors"] == false);
    CHECK(payload["https"] == true);
    CHECK(payload["url"] == "https://player.example/live");
    CHECK(payload["userAgent"] == "playerlog-capture/1.0");
    // dd/mm/YYYY, HH:MM:SS
    auto timestamp = payload["timestamp"].get<std::string>();
    CHECK(timestamp.size() == 20);
    CHECK(timestamp.substr(10, 2) == ", ");
    CHECK_FALSE(payload.contains("stack"));

    auto stats = agent->stats();
    CHECK(stats.reported == 1);
    CHECK(stats.sent == 1);
    CHECK(stats.failed == 0);
}

TEST_CASE("CaptureAgent reports exceptions with source and context") {
    auto log   = std::make_shared<TransportLog>();
    auto agent = make_agent(log);

    agent->report(std::runtime_error{"decoder exploded"}, "Decoder.cpp", "playback");
    try {
        throw TracedError{"traced failure"};
    } catch (std::exception const& error) {
        agent->report(error, "Player.cpp", "startup");
    }
    agent->report(std::make_exception_ptr(std::string{"thrown string"}), "", "");
    agent->report(std::make_exception_ptr(42));
    REQUIRE(agent->flush(2s));

    auto payloads = log->payloads();
    REQUIRE(payloads.size() == 4);
    CHECK(payloads[0]["message"] == "decoder exploded");
    CHECK(payloads[0]["source"] == "Decoder.cpp");
    CHECK(payloads[0]["context"] == "playback");
    CHECK_FALSE(payloads[0].contains("stack"));

    CHECK(payloads[1]["message"] == "traced failure");
    REQUIRE(payloads[1].contains("stack"));
    CHECK_FALSE(payloads[1]["stack"].get<std::string>().empty());

    CHECK(payloads[2]["message"] == "thrown string");
    CHECK(payloads[2]["source"] == "Unknown");
    CHECK(payloads[2]["context"] == "General");

    CHECK(payloads[3]["message"] == "Unknown exception");
}

TEST_CASE("CaptureAgent report returns before the transport finishes") {
    auto log       = std::make_shared<TransportLog>();
    log->gate_open = false;
    auto agent     = make_agent(log);

    auto const started = std::chrono::steady_clock::now();
    agent->report(std::string_view{"slow network"});
    agent->report(std::string_view{"still slow"});
    CHECK(std::chrono::steady_clock::now() - started < 500ms);
    CHECK_FALSE(agent->flush(50ms));

    log->open_gate();
    REQUIRE(agent->flush(2s));
    CHECK(log->payloads().size() == 2);
}

TEST_CASE("CaptureAgent drops reports once the queue is full") {
    auto log       = std::make_shared<TransportLog>();
    log->gate_open = false;
    CaptureConfig config{};
    config.max_queue = 2;
    auto agent       = make_agent(log, config);

    agent->report(std::string_view{"in flight"});
    // The worker holds the first report, leaving the queue empty.
    REQUIRE(log->wait_for_entered(1, 2s));
    agent->report(std::string_view{"queued 1"});
    agent->report(std::string_view{"queued 2"});
    agent->report(std::string_view{"dropped"});

    log->open_gate();
    REQUIRE(agent->flush(2s));

    auto stats = agent->stats();
    CHECK(stats.reported == 4);
    CHECK(stats.dropped == 1);
    CHECK(stats.sent == 3);
    for (auto const& payload : log->payloads()) {
        CHECK(payload["message"] != "dropped");
    }
}

TEST_CASE("CaptureAgent swallows transport failures") {
    auto log  = std::make_shared<TransportLog>();
    log->fail = true;
    auto agent = make_agent(log);

    agent->report(std::string_view{"nobody listening"});
    REQUIRE(agent->flush(2s));
    auto stats = agent->stats();
    CHECK(stats.failed == 1);
    CHECK(stats.sent == 0);
}

TEST_CASE("CaptureAgent does nothing when disabled") {
    auto          log = std::make_shared<TransportLog>();
    CaptureConfig config{};
    config.enabled = false;
    auto agent     = make_agent(log, config);

    agent->report(std::string_view{"ignored"});
    agent->report(std::runtime_error{"ignored"});
    REQUIRE(agent->flush(1s));
    CHECK(log->payloads().empty());
    CHECK(agent->stats().reported == 0);
}

TEST_CASE("CaptureConfig validation flags the placeholder provider") {
    CaptureConfig config{};
    CHECK(ValidateCaptureConfig(config).empty());

    config.dns = std::string{kPlaceholderDns};
    auto issues = ValidateCaptureConfig(config);
    REQUIRE(issues.size() == 1);
    CHECK(issues[0].severity == IssueSeverity::Warning);
    CHECK(issues[0].setting == "dns");

    config.cors = true;
    issues      = ValidateCaptureConfig(config);
    REQUIRE(issues.size() == 2);
    CHECK(issues[1].severity == IssueSeverity::Error);
    CHECK(issues[1].setting == "dns and cors");

    config.dns          = "https://provider.example";
    config.endpoint_url = "ftp://127.0.0.1/logger";
    issues              = ValidateCaptureConfig(config);
    REQUIRE(issues.size() == 1);
    CHECK(issues[0].setting == "endpoint_url");
}

TEST_CASE("CaptureAgent reports configuration problems") {
    auto          log = std::make_shared<TransportLog>();
    CaptureConfig config{};
    config.dns  = std::string{kPlaceholderDns};
    config.cors = true;
    auto agent  = make_agent(log, config);

    auto issues = agent->validate_config();
    CHECK(issues.size() == 2);
    REQUIRE(agent->flush(2s));

    auto payloads = log->payloads();
    REQUIRE(payloads.size() == 1);
    CHECK(payloads[0]["message"] == "2 configuration issue(s) detected");
    CHECK(payloads[0]["source"] == "config");
    CHECK(payloads[0]["context"] == "Configuration Validation");
}

TEST_CASE("CaptureConfig reads environment overrides") {
    PL::Test::EnvGuard endpoint{"PLAYERLOG_CAPTURE_ENDPOINT", "https://logs.example/errors"};
    PL::Test::EnvGuard cors{"PLAYERLOG_CAPTURE_CORS", "yes"};
    PL::Test::EnvGuard queue{"PLAYERLOG_CAPTURE_MAX_QUEUE", "8"};
    PL::Test::EnvGuard timeout{"PLAYERLOG_CAPTURE_TIMEOUT_MS", "250"};

    CaptureConfig config{};
    REQUIRE(ApplyCaptureEnvOverrides(config));
    CHECK(config.endpoint_url == "https://logs.example/errors");
    CHECK(config.cors == std::optional<bool>{true});
    CHECK(config.max_queue == 8);
    CHECK(config.timeout == 250ms);

    PL::Test::EnvGuard bad{"PLAYERLOG_CAPTURE_HTTPS", "maybe"};
    CHECK_FALSE(ApplyCaptureEnvOverrides(config));
}

TEST_CASE("ReportTransport parses endpoint URLs") {
    auto plain = ParseEndpointUrl("http://127.0.0.1:8080/logger");
    REQUIRE(plain.has_value());
    CHECK(plain->scheme_host_port == "http://127.0.0.1:8080");
    CHECK(plain->path == "/logger");

    auto bare = ParseEndpointUrl("https://logs.example");
    REQUIRE(bare.has_value());
    CHECK(bare->path == "/");

    CHECK_FALSE(ParseEndpointUrl("logs.example/logger").has_value());
    CHECK_FALSE(ParseEndpointUrl("ftp://logs.example/logger").has_value());
    CHECK_FALSE(ParseEndpointUrl("http:///logger").has_value());
}

TEST_CASE("GlobalHandlers install once and rebind") {
    auto log    = std::make_shared<TransportLog>();
    auto first  = make_agent(log);
    auto second = make_agent(log);

    auto const original = std::get_terminate();
    InstallGlobalHandlers(*first);
    auto const installed = std::get_terminate();
    CHECK(installed != original);
    CHECK(GlobalHandlersInstalled());

    InstallGlobalHandlers(*second);
    CHECK(std::get_terminate() == installed);

    UninstallGlobalHandlers();
    CHECK_FALSE(GlobalHandlersInstalled());
    CHECK(std::get_terminate() == original);
}

TEST_CASE("GlobalHandlers report failures escaping detached tasks") {
    auto log   = std::make_shared<TransportLog>();
    auto agent = make_agent(log);
    InstallGlobalHandlers(*agent);

    SpawnDetached([]() { throw std::runtime_error{"segment fetch failed"}; });
    REQUIRE(log->wait_for_count(1, 2s));

    auto payloads = log->payloads();
    REQUIRE(payloads.size() == 1);
    CHECK(payloads[0]["message"] == "segment fetch failed");
    CHECK(payloads[0]["source"] == "async");
    CHECK(payloads[0]["context"] == "Unhandled Promise Rejection");

    UninstallGlobalHandlers();
}

TEST_CASE("GlobalHandlers unbind an agent on destruction") {
    auto log   = std::make_shared<TransportLog>();
    auto agent = make_agent(log);
    InstallGlobalHandlers(*agent);
    agent.reset();

    // Must not touch the destroyed agent.
    ReportUnhandledRejection(std::make_exception_ptr(std::runtime_error{"late"}));
    CHECK(log->payloads().empty());
    UninstallGlobalHandlers();
}

TEST_CASE("GlobalHandlers hold agent destruction until a running report finishes") {
    auto log   = std::make_shared<TransportLog>();
    auto agent = make_agent(log);
    InstallGlobalHandlers(*agent);

    auto gate = std::make_shared<GatedFailure::Gate>();
    SpawnDetached([gate]() { throw GatedFailure{gate}; });
    {
        std::unique_lock<std::mutex> lock(gate->mutex);
        REQUIRE(gate->cv.wait_for(lock, 2s, [&]() { return gate->entered; }));
    }

    std::atomic<bool> destroyed{false};
    bool              report_finished_first = false;
    std::thread       destroyer([&]() {
        agent.reset();
        report_finished_first = gate->returned.load();
        destroyed.store(true);
    });

    std::this_thread::sleep_for(100ms);
    CHECK_FALSE(destroyed.load());

    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        gate->open = true;
    }
    gate->cv.notify_all();
    destroyer.join();
    CHECK(destroyed.load());
    CHECK(report_finished_first);
    UninstallGlobalHandlers();
}

TEST_CASE("GlobalHandlers report an uncaught exception once before chaining") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    pid_t const child = ::fork();
    REQUIRE(child >= 0);
    if (child == 0) {
        ::close(fds[0]);
        ::alarm(10);
        UninstallGlobalHandlers();
        g_terminate_pipe_fd = fds[1];
        std::set_terminate(chained_terminate_handler);

        CaptureConfig config{};
        config.page_url = "app://child";
        auto agent      = std::make_unique<CaptureAgent>(config, std::make_unique<PipeTransport>(fds[1]));
        InstallGlobalHandlers(*agent);

        std::thread worker([]() { throw std::runtime_error{"decoder state corrupted"}; });
        worker.join();
        ::_exit(0);
    }

    ::close(fds[1]);
    std::string output;
    char        buffer[4096];
    while (true) {
        auto count = ::read(fds[0], buffer, sizeof(buffer));
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            break;
        }
        output.append(buffer, static_cast<std::size_t>(count));
    }
    ::close(fds[0]);

    int status = 0;
    REQUIRE(::waitpid(child, &status, 0) == child);
    REQUIRE(WIFEXITED(status));
    CHECK(WEXITSTATUS(status) == 3);

    std::vector<std::string> lines;
    for (auto pos = output.find('\n'); pos != std::string::npos; pos = output.find('\n')) {
        lines.push_back(output.substr(0, pos));
        output.erase(0, pos + 1);
    }
    REQUIRE(lines.size() == 2);
    auto report = nlohmann::json::parse(lines[0]);
    CHECK(report["message"] == "decoder state corrupted");
    CHECK(report["source"] == "std::terminate");
    CHECK(report["context"] == "Global Error Handler");
    CHECK(report["url"] == "app://child");
    CHECK(lines[1] == "chained");
}

TEST_CASE("CaptureAgent delivers to a live ingestion endpoint") {
    PL::Test::TempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    PL::Ingest::IngestServer server{PL::Test::make_test_options(dir.path),
                                    PL::Ingest::IngestLogHooks{
                                        .info  = [](std::string_view) {},
                                        .error = [](std::string_view) {},
                                    }};
    REQUIRE(server.start());

    CaptureConfig config{};
    config.endpoint_url = "http://127.0.0.1:" + std::to_string(server.port()) + "/logger";
    config.timeout      = 2s;
    auto agent          = CaptureAgent::Create(config);
    REQUIRE(agent.has_value());

    (*agent)->report(std::runtime_error{"manifest 404"}, "Playlist.cpp", "load");
    REQUIRE((*agent)->flush(5s));
    CHECK((*agent)->stats().sent == 1);

    auto parsed = PL::Ingest::ParseLogEntries(PL::Test::read_file(dir / "app_errors.log"));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->size() == 2);
    auto const& entry = parsed->back();
    CHECK(entry.field("Message") == std::optional<std::string>{"manifest 404"});
    CHECK(entry.field("Source") == std::optional<std::string>{"Playlist.cpp"});
    CHECK(entry.field("Context") == std::optional<std::string>{"load"});
    CHECK(entry.field("User Agent") == std::optional<std::string>{"playerlog-capture/1.0"});
    CHECK(entry.field("CORS") == std::optional<std::string>{"Unknown"});

    server.stop();
}
