#include <playerlog/capture/CaptureAgent.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct ReportArguments {
    std::string                message;
    std::string                source;
    std::string                context;
    std::optional<std::string> endpoint;
    bool                       validate{false};
    bool                       show_help{false};
};

void print_usage() {
    std::cout << "Usage: playerlog_report --message <text> [options]\n"
              << "  --message <text>    Failure message to report (required)\n"
              << "  --source <name>     Reporting component (default Unknown)\n"
              << "  --context <name>    What was happening (default General)\n"
              << "  --endpoint <url>    Ingestion URL (default PLAYERLOG_CAPTURE_ENDPOINT or http://127.0.0.1:8080/logger)\n"
              << "  --validate-config   Also report capture configuration issues\n"
              << "  --help              Show this help\n"
              << "Environment: PLAYERLOG_LOG=1 enables debug logging when built with PLAYERLOG_DEBUG_LOG.\n";
}

auto parse_arguments(int argc, char** argv) -> std::optional<ReportArguments> {
    ReportArguments args{};
    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--message" || arg == "--source" || arg == "--context" || arg == "--endpoint") {
            auto value = require_value(i, arg);
            if (!value) {
                return std::nullopt;
            }
            if (arg == "--message") {
                args.message = std::string{*value};
            } else if (arg == "--source") {
                args.source = std::string{*value};
            } else if (arg == "--context") {
                args.context = std::string{*value};
            } else {
                args.endpoint = std::string{*value};
            }
        } else if (arg == "--validate-config") {
            args.validate = true;
        } else if (arg == "--help" || arg == "-h") {
            args.show_help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (!args.show_help && args.message.empty()) {
        std::cerr << "--message is required\n";
        return std::nullopt;
    }
    return args;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_arguments(argc, argv);
    if (!args) {
        return EXIT_FAILURE;
    }
    if (args->show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }

#ifdef PL_LOG_DEBUG
    PL::set_thread_name("ReportMain");
    if (const char* env_log = std::getenv("PLAYERLOG_LOG")) {
        PL::set_logging_enabled(std::strcmp(env_log, "0") != 0);
    }
#endif

    PL::Capture::CaptureConfig config{};
    if (!PL::Capture::ApplyCaptureEnvOverrides(config)) {
        return EXIT_FAILURE;
    }
    if (args->endpoint) {
        config.endpoint_url = *args->endpoint;
    }

    auto agent = PL::Capture::CaptureAgent::Create(config);
    if (!agent) {
        std::cerr << "[playerlog_report] " << PL::describeError(agent.error()) << "\n";
        return EXIT_FAILURE;
    }

    if (args->validate) {
        (*agent)->validate_config();
    }
    (*agent)->report(std::string_view{args->message}, args->source, args->context);

    auto drained = (*agent)->flush(config.timeout + std::chrono::seconds{1});
    auto stats   = (*agent)->stats();
    if (!drained || stats.failed > 0 || stats.sent == 0) {
        std::cerr << "[playerlog_report] report not delivered to " << config.endpoint_url << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[playerlog_report] delivered " << stats.sent << " report(s) to " << config.endpoint_url << "\n";
    return EXIT_SUCCESS;
}
