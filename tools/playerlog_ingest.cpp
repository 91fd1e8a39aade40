#include <csignal>
#include <cstdlib>

#include <playerlog/web/IngestServer.hpp>

#include "log/TaggedLogger.hpp"

#ifdef PL_LOG_DEBUG
#include <cstring>
#endif

namespace {
void handle_signal(int) {
    PL::Ingest::RequestIngestStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = PL::Ingest::ParseIngestArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        PL::Ingest::PrintIngestUsage();
        return EXIT_SUCCESS;
    }

#ifdef PL_LOG_DEBUG
    PL::set_thread_name("IngestMain");
    // PLAYERLOG_LOG=1 turns the tagged logger on.
    if (const char* env_log = std::getenv("PLAYERLOG_LOG")) {
        PL::set_logging_enabled(std::strcmp(env_log, "0") != 0);
    }
#endif

    PL::Ingest::ResetIngestStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return PL::Ingest::RunIngestServer(options);
}
