#include "Logging.hpp"
#include "Config.hpp"

void initLogging(int& argc, char* argv[], const LogSection& log) {
    loguru::g_stderr_verbosity = log.verbosity;
    loguru::g_preamble_thread = false;
    loguru::init(argc, argv);

    if (!log.file.empty()) {
        if (!loguru::add_file(log.file.c_str(), loguru::Append, loguru::Verbosity_MAX)) {
            LOG_F(WARNING, "Could not open log file %s, logging to stderr only", log.file.c_str());
        }
    }
}
