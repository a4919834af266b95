#pragma once
#include <loguru.hpp>

struct LogSection;

// loguru setup for the CLI: stderr verbosity plus an optional append-mode
// log file. Library code only ever calls LOG_F.
void initLogging(int& argc, char* argv[], const LogSection& log);
