#pragma once
#include <spdlog/common.h>
#include <string>
#include <vector>

#include "grid.hpp"

// Settings of one generals_match run, filled from the command line.
struct MatchConfig {
    GridConfig grid;
    std::string gridFile;
    std::vector<std::string> agents{"expander", "random"};
    int maxTurns = 500;
    std::string replayOut;
    std::string replayIn;
    spdlog::level::level_enum logLevel = spdlog::level::info;
    bool logLevelSet = false;
    bool help = false;
};

void printUsage();

// Throws std::invalid_argument for unknown options, missing values and
// unknown log level names.
MatchConfig parseArgs(int argc, const char* const argv[]);

spdlog::level::level_enum parseLogLevel(const std::string& name);
