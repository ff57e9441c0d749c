#pragma once

#include "pipeline/pipeline.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <string>

namespace repack {

struct CommandLine {
    config::PipelineSettings overrides;
    std::string config_path;
    bool help = false;
};

// Everything main needs after config file and command line are merged.
struct RunSettings {
    PipelineOptions pipeline;
    std::string report_path;
    LogLevel log_level = LogLevel::Info;
};

void PrintUsage(const char* argv0);

// getopt_long based; resets optind so it can be called more than once.
Result ParseCommandLine(int argc, char** argv, CommandLine& out);

// Applies settings on top of the defaults and validates them.
Result BuildRunSettings(const config::PipelineSettings& settings, RunSettings& out);

// Loads --config (if any), then lets command-line options win.
Result ResolveRunSettings(const CommandLine& cmd, RunSettings& out);

} // namespace repack
