#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace repack::config {

// Pipeline settings from one source (config file or command line). Unset
// fields keep whatever a lower-precedence source or the defaults provide.
struct PipelineSettings {
    std::optional<std::string> source_archive;
    std::optional<std::string> source_pattern;
    std::optional<std::string> workspace_dir;
    std::optional<std::string> output_archive;
    std::optional<std::string> archiver_path;
    std::optional<std::string> archiver_dialect;
    std::optional<std::string> scanner_path;
    std::optional<std::uint64_t> step_timeout_seconds;
    std::optional<bool> force_clean_workspace;
    std::optional<bool> verify_output;
    std::optional<std::string> report_path;
    std::optional<std::string> log_level;

    void Reset();
    // Fields set in other replace ours.
    void MergeFrom(const PipelineSettings& other);
};

class PipelineConfigFromFile : public PipelineSettings {
  public:
    Result LoadFile(const std::string& path);
};

} // namespace repack::config
