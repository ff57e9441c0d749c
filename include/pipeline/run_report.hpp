#pragma once

#include "pipeline/stage.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace repack {

enum ExitCode : int {
    kExitOk = 0,
    kExitExtractionFailed = 1,
    kExitScanFailed = 2,
    kExitPackFailed = 3,
    kExitCleanupFailed = 4,
    kExitWorkspaceFailed = 5,
    kExitSourceFailed = 6,
    kExitUsage = 64,
    kExitSignalBase = 128,
};

struct RunReport {
    std::string source_archive;
    std::string workspace_dir;
    std::string output_archive;

    Stage final_stage = Stage::Start;
    StageFailure failure;            // first failure; kind None on success
    bool cleanup_failed = false;     // also set when an earlier failure is reported
    std::string cleanup_message;
    std::vector<StageRecord> stages;

    std::uint64_t output_size = 0;
    std::string output_sha256;

    bool Succeeded() const { return failure.kind == ErrorKind::None; }
    int ExitCode() const;
};

nlohmann::json ReportToJson(const RunReport& report);
Result WriteReportFile(const RunReport& report, const std::string& path);

} // namespace repack
