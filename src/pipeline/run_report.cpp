#include "pipeline/run_report.hpp"

#include <fstream>

namespace repack {

int RunReport::ExitCode() const {
    switch (failure.kind) {
        case ErrorKind::None:        return kExitOk;
        case ErrorKind::Extraction:  return kExitExtractionFailed;
        case ErrorKind::Scan:        return kExitScanFailed;
        case ErrorKind::Pack:        return kExitPackFailed;
        case ErrorKind::Cleanup:     return kExitCleanupFailed;
        case ErrorKind::Workspace:   return kExitWorkspaceFailed;
        case ErrorKind::Source:      return kExitSourceFailed;
        case ErrorKind::Interrupted:
            return failure.signal > 0 ? kExitSignalBase + failure.signal : kExitSignalBase;
    }
    return 1;
}

nlohmann::json ReportToJson(const RunReport& report) {
    nlohmann::json j;
    j["source_archive"] = report.source_archive;
    j["workspace_dir"] = report.workspace_dir;
    j["output_archive"] = report.output_archive;
    j["final_stage"] = StageName(report.final_stage);
    j["success"] = report.Succeeded();
    j["exit_code"] = report.ExitCode();

    if (!report.Succeeded()) {
        j["failure"] = {
            {"kind", ErrorKindName(report.failure.kind)},
            {"stage", StageName(report.failure.stage)},
            {"exit_code", report.failure.exit_code},
            {"message", report.failure.message},
        };
        if (report.failure.signal > 0) {
            j["failure"]["signal"] = report.failure.signal;
        }
    }
    if (report.cleanup_failed) {
        j["cleanup_error"] = report.cleanup_message;
    }

    auto stages = nlohmann::json::array();
    for (const auto& rec : report.stages) {
        stages.push_back({
            {"stage", StageName(rec.stage)},
            {"ok", rec.ok},
            {"exit_code", rec.exit_code},
            {"message", rec.message},
            {"duration_ms", rec.duration_ms},
        });
    }
    j["stages"] = std::move(stages);

    if (report.Succeeded()) {
        j["output_size"] = report.output_size;
        if (!report.output_sha256.empty()) {
            j["output_sha256"] = report.output_sha256;
        }
    }
    return j;
}

Result WriteReportFile(const RunReport& report, const std::string& path) {
    std::ofstream os(path, std::ios::trunc);
    if (!os.good()) {
        return Result::Fail(-1, "cannot open report file: " + path);
    }
    os << ReportToJson(report).dump(2) << "\n";
    if (!os.good()) {
        return Result::Fail(-1, "cannot write report file: " + path);
    }
    return Result::Ok();
}

} // namespace repack
