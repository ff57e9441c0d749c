#include "pipeline/pipeline.hpp"

#include "crypto/sha256.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <system_error>

namespace repack {

namespace {

using Clock = std::chrono::steady_clock;

std::int64_t ElapsedMs(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

bool SameFile(const std::string& a, const std::string& b) {
    namespace fs = std::filesystem;
    std::error_code ec_a;
    std::error_code ec_b;
    const fs::path ca = fs::weakly_canonical(fs::absolute(a, ec_a), ec_a);
    const fs::path cb = fs::weakly_canonical(fs::absolute(b, ec_b), ec_b);
    if (ec_a || ec_b) {
        return fs::path(a).lexically_normal() == fs::path(b).lexically_normal();
    }
    return ca == cb;
}

// The source is read-only: packing publishes onto the output and discards
// the staging file, so neither may be the source.
Result CheckSourceNotOverwritten(const std::string& source, const std::string& output) {
    if (SameFile(source, output)) {
        return Result::Fail(-1, "source archive " + source + " is also the output archive");
    }
    const std::string staging = StagingPathFor(output);
    if (SameFile(source, staging)) {
        return Result::Fail(-1, "source archive " + source + " is the staging file of " + output);
    }
    return Result::Ok();
}

} // namespace

Pipeline::Pipeline(PipelineOptions opt,
                   std::shared_ptr<const ICommandRunner> runner,
                   std::shared_ptr<const Workspace::IFileSystemOps> fs_ops)
    : opt_(std::move(opt)),
      runner_(runner ? std::move(runner) : ProcessRunner::Default()),
      fs_ops_(std::move(fs_ops)) {}

void Pipeline::SetFailure(RunReport& report, ErrorKind kind, Stage stage, const Result& res) {
    report.failure.kind = kind;
    report.failure.stage = stage;
    report.failure.exit_code = res.err;
    report.failure.message = res.msg;
    if (kind == ErrorKind::Interrupted) {
        report.failure.signal = PendingSignal();
    }
}

bool Pipeline::RunStage(Stage stage,
                        ErrorKind kind,
                        RunReport& report,
                        const std::function<Result()>& body) {
    if (CancelRequested()) {
        const auto res = Result::Fail(-1, "interrupted by signal " + std::to_string(PendingSignal()) +
                                              " before " + StageName(stage));
        LogError("[%s] not started: %s", StageName(stage), res.msg.c_str());
        SetFailure(report, ErrorKind::Interrupted, stage, res);
        return false;
    }

    report.final_stage = stage;
    if (observer_) observer_->OnStageStarted(stage);
    LogInfo("[%s] started", StageName(stage));

    const auto start = Clock::now();
    const Result res = body();

    StageRecord rec;
    rec.stage = stage;
    rec.ok = res.is_ok();
    rec.exit_code = res.err;
    rec.message = res.msg;
    rec.duration_ms = ElapsedMs(start);
    report.stages.push_back(rec);
    if (observer_) observer_->OnStageFinished(rec);

    if (res.is_ok()) {
        LogInfo("[%s] ok (%lld ms)", StageName(stage), static_cast<long long>(rec.duration_ms));
        return true;
    }

    const ErrorKind effective = CancelRequested() ? ErrorKind::Interrupted : kind;
    LogError("[%s] %s: %s (status %d)",
             StageName(stage),
             ErrorKindName(effective),
             res.msg.c_str(),
             res.err);
    SetFailure(report, effective, stage, res);
    return false;
}

void Pipeline::RunStages(const Workspace& workspace, RunReport& report) {
    const ArchiverCommands commands(opt_.archiver, opt_.dialect);

    const ArchiveExtractor extractor(commands, runner_, opt_.step_timeout);
    if (!RunStage(Stage::Extracting, ErrorKind::Extraction, report, [&] {
            return extractor.Extract(report.source_archive, workspace);
        }))
        return;

    const ContentScanner scanner(opt_.scanner, runner_, opt_.step_timeout);
    if (!RunStage(Stage::Scanning, ErrorKind::Scan, report, [&] {
            return scanner.Scan(workspace);
        }))
        return;

    ArchivePacker::Options pack_opt;
    pack_opt.verify_output = opt_.verify_output;
    pack_opt.timeout = opt_.step_timeout;
    const ArchivePacker packer(commands, runner_, pack_opt);
    (void)RunStage(Stage::Packing, ErrorKind::Pack, report, [&] {
        return packer.Pack(workspace, report.output_archive);
    });
}

void Pipeline::ReleaseWorkspace(Workspace& workspace, RunReport& report) {
    if (observer_) observer_->OnStageStarted(Stage::Cleanup);
    LogInfo("[%s] removing %s", StageName(Stage::Cleanup), workspace.Dir().c_str());

    const auto start = Clock::now();
    const Result res = workspace.Release();

    StageRecord rec;
    rec.stage = Stage::Cleanup;
    rec.ok = res.is_ok();
    rec.exit_code = res.err;
    rec.message = res.msg;
    rec.duration_ms = ElapsedMs(start);
    report.stages.push_back(rec);
    if (observer_) observer_->OnStageFinished(rec);

    if (res.is_ok()) {
        LogInfo("[%s] ok", StageName(Stage::Cleanup));
        return;
    }

    report.cleanup_failed = true;
    report.cleanup_message = res.msg;
    if (report.Succeeded()) {
        LogError("[%s] %s: %s", StageName(Stage::Cleanup), ErrorKindName(ErrorKind::Cleanup),
                 res.msg.c_str());
        SetFailure(report, ErrorKind::Cleanup, Stage::Cleanup, res);
    } else {
        // The earlier stage failure stays the reported outcome.
        LogError("[%s] %s after %s: %s",
                 StageName(Stage::Cleanup),
                 ErrorKindName(ErrorKind::Cleanup),
                 ErrorKindName(report.failure.kind),
                 res.msg.c_str());
    }
}

void Pipeline::RecordOutput(RunReport& report) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(report.output_archive, ec);
    if (!ec) report.output_size = size;

    auto hash_result = Sha256HexFile(report.output_archive, report.output_sha256);
    if (!hash_result.is_ok()) {
        LogWarn("Cannot hash %s: %s", report.output_archive.c_str(), hash_result.msg.c_str());
        report.output_sha256.clear();
        return;
    }
    LogInfo("Output %s: %llu bytes, sha256=%s",
            report.output_archive.c_str(),
            static_cast<unsigned long long>(report.output_size),
            report.output_sha256.c_str());
}

RunReport Pipeline::Run() {
    RunReport report;
    report.workspace_dir = opt_.workspace_dir;
    report.output_archive = opt_.output_archive;

    SourceQuery query = opt_.source;
    query.excluded.push_back(opt_.output_archive);
    query.excluded.push_back(StagingPathFor(opt_.output_archive));

    auto source_result = SourceLocator::Resolve(query, report.source_archive);
    if (source_result.is_ok()) {
        source_result = CheckSourceNotOverwritten(report.source_archive, opt_.output_archive);
    }
    if (!source_result.is_ok()) {
        LogError("%s: %s", ErrorKindName(ErrorKind::Source), source_result.msg.c_str());
        SetFailure(report, ErrorKind::Source, Stage::Start, source_result);
        report.final_stage = Stage::Failed;
        return report;
    }

    Workspace workspace(fs_ops_);
    auto acquire_result = Workspace::Acquire(opt_.workspace_dir, opt_.stale_policy, workspace);
    if (!acquire_result.is_ok()) {
        LogError("%s: %s", ErrorKindName(ErrorKind::Workspace), acquire_result.msg.c_str());
        SetFailure(report, ErrorKind::Workspace, Stage::Start, acquire_result);
        report.final_stage = Stage::Failed;
        return report;
    }

    LogInfo("Run: source=%s workspace=%s output=%s",
            report.source_archive.c_str(),
            workspace.Dir().c_str(),
            report.output_archive.c_str());

    RunStages(workspace, report);
    ReleaseWorkspace(workspace, report);

    if (report.Succeeded()) {
        RecordOutput(report);
        report.final_stage = Stage::Done;
        LogInfo("Run succeeded");
    } else {
        report.final_stage = Stage::Failed;
        LogError("Run failed at %s: %s (exit %d)",
                 StageName(report.failure.stage),
                 ErrorKindName(report.failure.kind),
                 report.ExitCode());
    }
    return report;
}

} // namespace repack
