#pragma once

#include "pipeline/collaborators.hpp"
#include "pipeline/run_report.hpp"
#include "pipeline/source_locator.hpp"
#include "pipeline/stage.hpp"
#include "pipeline/workspace.hpp"
#include "system/process_runner.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace repack {

constexpr const char kDefaultWorkspaceDir[] = "./my_temp_extract_dir";
constexpr const char kDefaultOutputArchive[] = "temp_result.7z";
constexpr const char kDefaultArchiver[] = "archive-tool";
constexpr const char kDefaultScanner[] = "./scanner";
constexpr const char kDefaultSourcePattern[] = "*.7z";

struct PipelineOptions {
    SourceQuery source;
    std::string workspace_dir = kDefaultWorkspaceDir;
    std::string output_archive = kDefaultOutputArchive;

    std::string archiver = kDefaultArchiver;
    ArchiverDialect dialect = ArchiverDialect::Generic;
    std::string scanner = kDefaultScanner;

    std::chrono::seconds step_timeout{0};
    StalePolicy stale_policy = StalePolicy::Fail;
    bool verify_output = false;
};

// extract -> scan -> pack, each gated on the previous one, followed by an
// unconditional workspace cleanup. The first failure is the run's outcome.
class Pipeline {
  public:
    explicit Pipeline(PipelineOptions opt,
                      std::shared_ptr<const ICommandRunner> runner = nullptr,
                      std::shared_ptr<const Workspace::IFileSystemOps> fs_ops = nullptr);

    void SetStageObserver(IStageObserver* observer) { observer_ = observer; }

    RunReport Run();

    const PipelineOptions& Options() const { return opt_; }

  private:
    bool RunStage(Stage stage, ErrorKind kind, RunReport& report, const std::function<Result()>& body);
    void RunStages(const Workspace& workspace, RunReport& report);
    void ReleaseWorkspace(Workspace& workspace, RunReport& report);
    void RecordOutput(RunReport& report) const;

    static void SetFailure(RunReport& report, ErrorKind kind, Stage stage, const Result& res);

    PipelineOptions opt_;
    std::shared_ptr<const ICommandRunner> runner_;
    std::shared_ptr<const Workspace::IFileSystemOps> fs_ops_;
    IStageObserver* observer_ = nullptr;
};

} // namespace repack
