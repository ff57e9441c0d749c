#pragma once

#include <cstdint>
#include <string>

namespace repack {

enum class Stage {
    Start,
    Extracting,
    Scanning,
    Packing,
    Cleanup,
    Done,
    Failed,
};

enum class ErrorKind {
    None,
    Source,
    Workspace,
    Extraction,
    Scan,
    Pack,
    Cleanup,
    Interrupted,
};

const char* StageName(Stage stage);
const char* ErrorKindName(ErrorKind kind);

struct StageRecord {
    Stage stage = Stage::Start;
    bool ok = false;
    int exit_code = 0;
    std::string message;
    std::int64_t duration_ms = 0;
};

struct StageFailure {
    ErrorKind kind = ErrorKind::None;
    Stage stage = Stage::Start;
    int exit_code = 0; // collaborator status, or the Result error code
    int signal = 0;    // set for ErrorKind::Interrupted
    std::string message;
};

class IStageObserver {
  public:
    virtual ~IStageObserver() = default;
    virtual void OnStageStarted(Stage stage) = 0;
    virtual void OnStageFinished(const StageRecord& record) = 0;
};

} // namespace repack
