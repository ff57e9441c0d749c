#include "pipeline/stage.hpp"

namespace repack {

const char* StageName(Stage stage) {
    switch (stage) {
        case Stage::Start:      return "start";
        case Stage::Extracting: return "extract";
        case Stage::Scanning:   return "scan";
        case Stage::Packing:    return "pack";
        case Stage::Cleanup:    return "cleanup";
        case Stage::Done:       return "done";
        case Stage::Failed:     return "failed";
    }
    return "unknown";
}

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:        return "none";
        case ErrorKind::Source:      return "SourceError";
        case ErrorKind::Workspace:   return "WorkspaceError";
        case ErrorKind::Extraction:  return "ExtractionError";
        case ErrorKind::Scan:        return "ScanError";
        case ErrorKind::Pack:        return "PackError";
        case ErrorKind::Cleanup:     return "CleanupError";
        case ErrorKind::Interrupted: return "Interrupted";
    }
    return "unknown";
}

} // namespace repack
