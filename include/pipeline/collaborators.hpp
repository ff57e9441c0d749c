#pragma once

#include "pipeline/workspace.hpp"
#include "system/process_runner.hpp"
#include "util/result.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace repack {

// Command-line syntax used to drive the archiver.
enum class ArchiverDialect {
    Generic, // archive-tool extract|compress ...
    SevenZip, // 7za x|a ...
};

std::expected<ArchiverDialect, std::string> ParseArchiverDialect(std::string_view name);
const char* ArchiverDialectName(ArchiverDialect dialect);

class ArchiverCommands {
  public:
    ArchiverCommands(std::string tool, ArchiverDialect dialect)
        : tool_(std::move(tool)), dialect_(dialect) {}

    // Extract all entries into dir, overwriting on conflict.
    std::vector<std::string> Extract(const std::string& archive, const std::string& dir) const;
    // Compress inputs into archive with maximum compression.
    std::vector<std::string> Compress(const std::vector<std::string>& inputs,
                                      const std::string& archive) const;

    const std::string& Tool() const { return tool_; }
    ArchiverDialect Dialect() const { return dialect_; }

  private:
    std::string tool_;
    ArchiverDialect dialect_;
};

// Collaborator failures carry the collaborator status in Result::err
// (exit code, 128 + signal, 127 when it could not be started, -1 otherwise).
class ArchiveExtractor {
  public:
    ArchiveExtractor(ArchiverCommands commands,
                     std::shared_ptr<const ICommandRunner> runner,
                     std::chrono::seconds timeout = std::chrono::seconds{0});

    Result Extract(const std::string& source_archive, const Workspace& workspace) const;

  private:
    ArchiverCommands commands_;
    std::shared_ptr<const ICommandRunner> runner_;
    std::chrono::seconds timeout_;
};

class ContentScanner {
  public:
    ContentScanner(std::string scanner_path,
                   std::shared_ptr<const ICommandRunner> runner,
                   std::chrono::seconds timeout = std::chrono::seconds{0});

    Result Scan(const Workspace& workspace) const;

  private:
    std::string scanner_path_;
    std::shared_ptr<const ICommandRunner> runner_;
    std::chrono::seconds timeout_;
};

class ArchivePacker {
  public:
    struct Options {
        bool verify_output = false;
        std::chrono::seconds timeout{0};
    };

    ArchivePacker(ArchiverCommands commands,
                  std::shared_ptr<const ICommandRunner> runner,
                  Options opt);

    // Packs into the staging path, then renames it onto output_archive.
    // On failure neither the staging file nor a new output_archive remains.
    Result Pack(const Workspace& workspace, const std::string& output_archive) const;

    // Immediate children of dir, sorted by name, as dir/<name>.
    static Result ListInputs(const std::string& dir, std::vector<std::string>& out);

  private:
    Result Publish(const std::string& staging, const std::string& output_archive) const;

    ArchiverCommands commands_;
    std::shared_ptr<const ICommandRunner> runner_;
    Options opt_;
};

} // namespace repack
