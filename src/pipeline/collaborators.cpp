#include "pipeline/collaborators.hpp"

#include "pipeline/output_verifier.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace repack {

namespace {

std::shared_ptr<const ICommandRunner> OrDefault(std::shared_ptr<const ICommandRunner> runner) {
    return runner ? std::move(runner) : ProcessRunner::Default();
}

Result RunCollaborator(const ICommandRunner& runner,
                       std::vector<std::string> argv,
                       std::chrono::seconds timeout,
                       const char* what) {
    CommandSpec spec;
    spec.argv = std::move(argv);
    spec.timeout = timeout;

    LogInfo("%s: %s", what, FormatCommand(spec.argv).c_str());

    CommandOutcome outcome;
    auto run_result = runner.Run(spec, outcome);
    if (!run_result.is_ok())
        return run_result.WithContext(what);

    if (!outcome.Succeeded()) {
        const int status = outcome.StatusCode();
        return Result::Fail(status == 0 ? -1 : status,
                            std::string(what) + " failed: " + outcome.Describe());
    }
    return Result::Ok();
}

void DiscardFile(const std::string& path) {
    std::error_code ec;
    if (fs::remove(fs::path(path), ec)) {
        LogDebug("Removed %s", path.c_str());
    } else if (ec) {
        LogWarn("Cannot remove %s: %s", path.c_str(), ec.message().c_str());
    }
}

} // namespace

std::expected<ArchiverDialect, std::string> ParseArchiverDialect(std::string_view name) {
    std::string lower;
    for (unsigned char c : name) {
        lower.push_back(static_cast<char>(std::tolower(c)));
    }
    if (lower == "generic") return ArchiverDialect::Generic;
    if (lower == "7z" || lower == "7za" || lower == "7zip") return ArchiverDialect::SevenZip;
    return std::unexpected("unknown archiver dialect: " + std::string(name));
}

const char* ArchiverDialectName(ArchiverDialect dialect) {
    switch (dialect) {
        case ArchiverDialect::Generic: return "generic";
        case ArchiverDialect::SevenZip: return "7z";
    }
    return "unknown";
}

std::vector<std::string> ArchiverCommands::Extract(const std::string& archive,
                                                   const std::string& dir) const {
    if (dialect_ == ArchiverDialect::SevenZip) {
        return {tool_, "x", "-aoa", archive, "-o" + dir};
    }
    return {tool_, "extract", archive, "--output-dir", dir, "--overwrite"};
}

std::vector<std::string> ArchiverCommands::Compress(const std::vector<std::string>& inputs,
                                                    const std::string& archive) const {
    std::vector<std::string> argv;
    argv.reserve(inputs.size() + 6);
    argv.push_back(tool_);

    if (dialect_ == ArchiverDialect::SevenZip) {
        argv.push_back("a");
        argv.push_back(archive);
        argv.insert(argv.end(), inputs.begin(), inputs.end());
        argv.push_back("-mx9");
        return argv;
    }

    argv.push_back("compress");
    argv.insert(argv.end(), inputs.begin(), inputs.end());
    argv.push_back("--output");
    argv.push_back(archive);
    argv.push_back("--compression-level");
    argv.push_back("max");
    return argv;
}

ArchiveExtractor::ArchiveExtractor(ArchiverCommands commands,
                                   std::shared_ptr<const ICommandRunner> runner,
                                   std::chrono::seconds timeout)
    : commands_(std::move(commands)), runner_(OrDefault(std::move(runner))), timeout_(timeout) {}

Result ArchiveExtractor::Extract(const std::string& source_archive,
                                 const Workspace& workspace) const {
    if (!workspace.Active())
        return Result::Fail(-1, "extract: workspace is not acquired");

    std::error_code ec;
    const auto st = fs::status(fs::path(source_archive), ec);
    if (ec || !fs::exists(st)) {
        return Result::Fail(-1, "source archive not found: " + source_archive);
    }
    if (!fs::is_regular_file(st)) {
        return Result::Fail(-1, "source archive is not a regular file: " + source_archive);
    }
    if (::access(source_archive.c_str(), R_OK) != 0) {
        const int err = errno;
        return Result::Fail(-1, "source archive not readable: " + source_archive + ": " +
                                    std::strerror(err));
    }

    return RunCollaborator(*runner_,
                           commands_.Extract(source_archive, workspace.Dir()),
                           timeout_,
                           "extract");
}

ContentScanner::ContentScanner(std::string scanner_path,
                               std::shared_ptr<const ICommandRunner> runner,
                               std::chrono::seconds timeout)
    : scanner_path_(std::move(scanner_path)), runner_(OrDefault(std::move(runner))),
      timeout_(timeout) {}

Result ContentScanner::Scan(const Workspace& workspace) const {
    if (!workspace.Active())
        return Result::Fail(-1, "scan: workspace is not acquired");
    if (scanner_path_.empty())
        return Result::Fail(-1, "scan: no scanner configured");

    return RunCollaborator(*runner_, {scanner_path_, workspace.Dir()}, timeout_, "scan");
}

ArchivePacker::ArchivePacker(ArchiverCommands commands,
                             std::shared_ptr<const ICommandRunner> runner,
                             Options opt)
    : commands_(std::move(commands)), runner_(OrDefault(std::move(runner))), opt_(opt) {}

Result ArchivePacker::ListInputs(const std::string& dir, std::vector<std::string>& out) {
    out.clear();

    std::error_code ec;
    fs::directory_iterator it(fs::path(dir), ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot list " + dir + ": " + ec.message());
    }

    std::vector<std::string> names;
    fs::directory_iterator end;
    while (it != end) {
        names.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) break;
    }
    if (ec) {
        return Result::Fail(ec.value(), "cannot list " + dir + ": " + ec.message());
    }

    std::sort(names.begin(), names.end());
    out.reserve(names.size());
    for (const auto& name : names) {
        out.push_back((fs::path(dir) / name).string());
    }
    return Result::Ok();
}

Result ArchivePacker::Pack(const Workspace& workspace, const std::string& output_archive) const {
    if (!workspace.Active())
        return Result::Fail(-1, "pack: workspace is not acquired");
    if (output_archive.empty())
        return Result::Fail(-1, "pack: output archive path is empty");

    std::vector<std::string> inputs;
    auto list_result = ListInputs(workspace.Dir(), inputs);
    if (!list_result.is_ok())
        return list_result.WithContext("pack");
    if (inputs.empty())
        return Result::Fail(-1, "pack: workspace " + workspace.Dir() + " is empty, nothing to pack");

    const std::string staging = StagingPathFor(output_archive);
    // Appending to a leftover staging file would mix runs.
    DiscardFile(staging);

    auto run_result =
        RunCollaborator(*runner_, commands_.Compress(inputs, staging), opt_.timeout, "pack");
    if (!run_result.is_ok()) {
        DiscardFile(staging);
        return run_result;
    }

    auto publish_result = Publish(staging, output_archive);
    if (!publish_result.is_ok()) {
        DiscardFile(staging);
        return publish_result;
    }
    return Result::Ok();
}

Result ArchivePacker::Publish(const std::string& staging, const std::string& output_archive) const {
    std::error_code ec;
    const auto size = fs::file_size(fs::path(staging), ec);
    if (ec) {
        return Result::Fail(-1, "pack: archiver reported success but produced no " + staging);
    }
    if (size == 0) {
        return Result::Fail(-1, "pack: archiver produced an empty archive " + staging);
    }

    if (opt_.verify_output) {
        OutputVerifier verifier;
        OutputVerifier::Summary summary;
        auto verify_result = verifier.Verify(staging, summary);
        if (!verify_result.is_ok())
            return verify_result.WithContext("pack: output verification failed");
        LogInfo("Verified %s: %zu entries", staging.c_str(), summary.entries);
    }

    fs::rename(fs::path(staging), fs::path(output_archive), ec);
    if (ec) {
        return Result::Fail(ec.value(),
                            "pack: cannot move " + staging + " to " + output_archive + ": " +
                                ec.message());
    }

    LogInfo("Wrote %s (%llu bytes)", output_archive.c_str(), static_cast<unsigned long long>(size));
    return Result::Ok();
}

} // namespace repack
