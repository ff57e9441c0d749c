#include "app/cli.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <string>

namespace repack {

namespace {

Result ParseSeconds(const char* text, std::uint64_t& out) {
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(text, &end, 10);
    if (!end || *end != '\0' || end == text || errno != 0 || text[0] == '-') {
        return Result::Fail(-1, std::string("Invalid --timeout: ") + text);
    }
    if (v > static_cast<unsigned long long>(kMaxStepTimeout.count())) {
        return Result::Fail(-1, std::string("Invalid --timeout: ") + text + " exceeds " +
                                    std::to_string(kMaxStepTimeout.count()) + " seconds");
    }
    out = static_cast<std::uint64_t>(v);
    return Result::Ok();
}

} // namespace

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-i <archive>] [-w <dir>] [-o <archive>] [options]\n"
        "\n"
        "Extracts the source archive into a workspace, runs the scanner on it and,\n"
        "if the scan succeeds, repacks the workspace into a new archive.\n"
        "\n"
        "Options:\n"
        "  -i, --input <file>        Source archive (default: the single match of --pattern)\n"
        "  -p, --pattern <glob>      Source pattern in the current directory (default %s)\n"
        "  -w, --workspace <dir>     Working directory (default %s)\n"
        "  -o, --output <file>       Output archive (default %s)\n"
        "  -a, --archiver <path>     Archiver executable (default %s)\n"
        "  -d, --dialect <name>      Archiver syntax: generic or 7z (default generic)\n"
        "  -s, --scanner <path>      Scanner executable (default %s)\n"
        "  -t, --timeout <seconds>   Per-step timeout, 0 disables (default 0)\n"
        "  -f, --force-clean         Clear a workspace left over by an earlier run\n"
        "  -V, --verify-output       Read the output archive back before publishing it\n"
        "  -r, --report <file>       Write a JSON run report\n"
        "  -c, --config <file>       JSON config file (command-line options win)\n"
        "  -l, --log-level <level>   debug, info, warn, error or none (default info)\n"
        "  -h, --help                Show this help\n"
        "\n"
        "Exit status: 0 success, 1 extract, 2 scan, 3 pack, 4 cleanup, 5 workspace,\n"
        "6 source selection, 64 usage, 128+N interrupted by signal N.\n",
        argv0,
        kDefaultSourcePattern,
        kDefaultWorkspaceDir,
        kDefaultOutputArchive,
        kDefaultArchiver,
        kDefaultScanner);
}

Result ParseCommandLine(int argc, char** argv, CommandLine& out) {
    out = CommandLine{};

    static const option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"pattern", required_argument, nullptr, 'p'},
        {"workspace", required_argument, nullptr, 'w'},
        {"output", required_argument, nullptr, 'o'},
        {"archiver", required_argument, nullptr, 'a'},
        {"dialect", required_argument, nullptr, 'd'},
        {"scanner", required_argument, nullptr, 's'},
        {"timeout", required_argument, nullptr, 't'},
        {"force-clean", no_argument, nullptr, 'f'},
        {"verify-output", no_argument, nullptr, 'V'},
        {"report", required_argument, nullptr, 'r'},
        {"config", required_argument, nullptr, 'c'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    opterr = 0;
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, ":hi:p:w:o:a:d:s:t:fVr:c:l:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                out.help = true;
                break;
            case 'i':
                out.overrides.source_archive = optarg;
                break;
            case 'p':
                out.overrides.source_pattern = optarg;
                break;
            case 'w':
                out.overrides.workspace_dir = optarg;
                break;
            case 'o':
                out.overrides.output_archive = optarg;
                break;
            case 'a':
                out.overrides.archiver_path = optarg;
                break;
            case 'd':
                out.overrides.archiver_dialect = optarg;
                break;
            case 's':
                out.overrides.scanner_path = optarg;
                break;
            case 't': {
                std::uint64_t seconds = 0;
                auto r = ParseSeconds(optarg, seconds);
                if (!r.is_ok()) return r;
                out.overrides.step_timeout_seconds = seconds;
                break;
            }
            case 'f':
                out.overrides.force_clean_workspace = true;
                break;
            case 'V':
                out.overrides.verify_output = true;
                break;
            case 'r':
                out.overrides.report_path = optarg;
                break;
            case 'c':
                out.config_path = optarg;
                break;
            case 'l':
                out.overrides.log_level = optarg;
                break;
            case ':':
                return Result::Fail(-1, std::string("missing argument for ") + argv[optind - 1]);
            default:
                return Result::Fail(-1, std::string("unknown option: ") +
                                            (optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
        }
    }

    if (optind < argc) {
        if (out.overrides.source_archive.has_value() || argc - optind > 1) {
            return Result::Fail(-1, std::string("unexpected argument: ") + argv[optind]);
        }
        // A single positional argument is the source archive.
        out.overrides.source_archive = argv[optind];
    }

    return Result::Ok();
}

Result BuildRunSettings(const config::PipelineSettings& settings, RunSettings& out) {
    out = RunSettings{};
    PipelineOptions& opt = out.pipeline;

    if (settings.source_archive) opt.source.explicit_path = *settings.source_archive;
    if (settings.source_pattern) opt.source.pattern = *settings.source_pattern;
    if (settings.workspace_dir) opt.workspace_dir = *settings.workspace_dir;
    if (settings.output_archive) opt.output_archive = *settings.output_archive;
    if (settings.archiver_path) opt.archiver = *settings.archiver_path;
    if (settings.scanner_path) opt.scanner = *settings.scanner_path;
    if (settings.step_timeout_seconds) {
        if (*settings.step_timeout_seconds > static_cast<std::uint64_t>(kMaxStepTimeout.count())) {
            return Result::Fail(-1, "step timeout of " + std::to_string(*settings.step_timeout_seconds) +
                                        " seconds exceeds " +
                                        std::to_string(kMaxStepTimeout.count()));
        }
        opt.step_timeout = std::chrono::seconds(static_cast<std::int64_t>(*settings.step_timeout_seconds));
    }
    if (settings.force_clean_workspace) {
        opt.stale_policy = *settings.force_clean_workspace ? StalePolicy::ForceClean : StalePolicy::Fail;
    }
    if (settings.verify_output) opt.verify_output = *settings.verify_output;
    if (settings.report_path) out.report_path = *settings.report_path;

    if (settings.archiver_dialect) {
        auto dialect = ParseArchiverDialect(*settings.archiver_dialect);
        if (!dialect) return Result::Fail(-1, dialect.error());
        opt.dialect = *dialect;
    }
    if (settings.log_level) {
        auto level = ParseLogLevel(*settings.log_level);
        if (!level) return Result::Fail(-1, level.error());
        out.log_level = *level;
    }

    if (opt.workspace_dir.empty()) return Result::Fail(-1, "workspace path must not be empty");
    if (opt.output_archive.empty()) return Result::Fail(-1, "output archive path must not be empty");
    if (opt.archiver.empty()) return Result::Fail(-1, "archiver path must not be empty");
    if (opt.scanner.empty()) return Result::Fail(-1, "scanner path must not be empty");
    if (opt.source.explicit_path.empty() && opt.source.pattern.empty()) {
        return Result::Fail(-1, "either an input archive or a source pattern is required");
    }
    return Result::Ok();
}

Result ResolveRunSettings(const CommandLine& cmd, RunSettings& out) {
    config::PipelineSettings merged;
    if (!cmd.config_path.empty()) {
        config::PipelineConfigFromFile cfg;
        auto load_result = cfg.LoadFile(cmd.config_path);
        if (!load_result.is_ok()) return load_result;
        merged.MergeFrom(cfg);
    }
    merged.MergeFrom(cmd.overrides);
    return BuildRunSettings(merged, out);
}

} // namespace repack
