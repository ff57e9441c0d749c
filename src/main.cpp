#include "app/cli.hpp"
#include "pipeline/pipeline.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cstdio>

int main(int argc, char** argv) {
    repack::InstallSignalHandlers();

    repack::CommandLine cmd;
    if (auto r = repack::ParseCommandLine(argc, argv, cmd); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        repack::PrintUsage(argv[0]);
        return repack::kExitUsage;
    }
    if (cmd.help) {
        repack::PrintUsage(argv[0]);
        return repack::kExitOk;
    }

    repack::RunSettings settings;
    if (auto r = repack::ResolveRunSettings(cmd, settings); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return repack::kExitUsage;
    }
    repack::Logger::Instance().SetLevel(settings.log_level);

    repack::Pipeline pipeline(settings.pipeline);
    const repack::RunReport report = pipeline.Run();

    if (!settings.report_path.empty()) {
        auto w = repack::WriteReportFile(report, settings.report_path);
        if (!w.is_ok()) {
            LogWarn("%s", w.msg.c_str());
        }
    }

    return report.ExitCode();
}
