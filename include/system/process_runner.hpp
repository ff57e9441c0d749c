#pragma once

#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace repack {

// Longest step timeout; anything larger does not fit a steady_clock duration.
constexpr std::chrono::seconds kMaxStepTimeout =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max());

struct CommandSpec {
    std::vector<std::string> argv;
    std::chrono::seconds timeout{0}; // 0 => wait forever
};

struct CommandOutcome {
    int exit_code = -1;     // set when the child exited normally
    int term_signal = 0;    // set when the child was killed by a signal
    bool timed_out = false;
    bool interrupted = false;

    bool Succeeded() const {
        return exit_code == 0 && term_signal == 0 && !timed_out && !interrupted;
    }

    // Shell-style status: exit code, or 128 + signal.
    int StatusCode() const;
    std::string Describe() const;
};

class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;

    // Fails only when the command could not be started (err 127 for exec
    // failures). A started command always yields Ok with the outcome filled.
    virtual Result Run(const CommandSpec& spec, CommandOutcome& out) const = 0;
};

// fork/execvp runner. Forwards pending termination signals to the child and
// enforces CommandSpec::timeout with SIGTERM, then SIGKILL after a grace period.
class ProcessRunner final : public ICommandRunner {
  public:
    static constexpr std::chrono::milliseconds kPollInterval{20};
    static constexpr std::chrono::seconds kKillGrace{2};

    Result Run(const CommandSpec& spec, CommandOutcome& out) const override;

    static std::shared_ptr<const ICommandRunner> Default();
};

std::string FormatCommand(const std::vector<std::string>& argv);

} // namespace repack
