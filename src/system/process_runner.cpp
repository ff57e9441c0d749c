#include "system/process_runner.hpp"

#include "io/fd.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace repack {

namespace {

using Clock = std::chrono::steady_clock;

// Reaps a child whose exec failed. It exits immediately with 127.
void ReapQuietly(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

Result WaitForChild(pid_t pid, const CommandSpec& spec, CommandOutcome& out) {
    const auto start = Clock::now();
    bool term_sent = false;
    auto kill_deadline = Clock::time_point::max();
    int status = 0;

    while (true) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            return Result::Fail(err, "waitpid failed: " + std::string(std::strerror(err)));
        }

        const auto now = Clock::now();
        if (!term_sent) {
            if (CancelRequested()) {
                out.interrupted = true;
                LogWarn("Signal %d received, stopping %s (pid %d)",
                        PendingSignal(), spec.argv.front().c_str(), static_cast<int>(pid));
                ::kill(pid, PendingSignal());
                term_sent = true;
                kill_deadline = now + ProcessRunner::kKillGrace;
            } else if (spec.timeout.count() > 0 &&
                       std::chrono::duration_cast<std::chrono::seconds>(now - start) >= spec.timeout) {
                out.timed_out = true;
                LogWarn("%s exceeded timeout of %llds, terminating (pid %d)",
                        spec.argv.front().c_str(),
                        static_cast<long long>(spec.timeout.count()),
                        static_cast<int>(pid));
                ::kill(pid, SIGTERM);
                term_sent = true;
                kill_deadline = now + ProcessRunner::kKillGrace;
            }
        } else if (now >= kill_deadline) {
            LogWarn("%s ignored SIGTERM, sending SIGKILL (pid %d)",
                    spec.argv.front().c_str(), static_cast<int>(pid));
            ::kill(pid, SIGKILL);
            kill_deadline = Clock::time_point::max();
        }

        std::this_thread::sleep_for(ProcessRunner::kPollInterval);
    }

    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.term_signal = WTERMSIG(status);
    }
    if (CancelRequested()) {
        out.interrupted = true;
    }
    return Result::Ok();
}

} // namespace

int CommandOutcome::StatusCode() const {
    if (term_signal != 0) return 128 + term_signal;
    return exit_code;
}

std::string CommandOutcome::Describe() const {
    if (timed_out) return "timed out (status " + std::to_string(StatusCode()) + ")";
    if (interrupted) return "interrupted (status " + std::to_string(StatusCode()) + ")";
    if (term_signal != 0) return "killed by signal " + std::to_string(term_signal);
    return "exit code " + std::to_string(exit_code);
}

std::string FormatCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out.push_back(' ');
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            out += "'" + arg + "'";
        } else {
            out += arg;
        }
    }
    return out;
}

Result ProcessRunner::Run(const CommandSpec& spec, CommandOutcome& out) const {
    out = CommandOutcome{};
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return Result::Fail(-1, "empty command");
    }

    std::vector<char*> args;
    args.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // The child reports an exec failure through this pipe; a successful exec
    // closes the write end (O_CLOEXEC) and the parent reads EOF.
    Fd err_read;
    Fd err_write;
    auto pipe_result = Fd::OpenPipe(err_read, err_write);
    if (!pipe_result.is_ok()) return pipe_result;

    LogDebug("exec: %s", FormatCommand(spec.argv).c_str());

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        return Result::Fail(err, "fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        ::execvp(args[0], args.data());
        const int err = errno;
        (void)!::write(err_write.Get(), &err, sizeof(err));
        ::_exit(127);
    }

    SetForwardTarget(pid);
    err_write.Close();

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(err_read.Get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ReapQuietly(pid);
        SetForwardTarget(0);
        return Result::Fail(127,
                            "cannot execute " + spec.argv.front() + ": " +
                                std::strerror(child_errno));
    }

    auto wait_result = WaitForChild(pid, spec, out);
    SetForwardTarget(0);
    return wait_result;
}

std::shared_ptr<const ICommandRunner> ProcessRunner::Default() {
    static const std::shared_ptr<const ICommandRunner> kDefault = std::make_shared<ProcessRunner>();
    return kDefault;
}

} // namespace repack
