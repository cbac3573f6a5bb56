#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace runbox {

// Normalized result of running one external process. Termination cause is
// exactly one of: normal exit (exit_code or exit_signal set), spawn_error, or
// timed_out. exit_signal may accompany a timeout (the kill that ended it).
struct ProcessOutcome {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    std::optional<int> exit_signal;
    std::optional<std::string> spawn_error;
    bool timed_out = false;
    std::chrono::milliseconds duration{0};

    bool ExitedCleanly() const {
        return !spawn_error && !timed_out && exit_code && *exit_code == 0;
    }
};

// Renders a signal number as its conventional name, e.g. "SIGSEGV".
std::string SignalName(int signal_number);

class Runner {
public:
    virtual ~Runner() = default;

    // Runs `command` with `args` to completion or until `timeout` elapses.
    // When stdin_text is absent or empty the child's stdin is closed at once.
    // Never throws for conditions of the child process itself.
    virtual ProcessOutcome Run(const std::string& command,
                               const std::vector<std::string>& args,
                               const std::optional<std::string>& stdin_text,
                               std::chrono::milliseconds timeout) = 0;
};

// POSIX runner: fork/execvp with piped stdio, multiplexed with poll(2).
// The child leads its own process group so a deadline kill reaches any
// helpers it started.
class ProcessRunner : public Runner {
public:
    ProcessRunner();

    ProcessOutcome Run(const std::string& command,
                       const std::vector<std::string>& args,
                       const std::optional<std::string>& stdin_text,
                       std::chrono::milliseconds timeout) override;
};

} // namespace runbox
