#include "src/server/process.h"
#include "src/server/logger.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runbox {

namespace {

using Clock = std::chrono::steady_clock;

struct Pipe {
    int read_end = -1;
    int write_end = -1;
};

bool MakePipe(Pipe* p) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        return false;
    }
    p->read_end = fds[0];
    p->write_end = fds[1];
    return true;
}

// Close failures (already closed, EINTR) are ignored.
void CloseQuietly(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Best effort: the group or the process may already be gone. The child is
// signalled directly as well, since it may have moved to another group.
void KillQuietly(pid_t pid) {
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

int WaitForExit(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            Logger::Error("waitpid failed for pid ", pid, ": ", strerror(errno));
            break;
        }
    }
    return status;
}

void RecordExitStatus(int status, ProcessOutcome* outcome) {
    if (WIFEXITED(status)) {
        outcome->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome->exit_signal = WTERMSIG(status);
    }
}

// Upper bound on reads per stream when collecting output at the deadline.
constexpr int kFinalDrainReads = 64;

// Reads whatever is available on *fd into *sink. Closes *fd on EOF or error.
// Returns true if bytes were read.
bool DrainStream(int* fd, std::string* sink) {
    char buffer[4096];
    ssize_t bytes = read(*fd, buffer, sizeof(buffer));
    if (bytes > 0) {
        sink->append(buffer, static_cast<size_t>(bytes));
        return true;
    }
    if (bytes == 0 || (errno != EINTR && errno != EAGAIN)) {
        CloseQuietly(*fd);
    }
    return false;
}

// Non-blocking: collects what is already buffered in the pipe.
void DrainPending(int* fd, std::string* sink) {
    for (int i = 0; i < kFinalDrainReads && *fd >= 0; ++i) {
        if (!DrainStream(fd, sink)) break;
    }
}

} // namespace

std::string SignalName(int signal_number) {
    switch (signal_number) {
        case SIGHUP: return "SIGHUP";
        case SIGINT: return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGILL: return "SIGILL";
        case SIGTRAP: return "SIGTRAP";
        case SIGABRT: return "SIGABRT";
        case SIGBUS: return "SIGBUS";
        case SIGFPE: return "SIGFPE";
        case SIGKILL: return "SIGKILL";
        case SIGUSR1: return "SIGUSR1";
        case SIGSEGV: return "SIGSEGV";
        case SIGUSR2: return "SIGUSR2";
        case SIGPIPE: return "SIGPIPE";
        case SIGALRM: return "SIGALRM";
        case SIGTERM: return "SIGTERM";
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGSYS: return "SIGSYS";
        default: return "SIG" + std::to_string(signal_number);
    }
}

ProcessRunner::ProcessRunner() {
    // A child that exits before consuming its input must not take the
    // server down with it when we write to the pipe.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { signal(SIGPIPE, SIG_IGN); });
}

ProcessOutcome ProcessRunner::Run(const std::string& command,
                                  const std::vector<std::string>& args,
                                  const std::optional<std::string>& stdin_text,
                                  std::chrono::milliseconds timeout) {
    const auto start = Clock::now();
    const auto deadline = start + timeout;
    ProcessOutcome outcome;

    Pipe in, out, err, exec_status;
    if (!MakePipe(&in) || !MakePipe(&out) || !MakePipe(&err) || !MakePipe(&exec_status)) {
        outcome.spawn_error = std::string("failed to create pipes: ") + strerror(errno);
        Logger::Error("Cannot spawn ", command, ": ", *outcome.spawn_error);
        for (Pipe* p : {&in, &out, &err, &exec_status}) {
            CloseQuietly(p->read_end);
            CloseQuietly(p->write_end);
        }
        return outcome;
    }

    // Built before fork: the child may only make async-signal-safe calls.
    std::vector<char*> c_argv;
    c_argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& arg : args) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        outcome.spawn_error = std::string("fork failed: ") + strerror(errno);
        Logger::Error("Cannot spawn ", command, ": ", *outcome.spawn_error);
        for (Pipe* p : {&in, &out, &err, &exec_status}) {
            CloseQuietly(p->read_end);
            CloseQuietly(p->write_end);
        }
        return outcome;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);

        dup2(in.read_end, STDIN_FILENO);
        dup2(out.write_end, STDOUT_FILENO);
        dup2(err.write_end, STDERR_FILENO);

        // Every pipe end is close-on-exec; only the dup2'd copies survive.
        execvp(c_argv[0], c_argv.data());

        int exec_errno = errno;
        ssize_t ignored = write(exec_status.write_end, &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process. Either side may win the setpgid race; both agree.
    setpgid(pid, pid);
    CloseQuietly(in.read_end);
    CloseQuietly(out.write_end);
    CloseQuietly(err.write_end);
    CloseQuietly(exec_status.write_end);

    // EOF here means execvp succeeded and closed the status pipe.
    int exec_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = read(exec_status.read_end, &exec_errno, sizeof(exec_errno));
    } while (status_bytes == -1 && errno == EINTR);
    CloseQuietly(exec_status.read_end);

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        WaitForExit(pid);
        CloseQuietly(in.write_end);
        CloseQuietly(out.read_end);
        CloseQuietly(err.read_end);
        outcome.spawn_error = "spawn " + command + ": " + strerror(exec_errno);
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        Logger::Warn("Failed to spawn ", command, ": ", strerror(exec_errno));
        return outcome;
    }

    Logger::Debug("Spawned ", command, " as pid ", pid);

    const std::string no_input;
    const std::string& pending = stdin_text ? *stdin_text : no_input;
    size_t written = 0;
    if (pending.empty()) {
        CloseQuietly(in.write_end);
    } else {
        SetNonBlocking(in.write_end);
    }
    SetNonBlocking(out.read_end);
    SetNonBlocking(err.read_end);

    bool exited = false;
    int status = 0;

    while (true) {
        const bool streams_open = out.read_end >= 0 || err.read_end >= 0;
        if (!streams_open) {
            pid_t result = waitpid(pid, &status, WNOHANG);
            if (result == pid) {
                exited = true;
                break;
            }
            if (result == -1 && errno != EINTR) {
                Logger::Error("waitpid failed for pid ", pid, ": ", strerror(errno));
                break;
            }
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            outcome.timed_out = true;
            DrainPending(&out.read_end, &outcome.stdout_text);
            DrainPending(&err.read_end, &outcome.stderr_text);
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
        // Streams are closed but the child lives on; poll its status.
        int wait_ms = static_cast<int>(std::min<long long>(remaining, streams_open ? 1000 : 10));

        pollfd fds[3];
        nfds_t nfds = 0;
        int out_index = -1, err_index = -1, in_index = -1;
        if (out.read_end >= 0) {
            out_index = static_cast<int>(nfds);
            fds[nfds++] = {out.read_end, POLLIN, 0};
        }
        if (err.read_end >= 0) {
            err_index = static_cast<int>(nfds);
            fds[nfds++] = {err.read_end, POLLIN, 0};
        }
        if (in.write_end >= 0) {
            in_index = static_cast<int>(nfds);
            fds[nfds++] = {in.write_end, POLLOUT, 0};
        }

        int ready = poll(fds, nfds, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::Error("poll failed for pid ", pid, ": ", strerror(errno));
            break;
        }
        if (ready == 0) continue;

        if (out_index >= 0 && fds[out_index].revents != 0) {
            DrainStream(&out.read_end, &outcome.stdout_text);
        }
        if (err_index >= 0 && fds[err_index].revents != 0) {
            DrainStream(&err.read_end, &outcome.stderr_text);
        }
        if (in_index >= 0 && fds[in_index].revents != 0) {
            ssize_t bytes = write(in.write_end, pending.data() + written, pending.size() - written);
            if (bytes > 0) {
                written += static_cast<size_t>(bytes);
                if (written == pending.size()) {
                    CloseQuietly(in.write_end);
                }
            } else if (bytes == -1 && errno != EAGAIN && errno != EINTR) {
                // EPIPE: the child stopped reading. Its remaining input is dropped.
                Logger::Debug("stdin of pid ", pid, " closed early: ", strerror(errno));
                CloseQuietly(in.write_end);
            }
        }
    }

    if (!exited) {
        if (outcome.timed_out) {
            Logger::Warn("Deadline of ", timeout.count(), "ms exceeded for ", command,
                         " (pid ", pid, "), killing");
        }
        KillQuietly(pid);
        status = WaitForExit(pid);
    }
    RecordExitStatus(status, &outcome);

    CloseQuietly(in.write_end);
    CloseQuietly(out.read_end);
    CloseQuietly(err.read_end);

    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    Logger::Debug("pid ", pid, " finished in ", outcome.duration.count(), "ms");
    return outcome;
}

} // namespace runbox
