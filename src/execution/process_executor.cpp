#include "execution/process_executor.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "execution/output_capture.hpp"
#include "policy/request_guard.hpp"
#include "runners/interpreter_locator.hpp"

namespace sandrun::execution {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using protocol::ExecutionResult;
using Clock = std::chrono::steady_clock;

namespace {

constexpr int kPollSliceMs = 50;

// Owns both ends of a pipe; closes whatever is still open on destruction.
class Pipe {
public:
    Pipe() = default;
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    // Close-on-exec, so children forked concurrently for other requests never
    // inherit our ends and hold them open.
    bool open() { return pipe2(fds_, O_CLOEXEC) == 0; }

    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] != -1) {
            static_cast<void>(close(fds_[0]));
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] != -1) {
            static_cast<void>(close(fds_[1]));
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Reads everything currently available. Returns false once the stream is closed.
bool drain_pipe(Pipe& pipe, CappedOutput& out) {
    char buffer[65536];
    while (true) {
        const ssize_t n = read(pipe.read_fd(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        pipe.close_read();
        return false;
    }
}

void apply_limit(const int resource, const std::uint64_t value) {
    if (value == 0) {
        return;
    }
    rlimit limit{};
    limit.rlim_cur = static_cast<rlim_t>(value);
    limit.rlim_max = static_cast<rlim_t>(value);
    static_cast<void>(setrlimit(resource, &limit));
}

// Only async-signal-safe calls between fork and exec: argv is built beforehand.
[[noreturn]] void exec_child(const char* interpreter, char* const* argv,
                             const char* cwd, const Pipe& out, const Pipe& err,
                             const Pipe& exec_status,
                             const core::config::ResourceLimits& limits) {
    static_cast<void>(setpgid(0, 0));

    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull != -1) {
        static_cast<void>(dup2(devnull, STDIN_FILENO));
        static_cast<void>(close(devnull));
    }
    static_cast<void>(dup2(out.write_fd(), STDOUT_FILENO));
    static_cast<void>(dup2(err.write_fd(), STDERR_FILENO));

    int child_errno = 0;
    if (chdir(cwd) != 0) {
        child_errno = errno;
    } else {
        apply_limit(RLIMIT_AS, limits.max_memory_bytes);
        apply_limit(RLIMIT_CPU, limits.max_cpu_seconds);
        apply_limit(RLIMIT_FSIZE, limits.max_file_bytes);
        apply_limit(RLIMIT_NOFILE, limits.max_open_files);

        execv(interpreter, argv);
        child_errno = errno;
    }

    static_cast<void>(write(exec_status.write_fd(), &child_errno, sizeof(child_errno)));
    _exit(127);
}

// Waits for the exec status pipe: EOF means exec succeeded, an int means the
// child failed before or at execv.
std::optional<int> read_exec_errno(Pipe& exec_status) {
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_status.read_fd(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    exec_status.close_read();
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        return child_errno;
    }
    return std::nullopt;
}

// True once the child has exited. WNOWAIT leaves it unreaped, so its pid, which
// is also the process group id, cannot be recycled while we signal the group.
bool leader_has_exited(const pid_t pid) {
    siginfo_t info{};
    if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

void kill_group(const pid_t pgid) {
    if (kill(-pgid, SIGKILL) != 0 && errno != ESRCH) {
        LOG_WARN("ProcessExecutor: kill of process group " + std::to_string(pgid) +
                 " failed: " + std::strerror(errno));
    }
}

std::optional<int> reap(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            LOG_WARN("ProcessExecutor: waitpid failed for " + std::to_string(pid) +
                     ": " + std::strerror(errno));
            return std::nullopt;
        }
    }
    return status;
}

int poll_wait_ms(const Clock::time_point now, const Clock::time_point until) {
    if (until <= now) {
        return 0;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count() + 1;
    return static_cast<int>(std::min<std::int64_t>(remaining, kPollSliceMs));
}

core::errors::Result<bool> write_snippet(const std::filesystem::path& path,
                                         const std::string& source) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ExecError{ErrorCategory::Resource,
                         "Failed to create snippet file: " + path.string(),
                         "snippet_write_failed"};
    }
    out.write(source.data(), static_cast<std::streamsize>(source.size()));
    out.flush();
    if (!out.good()) {
        return ExecError{ErrorCategory::Resource,
                         "Failed to write snippet file: " + path.string(),
                         "snippet_write_failed"};
    }
    return true;
}

}  // namespace

ProcessExecutor::ProcessExecutor(ExecutorOptions options)
    : options_(std::move(options)) {}

core::errors::Result<ExecutionResult> ProcessExecutor::run(
    const workspace::Workspace& workspace,
    const std::filesystem::path& snippet_path,
    const std::string& source,
    const runners::RunnerSpec& runner,
    const std::chrono::milliseconds timeout) const {
    if (timeout.count() <= 0) {
        return ExecError{ErrorCategory::Input, "Timeout must be positive.",
                         "invalid_timeout"};
    }

    const policy::RequestGuard guard;
    auto validated = guard.validate_path_in_workspace(workspace.path, snippet_path);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    const std::filesystem::path file_path = core::errors::get_value(validated);

    auto written = write_snippet(file_path, source);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    auto located = runners::locate_interpreter(runner.interpreter_command);
    if (core::errors::is_error(located)) {
        return core::errors::get_error(located);
    }
    const std::string interpreter = core::errors::get_value(located).string();

    std::vector<std::string> args = runners::build_argv(runner, interpreter, file_path);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string cwd = workspace.path.string();

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe status_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !status_pipe.open()) {
        return ExecError{ErrorCategory::Internal,
                         std::string("Failed to create process pipes: ") +
                             std::strerror(errno),
                         "pipe_creation_failed"};
    }

    const auto started = Clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        return ExecError{ErrorCategory::Internal,
                         std::string("Failed to fork process: ") + std::strerror(errno),
                         "fork_failed"};
    }

    if (pid == 0) {
        exec_child(interpreter.c_str(), argv.data(), cwd.c_str(), out_pipe, err_pipe,
                   status_pipe, options_.limits);
    }

    // Also set from the parent so the group exists before we might signal it.
    if (setpgid(pid, pid) != 0 && errno != EACCES && errno != ESRCH) {
        LOG_WARN("ProcessExecutor: setpgid failed for " + std::to_string(pid) + ": " +
                 std::strerror(errno));
    }
    out_pipe.close_write();
    err_pipe.close_write();
    status_pipe.close_write();

    const auto exec_errno = read_exec_errno(status_pipe);
    if (exec_errno.has_value()) {
        kill_group(pid);
        static_cast<void>(reap(pid));
        return ExecError{ErrorCategory::RunnerUnavailable,
                         "Failed to start interpreter '" + runner.interpreter_command +
                             "': " + std::strerror(exec_errno.value()),
                         "runner_unavailable",
                         "Check that '" + interpreter + "' is a working executable."};
    }
    LOG_DEBUG("ProcessExecutor: started " + protocol::to_string(runner.language) +
              " snippet as pid " + std::to_string(pid));

    set_nonblocking(out_pipe.read_fd());
    set_nonblocking(err_pipe.read_fd());

    CappedOutput stdout_capture(options_.output_cap_bytes);
    CappedOutput stderr_capture(options_.output_cap_bytes);
    bool stdout_open = true;
    bool stderr_open = true;

    ExecutionResult result;
    const auto deadline = started + timeout;
    bool reaped = false;
    std::optional<int> status;
    Clock::time_point ended = started;
    Clock::time_point drain_deadline = started;

    while (true) {
        const auto now = Clock::now();
        if (!reaped) {
            const bool exited = leader_has_exited(pid);
            if (!exited && now >= deadline) {
                result.timed_out = true;
            }
            if (exited || result.timed_out) {
                // Descendants share the group: kill them before reaping the
                // leader so none outlives the request.
                kill_group(pid);
                status = reap(pid);
                reaped = true;
                ended = Clock::now();
                drain_deadline = ended + options_.drain_grace;
                if (result.timed_out) {
                    LOG_WARN("ProcessExecutor: pid " + std::to_string(pid) +
                             " exceeded " + std::to_string(timeout.count()) +
                             " ms and was killed");
                }
            }
        }

        if (reaped && ((!stdout_open && !stderr_open) || Clock::now() >= drain_deadline)) {
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = out_pipe.read_fd();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = err_pipe.read_fd();
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        const auto poll_now = Clock::now();
        const int wait_ms = poll_wait_ms(poll_now, reaped ? drain_deadline : deadline);
        static_cast<void>(poll(fds, nfds, std::max(wait_ms, 1)));

        if (stdout_open) {
            stdout_open = drain_pipe(out_pipe, stdout_capture);
        }
        if (stderr_open) {
            stderr_open = drain_pipe(err_pipe, stderr_capture);
        }
    }

    if (stdout_open || stderr_open) {
        LOG_WARN("ProcessExecutor: output of pid " + std::to_string(pid) +
                 " still open after kill; a descendant left the process group");
    }

    result.stdout_truncated = stdout_capture.truncated();
    result.stderr_truncated = stderr_capture.truncated();
    result.stdout_text = stdout_capture.take_text();
    result.stderr_text = stderr_capture.take_text();
    result.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(ended - started).count();

    if (!result.timed_out) {
        if (status.has_value() && WIFEXITED(*status)) {
            result.exit_code = WEXITSTATUS(*status);
        } else if (status.has_value() && WIFSIGNALED(*status)) {
            result.term_signal = WTERMSIG(*status);
            result.exit_code = 128 + WTERMSIG(*status);
        } else {
            result.exit_code = -1;
        }
    }

    LOG_DEBUG("ProcessExecutor: pid " + std::to_string(pid) + " finished in " +
              std::to_string(result.duration_ms) + " ms" +
              (result.timed_out ? " (timed out)" : ""));
    return result;
}

}  // namespace sandrun::execution
