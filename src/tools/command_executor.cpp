#include "tools/command_executor.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"

namespace shellserver::tools {

using core::errors::ErrorKind;
using core::errors::ServerError;
using protocol::CommandRequest;
using protocol::CommandResult;

namespace {

constexpr std::chrono::milliseconds kReapPollInterval{5};
constexpr int kMaxReadsPerWake = 16;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Reads what is available without blocking. Returns false once the write end
// is closed (EOF) or the pipe failed. Reads are capped per wake so a chatty
// child cannot starve the rest of the loop.
bool drain_pipe(const int fd, std::string& out) {
    char buffer[4096];
    for (int reads = 0; reads < kMaxReadsPerWake; ++reads) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        return false;
    }
    return true;
}

int decode_exit_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

pid_t wait_blocking(const pid_t pid, int& status) {
    pid_t waited = -1;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    return waited;
}

std::string errno_message(const std::string& what, const int err) {
    return what + ": " + std::strerror(err);
}

}  // namespace

struct CommandExecutor::Execution {
    pid_t pid = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::uint32_t timeout_ms = 0;
    CommandCompletion completion;
    std::chrono::steady_clock::time_point started;
    std::optional<runtime::EventLoop::TimerId> deadline_timer;
    std::optional<runtime::EventLoop::TimerId> reap_timer;
    std::optional<ErrorKind> aborted;
    std::optional<ServerError> reap_error;
    int status = 0;
};

CommandExecutor::CommandExecutor(runtime::EventLoop& loop, ExecutorOptions options)
    : loop_(loop), options_(std::move(options)) {}

CommandExecutor::~CommandExecutor() {
    for (auto& entry : executions_) {
        auto& execution = *entry.second;
        if (execution.deadline_timer) {
            loop_.cancel_timer(*execution.deadline_timer);
        }
        if (execution.reap_timer) {
            loop_.cancel_timer(*execution.reap_timer);
        }
        for (int* fd : {&execution.stdout_fd, &execution.stderr_fd}) {
            if (*fd >= 0) {
                loop_.unwatch_fd(*fd);
                close_fd(*fd);
            }
        }
        if (execution.pid > 0) {
            static_cast<void>(kill(-execution.pid, SIGKILL));
            static_cast<void>(kill(execution.pid, SIGKILL));
            int status = 0;
            static_cast<void>(wait_blocking(execution.pid, status));
        }
    }
}

core::errors::Result<ExecutionId> CommandExecutor::start(const CommandRequest& request,
                                                         CommandCompletion completion) {
    if (request.command.empty()) {
        return ServerError{ErrorKind::InvalidArgument, "Command cannot be empty.",
                           "empty_command"};
    }

    // O_CLOEXEC keeps these pipes out of every other child we spawn; a leaked
    // write end would hold the sibling's stream open past its exit.
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0],
                        &stderr_pipe[1], &status_pipe[0], &status_pipe[1]}) {
            close_fd(*fd);
        }
        return ServerError{ErrorKind::SpawnFailure,
                           errno_message("Failed to create process pipes", err),
                           "pipe_creation_failed"};
    }

    int dev_null = open("/dev/null", O_RDONLY | O_CLOEXEC);

    const std::string shell = options_.shell_path.string();
    const std::string shell_name = options_.shell_path.filename().string();
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const int err = errno;
        for (int* fd : {&stdout_pipe[0], &stdout_pipe[1], &stderr_pipe[0],
                        &stderr_pipe[1], &status_pipe[0], &status_pipe[1], &dev_null}) {
            close_fd(*fd);
        }
        return ServerError{ErrorKind::SpawnFailure,
                           errno_message("Failed to fork process", err), "fork_failed"};
    }

    if (pid == 0) {
        // New session: no controlling terminal, and the child leads a process
        // group that timeouts and cancellation can kill as a whole.
        static_cast<void>(setsid());
        if (dev_null >= 0) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
        } else {
            static_cast<void>(close(STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));

        struct sigaction default_action {};
        default_action.sa_handler = SIG_DFL;
        sigemptyset(&default_action.sa_mask);
        static_cast<void>(sigaction(SIGPIPE, &default_action, nullptr));
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        static_cast<void>(sigprocmask(SIG_SETMASK, &empty_mask, nullptr));

        execl(shell.c_str(), shell_name.c_str(), "-c", request.command.c_str(),
              static_cast<char*>(nullptr));
        const int exec_errno = errno;
        static_cast<void>(write(status_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(127);
    }

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);
    close_fd(dev_null);

    // The status pipe closes on a successful exec, or carries exec's errno.
    int exec_errno = 0;
    ssize_t status_bytes = -1;
    do {
        status_bytes = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_bytes < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(wait_blocking(pid, status));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        LOG_WARN("CommandExecutor: exec of " + shell + " failed: " +
                 std::strerror(exec_errno));
        return ServerError{ErrorKind::SpawnFailure,
                           errno_message("Failed to start shell '" + shell + "'",
                                         exec_errno),
                           "spawn_failed",
                           "Check the configured shell path."};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    const ExecutionId id = next_id_++;
    auto execution = std::make_unique<Execution>();
    execution->pid = pid;
    execution->stdout_fd = stdout_pipe[0];
    execution->stderr_fd = stderr_pipe[0];
    execution->timeout_ms = request.timeout_ms;
    execution->completion = std::move(completion);
    execution->started = started;

    const int stdout_fd = execution->stdout_fd;
    const int stderr_fd = execution->stderr_fd;
    executions_.emplace(id, std::move(execution));

    loop_.watch_fd(stdout_fd, POLLIN, [this, id, stdout_fd](short) {
        on_pipe_ready(id, stdout_fd);
    });
    loop_.watch_fd(stderr_fd, POLLIN, [this, id, stderr_fd](short) {
        on_pipe_ready(id, stderr_fd);
    });

    if (request.timeout_ms > 0) {
        executions_[id]->deadline_timer =
            loop_.add_timer(std::chrono::milliseconds(request.timeout_ms), [this, id]() {
                auto it = executions_.find(id);
                if (it == executions_.end()) {
                    return;
                }
                it->second->deadline_timer.reset();
                LOG_WARN("CommandExecutor: execution " + std::to_string(id) +
                         " exceeded " + std::to_string(it->second->timeout_ms) +
                         " ms, killing pid " + std::to_string(it->second->pid));
                abort_execution(id, ErrorKind::Timeout);
            });
    }

    LOG_DEBUG("CommandExecutor: execution " + std::to_string(id) + " spawned pid " +
              std::to_string(pid));
    return id;
}

void CommandExecutor::on_pipe_ready(const ExecutionId id, const int fd) {
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return;
    }
    auto& execution = *it->second;

    const bool is_stdout = fd == execution.stdout_fd;
    int& owned_fd = is_stdout ? execution.stdout_fd : execution.stderr_fd;
    if (owned_fd < 0) {
        return;
    }
    std::string& buffer = is_stdout ? execution.stdout_text : execution.stderr_text;

    if (drain_pipe(owned_fd, buffer)) {
        return;
    }

    loop_.unwatch_fd(owned_fd);
    close_fd(owned_fd);
    if (execution.stdout_fd < 0 && execution.stderr_fd < 0) {
        try_reap(id);
    }
}

void CommandExecutor::try_reap(const ExecutionId id) {
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return;
    }
    auto& execution = *it->second;
    execution.reap_timer.reset();

    int status = 0;
    const pid_t waited = waitpid(execution.pid, &status, WNOHANG);
    if (waited == execution.pid) {
        execution.status = status;
        finish(id);
        return;
    }
    if (waited < 0 && errno != EINTR) {
        execution.reap_error = ServerError{
            ErrorKind::Internal,
            errno_message("Failed to collect child exit status", errno),
            "wait_failed"};
        finish(id);
        return;
    }

    // Streams are closed but the child is still running (or exiting).
    execution.reap_timer =
        loop_.add_timer(kReapPollInterval, [this, id]() { try_reap(id); });
}

bool CommandExecutor::cancel(const ExecutionId id) {
    auto it = executions_.find(id);
    if (it == executions_.end() || it->second->aborted.has_value()) {
        return false;
    }
    LOG_INFO("CommandExecutor: cancelling execution " + std::to_string(id) +
             " (pid " + std::to_string(it->second->pid) + ")");
    abort_execution(id, ErrorKind::Cancelled);
    return true;
}

void CommandExecutor::abort_execution(const ExecutionId id, const ErrorKind kind) {
    auto it = executions_.find(id);
    if (it == executions_.end() || it->second->aborted.has_value()) {
        return;
    }
    auto& execution = *it->second;
    execution.aborted = kind;

    static_cast<void>(kill(-execution.pid, SIGKILL));
    static_cast<void>(kill(execution.pid, SIGKILL));

    if (execution.deadline_timer) {
        loop_.cancel_timer(*execution.deadline_timer);
        execution.deadline_timer.reset();
    }
    if (execution.reap_timer) {
        loop_.cancel_timer(*execution.reap_timer);
        execution.reap_timer.reset();
    }

    // Partial output of a killed command is discarded.
    for (int* fd : {&execution.stdout_fd, &execution.stderr_fd}) {
        if (*fd >= 0) {
            loop_.unwatch_fd(*fd);
            close_fd(*fd);
        }
    }
    execution.stdout_text.clear();
    execution.stderr_text.clear();

    try_reap(id);
}

void CommandExecutor::finish(const ExecutionId id) {
    auto it = executions_.find(id);
    if (it == executions_.end()) {
        return;
    }
    std::unique_ptr<Execution> execution = std::move(it->second);
    executions_.erase(it);

    if (execution->deadline_timer) {
        loop_.cancel_timer(*execution->deadline_timer);
    }
    if (execution->reap_timer) {
        loop_.cancel_timer(*execution->reap_timer);
    }

    const auto ended = std::chrono::steady_clock::now();
    const double duration_ms =
        std::chrono::duration<double, std::milli>(ended - execution->started).count();

    CommandCompletion completion = std::move(execution->completion);
    if (!completion) {
        return;
    }

    if (execution->aborted == ErrorKind::Timeout) {
        completion(ServerError{ErrorKind::Timeout,
                               "Command timed out after " +
                                   std::to_string(execution->timeout_ms) + " ms.",
                               "command_timeout"});
        return;
    }
    if (execution->aborted == ErrorKind::Cancelled) {
        completion(ServerError{ErrorKind::Cancelled, "Command cancelled.",
                               "command_cancelled"});
        return;
    }
    if (execution->reap_error.has_value()) {
        completion(execution->reap_error.value());
        return;
    }

    CommandResult result;
    result.stdout_text = core::text::sanitize_utf8(execution->stdout_text);
    result.stderr_text = core::text::sanitize_utf8(execution->stderr_text);
    result.exit_code = decode_exit_status(execution->status);
    result.duration_ms = duration_ms;
    LOG_DEBUG("CommandExecutor: execution " + std::to_string(id) + " exited with " +
              std::to_string(result.exit_code));
    completion(std::move(result));
}

core::errors::Result<CommandResult> execute(const CommandRequest& request,
                                            const ExecutorOptions& options) {
    runtime::EventLoop loop;
    CommandExecutor executor(loop, options);

    std::optional<core::errors::Result<CommandResult>> outcome;
    auto started = executor.start(
        request, [&outcome](core::errors::Result<CommandResult> result) {
            outcome = std::move(result);
        });
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }

    loop.run_until([&outcome]() { return outcome.has_value(); });
    if (!outcome.has_value()) {
        return ServerError{ErrorKind::Internal,
                           "Event loop stopped before the command completed.",
                           "loop_stopped"};
    }
    return std::move(outcome.value());
}

}  // namespace shellserver::tools
