#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <unordered_map>
#include "core/errors/server_errors.hpp"
#include "protocol/command_contract.hpp"
#include "runtime/event_loop.hpp"

namespace shellserver::tools {

struct ExecutorOptions {
    std::filesystem::path shell_path = "/bin/sh";
};

using ExecutionId = std::uint64_t;
using CommandCompletion =
    std::function<void(core::errors::Result<protocol::CommandResult>)>;

// Runs shell commands as child processes on a shared event loop. Nothing here
// restricts what a command may do; callers that need a policy apply one before
// start().
class CommandExecutor {
public:
    explicit CommandExecutor(runtime::EventLoop& loop, ExecutorOptions options = {});
    ~CommandExecutor();

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    // Spawns the command and returns immediately. `completion` runs later on the
    // loop with the result, or with a Timeout/Cancelled error. Spawn failures
    // are returned here and `completion` is never called for them.
    core::errors::Result<ExecutionId> start(const protocol::CommandRequest& request,
                                            CommandCompletion completion);

    // Kills the execution's process group and completes it with Cancelled.
    // Returns false if `id` is unknown or already finishing.
    bool cancel(ExecutionId id);

    std::size_t in_flight() const { return executions_.size(); }

private:
    struct Execution;

    void on_pipe_ready(ExecutionId id, int fd);
    void try_reap(ExecutionId id);
    void abort_execution(ExecutionId id, core::errors::ErrorKind kind);
    void finish(ExecutionId id);

    runtime::EventLoop& loop_;
    ExecutorOptions options_;
    std::unordered_map<ExecutionId, std::unique_ptr<Execution>> executions_;
    ExecutionId next_id_ = 1;
};

// Runs one command to completion on a private event loop.
core::errors::Result<protocol::CommandResult> execute(
    const protocol::CommandRequest& request, const ExecutorOptions& options = {});

}  // namespace shellserver::tools
