#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/command_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "session/audit_log.hpp"
#include "tools/command_executor.hpp"
#include "tools/resource_reader.hpp"

namespace shellserver::runtime {

// What a tool hands back to the protocol layer: a structured payload and its
// plain-text rendering.
struct ToolOutput {
    nlohmann::json structured;
    std::string text;
};

using DispatchCompletion = std::function<void(core::errors::Result<ToolOutput>)>;

class Dispatcher {
public:
    Dispatcher(tools::CommandExecutor& executor, const tools::ResourceReader& resources,
               policy::PolicyGuard policy_guard = policy::PolicyGuard{},
               std::uint32_t default_timeout_ms = 0,
               const session::AuditLog* audit_log = nullptr);

    core::errors::Result<protocol::ToolInvocation> parse(
        const std::string& method, const nlohmann::json& args) const;

    // Routes `method` to its tool. `completion` runs exactly once: inline for
    // failures caught before a process is spawned and for resource reads, on
    // the event loop otherwise. Returns the execution id when a child process
    // was started, so the caller can cancel it.
    std::optional<tools::ExecutionId> dispatch(const std::string& method,
                                               const nlohmann::json& args,
                                               DispatchCompletion completion,
                                               const std::string& request_id = "");

    bool cancel(tools::ExecutionId execution);

    static nlohmann::json to_json(const protocol::CommandResult& result);
    static nlohmann::json to_json(const protocol::ResourceContent& content);

    // Tool definitions advertised by `tools/list`.
    static nlohmann::json tool_definitions();

private:
    struct InvocationRunner;

    std::optional<tools::ExecutionId> run_command(const protocol::RunCommandCall& call,
                                                  DispatchCompletion completion,
                                                  const std::string& request_id);
    void read_resource(const protocol::ReadResourceCall& call,
                       const DispatchCompletion& completion) const;

    tools::CommandExecutor& executor_;
    const tools::ResourceReader& resources_;
    policy::PolicyGuard policy_guard_;
    std::uint32_t default_timeout_ms_;
    const session::AuditLog* audit_log_;
};

}  // namespace shellserver::runtime
