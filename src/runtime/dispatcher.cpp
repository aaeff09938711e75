#include "runtime/dispatcher.hpp"

#include <cstdint>
#include <limits>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace shellserver::runtime {

using core::errors::ErrorKind;
using core::errors::ServerError;
using nlohmann::json;
using protocol::ReadResourceCall;
using protocol::RunCommandCall;
using protocol::ToolInvocation;

namespace {

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

std::string dump_json(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<std::string> require_string(const json& args, const char* key) {
    const auto it = args.find(key);
    if (it == args.end()) {
        return ServerError{ErrorKind::InvalidArgument,
                           std::string("Missing required argument '") + key + "'.",
                           std::string("missing_") + key};
    }
    if (!it->is_string()) {
        return ServerError{ErrorKind::InvalidArgument,
                           std::string("Argument '") + key + "' must be a string.",
                           std::string("invalid_") + key + "_type"};
    }
    return it->get<std::string>();
}

core::errors::Result<RunCommandCall> parse_run_command(const json& args,
                                                       const std::uint32_t default_timeout_ms) {
    auto command = require_string(args, "command");
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }

    RunCommandCall call;
    call.command = core::errors::get_value(command);
    call.timeout_ms = default_timeout_ms;
    if (call.command.empty()) {
        return ServerError{ErrorKind::InvalidArgument, "Command cannot be empty.",
                           "empty_command"};
    }

    const auto timeout = args.find("timeout_ms");
    if (timeout != args.end() && !timeout->is_null()) {
        if (!timeout->is_number_integer() || timeout->get<std::int64_t>() < 0 ||
            timeout->get<std::int64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            return ServerError{ErrorKind::InvalidArgument,
                               "Argument 'timeout_ms' must be a non-negative integer.",
                               "invalid_timeout_ms",
                               "Use 0 for no deadline."};
        }
        call.timeout_ms = static_cast<std::uint32_t>(timeout->get<std::int64_t>());
    }
    return call;
}

}  // namespace

struct Dispatcher::InvocationRunner {
    Dispatcher& dispatcher;
    DispatchCompletion& completion;
    const std::string& request_id;

    std::optional<tools::ExecutionId> operator()(const RunCommandCall& call) const {
        return dispatcher.run_command(call, std::move(completion), request_id);
    }

    std::optional<tools::ExecutionId> operator()(const ReadResourceCall& call) const {
        dispatcher.read_resource(call, completion);
        return std::nullopt;
    }
};

Dispatcher::Dispatcher(tools::CommandExecutor& executor,
                       const tools::ResourceReader& resources,
                       policy::PolicyGuard policy_guard,
                       const std::uint32_t default_timeout_ms,
                       const session::AuditLog* audit_log)
    : executor_(executor),
      resources_(resources),
      policy_guard_(std::move(policy_guard)),
      default_timeout_ms_(default_timeout_ms),
      audit_log_(audit_log) {
    if (policy_guard_.is_unrestricted()) {
        LOG_WARN("Dispatcher: no command policy configured; run_command executes "
                 "any shell command the client sends");
    }
}

core::errors::Result<ToolInvocation> Dispatcher::parse(const std::string& method,
                                                       const json& args) const {
    if (method != protocol::kRunCommandTool && method != protocol::kReadResourceTool) {
        return ServerError{ErrorKind::MethodNotFound, "Unknown tool: " + method,
                           "method_not_found"};
    }

    const json empty = json::object();
    const json& arguments = args.is_null() ? empty : args;
    if (!arguments.is_object()) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Tool arguments must be a JSON object.",
                           "invalid_arguments"};
    }

    if (method == protocol::kRunCommandTool) {
        auto call = parse_run_command(arguments, default_timeout_ms_);
        if (core::errors::is_error(call)) {
            return core::errors::get_error(call);
        }
        return ToolInvocation{core::errors::get_value(call)};
    }

    auto uri = require_string(arguments, "uri");
    if (core::errors::is_error(uri)) {
        return core::errors::get_error(uri);
    }
    return ToolInvocation{ReadResourceCall{core::errors::get_value(uri)}};
}

std::optional<tools::ExecutionId> Dispatcher::dispatch(const std::string& method,
                                                       const json& args,
                                                       DispatchCompletion completion,
                                                       const std::string& request_id) {
    auto invocation = parse(method, args);
    if (core::errors::is_error(invocation)) {
        const auto& err = core::errors::get_error(invocation);
        LOG_WARN("Dispatcher: rejected " + method + " [" + err.code + "]: " + err.message);
        completion(err);
        return std::nullopt;
    }

    return std::visit(InvocationRunner{*this, completion, request_id},
                      core::errors::get_value(invocation));
}

std::optional<tools::ExecutionId> Dispatcher::run_command(const RunCommandCall& call,
                                                          DispatchCompletion completion,
                                                          const std::string& request_id) {
    auto validated = policy_guard_.validate_command(call.command);
    if (core::errors::is_error(validated)) {
        const auto& err = core::errors::get_error(validated);
        LOG_WARN("Dispatcher: command rejected [" + err.code + "]: " + err.message);
        completion(err);
        return std::nullopt;
    }

    LOG_INFO("Dispatcher: run_command " +
             (request_id.empty() ? std::string() : "[" + request_id + "] ") +
             trim_line(call.command));
    if (audit_log_ != nullptr) {
        auto written = audit_log_->write_command_started(request_id, call.command);
        if (core::errors::is_error(written)) {
            LOG_WARN("Dispatcher: audit log write failed: " +
                     core::errors::get_error(written).message);
        }
    }

    protocol::CommandRequest request;
    request.command = core::errors::get_value(validated);
    request.timeout_ms = call.timeout_ms;

    const session::AuditLog* audit_log = audit_log_;
    auto on_done = [audit_log, request_id, completion](
                       core::errors::Result<protocol::CommandResult> outcome) {
        if (audit_log != nullptr) {
            auto written = audit_log->write_command_finished(request_id, outcome);
            if (core::errors::is_error(written)) {
                LOG_WARN("Dispatcher: audit log write failed: " +
                         core::errors::get_error(written).message);
            }
        }
        if (core::errors::is_error(outcome)) {
            completion(core::errors::get_error(outcome));
            return;
        }
        const json structured = Dispatcher::to_json(core::errors::get_value(outcome));
        completion(ToolOutput{structured, dump_json(structured)});
    };

    auto started = executor_.start(request, on_done);
    if (core::errors::is_error(started)) {
        const auto& err = core::errors::get_error(started);
        LOG_ERROR("Dispatcher: spawn failed [" + err.code + "]: " + err.message);
        on_done(err);
        return std::nullopt;
    }
    return core::errors::get_value(started);
}

void Dispatcher::read_resource(const ReadResourceCall& call,
                               const DispatchCompletion& completion) const {
    auto content = resources_.read(call.uri);
    if (core::errors::is_error(content)) {
        completion(core::errors::get_error(content));
        return;
    }
    const auto& resource = core::errors::get_value(content);
    completion(ToolOutput{to_json(resource), resource.text});
}

bool Dispatcher::cancel(const tools::ExecutionId execution) {
    return executor_.cancel(execution);
}

json Dispatcher::to_json(const protocol::CommandResult& result) {
    json payload;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["return_code"] = result.exit_code;
    return payload;
}

json Dispatcher::to_json(const protocol::ResourceContent& content) {
    json payload;
    payload["uri"] = content.uri;
    payload["mimeType"] = content.mime_type;
    payload["text"] = content.text;
    return payload;
}

json Dispatcher::tool_definitions() {
    json run_command;
    run_command["name"] = protocol::kRunCommandTool;
    run_command["description"] =
        "Run a terminal command and return the output. The command is passed "
        "verbatim to a shell on the server host with the server's privileges. "
        "Returns stdout, stderr and the return code; a non-zero return code is "
        "not an error.";
    run_command["inputSchema"] = json::parse(R"json({
        "type": "object",
        "properties": {
            "command": {"type": "string", "description": "The command to execute in the terminal."},
            "timeout_ms": {"type": "integer", "minimum": 0, "description": "Optional deadline in milliseconds; 0 disables it."}
        },
        "required": ["command"]
    })json");

    json read_resource;
    read_resource["name"] = protocol::kReadResourceTool;
    read_resource["description"] =
        "Read a text file from the server workspace, addressed by its file:// URI.";
    read_resource["inputSchema"] = json::parse(R"json({
        "type": "object",
        "properties": {
            "uri": {"type": "string", "description": "file:// URI as listed by resources/list."}
        },
        "required": ["uri"]
    })json");

    return json::array({run_command, read_resource});
}

}  // namespace shellserver::runtime
