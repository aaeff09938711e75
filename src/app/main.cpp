#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "app/server.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/server_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/event_loop.hpp"
#include "session/audit_log.hpp"
#include "tools/command_executor.hpp"
#include "tools/resource_reader.hpp"

namespace {

int run_exec(shellserver::runtime::Dispatcher& dispatcher,
             shellserver::runtime::EventLoop& loop, const std::string& command) {
    int exit_code = 1;
    bool done = false;
    dispatcher.dispatch(
        shellserver::protocol::kRunCommandTool, {{"command", command}},
        [&exit_code, &done](shellserver::core::errors::Result<shellserver::runtime::ToolOutput> outcome) {
            done = true;
            if (shellserver::core::errors::is_error(outcome)) {
                const auto& err = shellserver::core::errors::get_error(outcome);
                LOG_ERROR("Command failed [" + err.code + "]: " + err.message);
                std::cout << shellserver::app::Server::make_error(nullptr, err)["error"].dump(
                                 2, ' ', false, nlohmann::json::error_handler_t::replace)
                          << std::endl;
                return;
            }
            std::cout << shellserver::core::errors::get_value(outcome).structured.dump(
                             2, ' ', false, nlohmann::json::error_handler_t::replace)
                      << std::endl;
            exit_code = 0;
        },
        "exec");
    loop.run_until([&done]() { return done; });
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process with one session id
    shellserver::core::logging::Logger::get().set_session_id(
        shellserver::core::config::generate_session_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = shellserver::app::cli::parse_and_validate(argc, argv);
    if (shellserver::core::errors::is_error(parsed)) {
        const auto& err = shellserver::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& cli = shellserver::core::errors::get_value(parsed);
    const auto& config = cli.config;
    shellserver::core::logging::Logger::get().set_min_level(config.log_level);

    // A client that disconnects mid-write must not kill the server.
    std::signal(SIGPIPE, SIG_IGN);

    std::error_code ec;
    std::filesystem::current_path(config.workspace_root, ec);
    if (ec) {
        LOG_ERROR("Failed to enter workspace " + config.workspace_root.string() + ": " +
                  ec.message());
        return 3;
    }

    // 3. Wire the core: loop, executor, resources, policy, dispatcher
    shellserver::runtime::EventLoop loop;
    shellserver::tools::ExecutorOptions executor_options;
    executor_options.shell_path = config.shell_path;
    shellserver::tools::CommandExecutor executor(loop, executor_options);
    shellserver::tools::ResourceReader resources(config.workspace_root);

    shellserver::policy::CommandPolicy command_policy;
    command_policy.blocked_substrings = config.blocked_substrings;
    shellserver::policy::PolicyGuard policy_guard(command_policy);

    std::unique_ptr<shellserver::session::AuditLog> audit_log;
    if (config.audit_log.has_value()) {
        audit_log = std::make_unique<shellserver::session::AuditLog>(config.audit_log.value());
        LOG_INFO("Audit log: " + audit_log->path().string());
    }

    shellserver::runtime::Dispatcher dispatcher(executor, resources, policy_guard,
                                                config.default_timeout_ms, audit_log.get());

    if (cli.mode == shellserver::app::cli::CliMode::Exec) {
        return run_exec(dispatcher, loop, cli.command.value());
    }

    // 4. Serve MCP over stdin/stdout until the client closes its end
    bool output_failed = false;
    shellserver::app::Server server(
        loop, dispatcher, resources, [&output_failed, &loop](const nlohmann::json& message) {
            if (output_failed) {
                return;
            }
            auto written = shellserver::app::write_message(STDOUT_FILENO, message);
            if (shellserver::core::errors::is_error(written)) {
                const auto& err = shellserver::core::errors::get_error(written);
                LOG_ERROR("Output error [" + err.code + "]: " + err.message);
                output_failed = true;
                loop.stop();
            }
        });

    LOG_INFO(std::string("Serving ") + shellserver::app::kServerName + " " +
             shellserver::app::kServerVersion + " in " + config.workspace_root.string() +
             (config.default_timeout_ms > 0
                  ? " (default timeout " + std::to_string(config.default_timeout_ms) + " ms)"
                  : " (no default timeout)"));
    server.attach_input(STDIN_FILENO);
    loop.run();

    if (output_failed) {
        return 4;
    }
    LOG_INFO("Server stopped");
    return 0;
}
