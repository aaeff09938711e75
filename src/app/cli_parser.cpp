#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace shellserver::app::cli {

    using namespace shellserver::core::errors;
    using shellserver::core::config::ServerConfig;
    using shellserver::core::logging::LogLevel;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> workspace;
        std::optional<std::string> shell;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> log_level;
        std::optional<std::string> audit_log;
        std::optional<std::string> command;
        std::vector<std::string> blocked;
    };

    std::string usage() {
        return "Usage: shellserver serve [--workspace DIR] [--shell PATH] [--timeout-ms N]\n"
               "                         [--log-level debug|info|warn|error]\n"
               "                         [--block SUBSTRING]... [--audit-log FILE]\n"
               "       shellserver exec --command CMD [same options]";
    }

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ServerError{ErrorKind::InvalidArgument, "No command provided.", "missing_command", usage()};
        }

        CliCommand cli;
        const std::string mode = argv[1];
        if (mode == "serve") {
            cli.mode = CliMode::Serve;
        } else if (mode == "exec") {
            cli.mode = CliMode::Exec;
        } else {
            return ServerError{ErrorKind::InvalidArgument, "Unknown command: " + mode, "unknown_command", "Supported commands are 'serve' and 'exec'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and mode
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            auto take_value = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) return false;
                slot = args[++i];
                return true;
            };

            bool ok = true;
            if (args[i] == "--workspace") {
                ok = take_value(raw.workspace);
            } else if (args[i] == "--shell") {
                ok = take_value(raw.shell);
            } else if (args[i] == "--timeout-ms") {
                ok = take_value(raw.timeout_ms);
            } else if (args[i] == "--log-level") {
                ok = take_value(raw.log_level);
            } else if (args[i] == "--audit-log") {
                ok = take_value(raw.audit_log);
            } else if (args[i] == "--command") {
                ok = take_value(raw.command);
            } else if (args[i] == "--block") {
                std::optional<std::string> blocked;
                ok = take_value(blocked);
                if (ok) raw.blocked.push_back(blocked.value());
            } else {
                return ServerError{ErrorKind::InvalidArgument, "Unknown argument: " + args[i], "unknown_argument"};
            }
            if (!ok) {
                return ServerError{ErrorKind::InvalidArgument, "Missing value for " + args[i], "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig& config = cli.config;

        if (cli.mode == CliMode::Exec) {
            if (!raw.command.has_value() || raw.command->empty()) {
                return ServerError{ErrorKind::InvalidArgument, "exec requires a non-empty --command", "missing_required_flag"};
            }
            cli.command = raw.command.value();
        } else if (raw.command.has_value()) {
            return ServerError{ErrorKind::InvalidArgument, "--command is only valid with exec", "conflicting_flags"};
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return ServerError{ErrorKind::InvalidArgument, "Invalid number for --timeout-ms", "invalid_integer", "Provide a non-negative integer; 0 disables the deadline."};
            }
            config.default_timeout_ms = timeout;
        }

        if (raw.log_level) {
            const std::string& level = raw.log_level.value();
            if (level == "debug") config.log_level = LogLevel::DEBUG;
            else if (level == "info") config.log_level = LogLevel::INFO;
            else if (level == "warn") config.log_level = LogLevel::WARN;
            else if (level == "error") config.log_level = LogLevel::ERROR;
            else return ServerError{ErrorKind::InvalidArgument, "Unknown log level: " + level, "invalid_log_level", "Use debug, info, warn or error."};
        }

        if (raw.shell) {
            if (raw.shell->empty()) {
                return ServerError{ErrorKind::InvalidArgument, "--shell cannot be empty", "invalid_shell"};
            }
            config.shell_path = raw.shell.value();
        }

        for (const auto& blocked : raw.blocked) {
            if (blocked.empty()) {
                return ServerError{ErrorKind::InvalidArgument, "--block cannot be empty", "invalid_block"};
            }
            config.blocked_substrings.push_back(blocked);
        }

        if (raw.audit_log) {
            if (raw.audit_log->empty()) {
                return ServerError{ErrorKind::InvalidArgument, "--audit-log cannot be empty", "invalid_audit_log"};
            }
            config.audit_log = std::filesystem::path(raw.audit_log.value());
        }

        // Path validation
        if (raw.workspace) {
            std::filesystem::path p(raw.workspace.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return ServerError{ErrorKind::InvalidArgument, "Workspace does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ServerError{ErrorKind::InvalidArgument, "Workspace does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ServerError{ErrorKind::InvalidArgument, "Failed to canonicalize workspace", "invalid_path"};
            }
            config.workspace_root = std::move(canonical_path);
        }

        return cli;
    }

} // namespace shellserver::app::cli
