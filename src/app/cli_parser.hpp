#pragma once
#include <optional>
#include <string>
#include "core/config/server_config.hpp"
#include "core/errors/server_errors.hpp"

namespace shellserver::app::cli {

    enum class CliMode {
        Serve,  // MCP server on stdin/stdout
        Exec    // Run one command through the dispatcher and print the result
    };

    struct CliCommand {
        CliMode mode = CliMode::Serve;
        core::config::ServerConfig config;
        std::optional<std::string> command;  // Exec only
    };

    shellserver::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
