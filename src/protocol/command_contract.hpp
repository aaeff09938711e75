#pragma once

#include <cstdint>
#include <string>

namespace shellserver::protocol {

// A shell command, handed verbatim to `<shell> -c`.
struct CommandRequest {
    std::string command;
    std::uint32_t timeout_ms = 0;  // 0 = no deadline
};

// Outcome of a command that was spawned and exited, whatever its exit code.
struct CommandResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
    double duration_ms = 0.0;
};

}  // namespace shellserver::protocol
