#pragma once

#include <filesystem>
#include <string>
#include "core/errors/server_errors.hpp"
#include "protocol/command_contract.hpp"

namespace shellserver::session {

// Append-only JSON-lines record of every command the server executes.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path log_path);

    core::errors::Result<std::filesystem::path> write_command_started(
        const std::string& request_id, const std::string& command) const;

    core::errors::Result<std::filesystem::path> write_command_finished(
        const std::string& request_id,
        const core::errors::Result<protocol::CommandResult>& outcome) const;

    const std::filesystem::path& path() const { return log_path_; }

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event_json) const;

    std::filesystem::path log_path_;
};

}  // namespace shellserver::session
