#include "session/audit_log.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace shellserver::session {

using core::errors::ErrorKind;
using core::errors::ServerError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

AuditLog::AuditLog(std::filesystem::path log_path)
    : log_path_(std::move(log_path)) {}

core::errors::Result<std::filesystem::path> AuditLog::append_event(
    const std::string& event_json) const {
    if (log_path_.empty()) {
        return ServerError{ErrorKind::InvalidArgument, "Audit log path is empty.",
                           "invalid_audit_log"};
    }

    std::error_code ec;
    const auto parent = log_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return ServerError{ErrorKind::Internal,
                               "Unable to create audit log directory: " +
                                   parent.string(),
                               "audit_dir_create_failed"};
        }
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out.is_open()) {
        return ServerError{ErrorKind::Internal,
                           "Unable to open audit log: " + log_path_.string(),
                           "audit_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return ServerError{ErrorKind::Internal,
                           "Unable to write audit event: " + log_path_.string(),
                           "audit_write_failed"};
    }

    return log_path_;
}

core::errors::Result<std::filesystem::path> AuditLog::write_command_started(
    const std::string& request_id, const std::string& command) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "command_started";
    event["request_id"] = request_id;
    event["command"] = command;
    return append_event(event.dump(-1, ' ', false, json::error_handler_t::replace));
}

core::errors::Result<std::filesystem::path> AuditLog::write_command_finished(
    const std::string& request_id,
    const core::errors::Result<protocol::CommandResult>& outcome) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "command_finished";
    event["request_id"] = request_id;
    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        event["error_kind"] = core::errors::to_string(err.kind);
        event["error_message"] = err.message;
    } else {
        const auto& result = core::errors::get_value(outcome);
        event["return_code"] = result.exit_code;
        event["duration_ms"] = result.duration_ms;
        event["stdout_bytes"] = result.stdout_text.size();
        event["stderr_bytes"] = result.stderr_text.size();
    }
    return append_event(event.dump(-1, ' ', false, json::error_handler_t::replace));
}

}  // namespace shellserver::session
