#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/server_errors.hpp"
#include "protocol/command_contract.hpp"
#include "session/audit_log.hpp"

namespace {

using shellserver::core::errors::ErrorKind;
using shellserver::core::errors::get_error;
using shellserver::core::errors::get_value;
using shellserver::core::errors::is_error;
using shellserver::core::errors::Result;
using shellserver::core::errors::ServerError;
using shellserver::protocol::CommandResult;
using shellserver::session::AuditLog;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_audit_log_" + shellserver::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

std::vector<std::string> read_lines(const std::filesystem::path& file_path) {
    std::vector<std::string> lines;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

TEST(AuditLogTest, WritesStartedAndFinishedEvents) {
    TempWorkspace workspace;
    AuditLog audit(workspace.root() / "logs" / "audit.jsonl");

    const auto started = audit.write_command_started("7", "echo hi");
    ASSERT_FALSE(is_error(started));
    EXPECT_TRUE(std::filesystem::exists(get_value(started)));

    CommandResult result;
    result.stdout_text = "hi\n";
    result.exit_code = 0;
    result.duration_ms = 3.5;
    const auto finished =
        audit.write_command_finished("7", Result<CommandResult>(result));
    ASSERT_FALSE(is_error(finished));

    const auto lines = read_lines(audit.path());
    ASSERT_EQ(lines.size(), 2u);

    const auto first = json::parse(lines[0]);
    EXPECT_EQ(first["event"], "command_started");
    EXPECT_EQ(first["request_id"], "7");
    EXPECT_EQ(first["command"], "echo hi");
    EXPECT_TRUE(first.contains("ts_unix_ms"));

    const auto second = json::parse(lines[1]);
    EXPECT_EQ(second["event"], "command_finished");
    EXPECT_EQ(second["return_code"], 0);
    EXPECT_EQ(second["stdout_bytes"], 3);
    EXPECT_EQ(second["stderr_bytes"], 0);
}

TEST(AuditLogTest, RecordsErrorOutcome) {
    TempWorkspace workspace;
    AuditLog audit(workspace.root() / "audit.jsonl");

    const auto finished = audit.write_command_finished(
        "req-2", Result<CommandResult>(ServerError{ErrorKind::Timeout,
                                                   "Command timed out after 10 ms.",
                                                   "command_timeout"}));
    ASSERT_FALSE(is_error(finished));

    const auto lines = read_lines(audit.path());
    ASSERT_EQ(lines.size(), 1u);
    const auto event = json::parse(lines[0]);
    EXPECT_EQ(event["error_kind"], "Timeout");
    EXPECT_EQ(event["error_message"], "Command timed out after 10 ms.");
    EXPECT_FALSE(event.contains("return_code"));
}

TEST(AuditLogTest, AppendsAcrossInstances) {
    TempWorkspace workspace;
    const auto log_path = workspace.root() / "audit.jsonl";
    ASSERT_FALSE(is_error(AuditLog(log_path).write_command_started("1", "true")));
    ASSERT_FALSE(is_error(AuditLog(log_path).write_command_started("2", "false")));
    EXPECT_EQ(read_lines(log_path).size(), 2u);
}

TEST(AuditLogTest, RejectsEmptyPath) {
    AuditLog audit{std::filesystem::path{}};
    const auto result = audit.write_command_started("1", "true");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_audit_log");
}

}  // namespace
