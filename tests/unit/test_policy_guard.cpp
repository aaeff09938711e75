#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/server_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using shellserver::core::errors::ErrorKind;
using shellserver::core::errors::get_error;
using shellserver::core::errors::get_value;
using shellserver::core::errors::is_error;
using shellserver::policy::CommandPolicy;
using shellserver::policy::PolicyGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + shellserver::core::config::generate_session_id());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, AllowsPathInsideWorkspace) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result =
        guard.validate_path_in_workspace(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, RejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside_policy.txt";
    write_file(outside, "outside");

    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::PolicyViolation);
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PolicyGuardTest, RejectsDotDotEscape) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_workspace(workspace.root(), "sub/../../x.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(PolicyGuardTest, RejectsInvalidWorkspaceRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_workspace_root__" + shellserver::core::config::generate_session_id());
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_workspace(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(PolicyGuardTest, DefaultPolicyAllowsAnyCommand) {
    PolicyGuard guard;
    EXPECT_TRUE(guard.is_unrestricted());

    auto result = guard.validate_command("sudo rm -rf /tmp/never-run | tee log");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "sudo rm -rf /tmp/never-run | tee log");
}

TEST(PolicyGuardTest, RejectsBlockedSubstringCaseInsensitive) {
    CommandPolicy policy;
    policy.blocked_substrings = {"reboot"};
    PolicyGuard guard(policy);
    EXPECT_FALSE(guard.is_unrestricted());

    auto result = guard.validate_command("ReBoOt now");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::PolicyViolation);
    EXPECT_EQ(get_error(result).code, "blocked_command");
}

TEST(PolicyGuardTest, ValidatorHookCanReject) {
    CommandPolicy policy;
    policy.validator = [](const std::string& command) -> std::optional<std::string> {
        if (command.rfind("echo ", 0) == 0) {
            return std::nullopt;
        }
        return std::string("only echo is allowed");
    };
    PolicyGuard guard(policy);

    EXPECT_FALSE(is_error(guard.validate_command("echo hi")));

    auto rejected = guard.validate_command("ls");
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).code, "rejected_command");
    EXPECT_NE(get_error(rejected).message.find("only echo is allowed"), std::string::npos);
}

TEST(PolicyGuardTest, RejectsEmptyCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(get_error(result).code, "empty_command");
}

}  // namespace
