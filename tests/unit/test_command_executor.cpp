#include <chrono>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/server_errors.hpp"
#include "protocol/command_contract.hpp"
#include "runtime/event_loop.hpp"
#include "tools/command_executor.hpp"

namespace {

using shellserver::core::errors::ErrorKind;
using shellserver::core::errors::get_error;
using shellserver::core::errors::get_value;
using shellserver::core::errors::is_error;
using shellserver::core::errors::Result;
using shellserver::protocol::CommandRequest;
using shellserver::protocol::CommandResult;
using shellserver::runtime::EventLoop;
using shellserver::tools::CommandExecutor;
using shellserver::tools::ExecutionId;
using shellserver::tools::ExecutorOptions;
using shellserver::tools::execute;

using Clock = std::chrono::steady_clock;

CommandRequest make_request(const std::string& command, std::uint32_t timeout_ms = 0) {
    CommandRequest request;
    request.command = command;
    request.timeout_ms = timeout_ms;
    return request;
}

TEST(CommandExecutorTest, CapturesStdoutAndStderrSeparately) {
    auto result = execute(make_request("echo hello; echo oops >&2"));
    ASSERT_FALSE(is_error(result));

    const auto& value = get_value(result);
    EXPECT_EQ(value.stdout_text, "hello\n");
    EXPECT_EQ(value.stderr_text, "oops\n");
    EXPECT_EQ(value.exit_code, 0);
    EXPECT_GE(value.duration_ms, 0.0);
}

TEST(CommandExecutorTest, NonZeroExitIsStillAResult) {
    auto result = execute(make_request("echo partial; exit 3"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 3);
    EXPECT_EQ(get_value(result).stdout_text, "partial\n");
}

TEST(CommandExecutorTest, UnknownProgramReportsShellExitCode) {
    auto result = execute(make_request("definitely_not_a_command_4242"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
    EXPECT_FALSE(get_value(result).stderr_text.empty());
}

TEST(CommandExecutorTest, SignalledChildMapsTo128PlusSignal) {
    auto result = execute(make_request("kill -9 $$"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 128 + 9);
}

TEST(CommandExecutorTest, LargeOutputOnBothStreamsDoesNotDeadlock) {
    const std::string command =
        "head -c 200000 /dev/zero | tr '\\0' a; "
        "head -c 150000 /dev/zero | tr '\\0' b >&2";
    auto result = execute(make_request(command, 20000));
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& value = get_value(result);
    EXPECT_EQ(value.exit_code, 0);
    EXPECT_EQ(value.stdout_text, std::string(200000, 'a'));
    EXPECT_EQ(value.stderr_text, std::string(150000, 'b'));
}

TEST(CommandExecutorTest, MissingShellIsSpawnFailure) {
    ExecutorOptions options;
    options.shell_path = "/nonexistent/sh";

    auto result = execute(make_request("echo hi"), options);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::SpawnFailure);
    EXPECT_EQ(get_error(result).code, "spawn_failed");
}

TEST(CommandExecutorTest, EmptyCommandIsRejected) {
    auto result = execute(make_request(""));
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidArgument);
}

TEST(CommandExecutorTest, TimeoutKillsCommand) {
    const auto started = Clock::now();
    auto result = execute(make_request("echo early; sleep 10", 200));
    const auto elapsed = Clock::now() - started;

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Timeout);
    EXPECT_EQ(get_error(result).code, "command_timeout");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(CommandExecutorTest, TimeoutAlsoKillsBackgroundChildren) {
    const auto started = Clock::now();
    auto result = execute(make_request("sleep 10 & sleep 10", 200));
    const auto elapsed = Clock::now() - started;

    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(CommandExecutorTest, CancelCompletesWithCancelled) {
    EventLoop loop;
    CommandExecutor executor(loop);

    std::optional<Result<CommandResult>> outcome;
    auto started = executor.start(make_request("sleep 10"),
                                  [&outcome](Result<CommandResult> result) {
                                      outcome = std::move(result);
                                  });
    ASSERT_FALSE(is_error(started));
    const ExecutionId id = get_value(started);
    EXPECT_EQ(executor.in_flight(), 1u);

    loop.add_timer(std::chrono::milliseconds(50), [&executor, id]() {
        EXPECT_TRUE(executor.cancel(id));
    });
    loop.run_until([&outcome]() { return outcome.has_value(); });

    ASSERT_TRUE(outcome.has_value());
    ASSERT_TRUE(is_error(*outcome));
    EXPECT_EQ(get_error(*outcome).kind, ErrorKind::Cancelled);
    EXPECT_EQ(executor.in_flight(), 0u);
    EXPECT_FALSE(executor.cancel(id));
}

TEST(CommandExecutorTest, CancelUnknownIdReturnsFalse) {
    EventLoop loop;
    CommandExecutor executor(loop);
    EXPECT_FALSE(executor.cancel(99));
}

TEST(CommandExecutorTest, RepeatedRunsAreIndependent) {
    const auto request = make_request("echo again; echo err >&2; exit 1");
    auto first = execute(request);
    auto second = execute(request);
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));

    for (const auto* result : {&first, &second}) {
        const auto& value = get_value(*result);
        EXPECT_EQ(value.stdout_text, "again\n");
        EXPECT_EQ(value.stderr_text, "err\n");
        EXPECT_EQ(value.exit_code, 1);
    }
}

TEST(CommandExecutorTest, InvalidUtf8OutputIsReplaced) {
    auto result = execute(make_request("printf 'a\\377b'"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "a\xEF\xBF\xBD" "b");
}

TEST(CommandExecutorTest, ShortCommandFinishesBeforeSlowOneOnSharedLoop) {
    EventLoop loop;
    CommandExecutor executor(loop);

    std::optional<Clock::time_point> slow_done;
    std::optional<Clock::time_point> fast_done;
    std::optional<Result<CommandResult>> slow_result;
    std::optional<Result<CommandResult>> fast_result;

    const auto started_at = Clock::now();
    auto slow = executor.start(make_request("sleep 1; echo slow"),
                               [&](Result<CommandResult> result) {
                                   slow_done = Clock::now();
                                   slow_result = std::move(result);
                               });
    auto fast = executor.start(make_request("echo fast"),
                               [&](Result<CommandResult> result) {
                                   fast_done = Clock::now();
                                   fast_result = std::move(result);
                               });
    ASSERT_FALSE(is_error(slow));
    ASSERT_FALSE(is_error(fast));
    EXPECT_EQ(executor.in_flight(), 2u);

    loop.run();

    ASSERT_TRUE(slow_done.has_value());
    ASSERT_TRUE(fast_done.has_value());
    EXPECT_LT(*fast_done, *slow_done);
    EXPECT_LT(*fast_done - started_at, std::chrono::milliseconds(900));

    ASSERT_FALSE(is_error(*fast_result));
    ASSERT_FALSE(is_error(*slow_result));
    EXPECT_EQ(get_value(*fast_result).stdout_text, "fast\n");
    EXPECT_EQ(get_value(*slow_result).stdout_text, "slow\n");
}

TEST(CommandExecutorTest, DestructorKillsOutstandingChildren) {
    EventLoop loop;
    bool completed = false;
    {
        CommandExecutor executor(loop);
        auto started = executor.start(make_request("sleep 10"),
                                      [&completed](Result<CommandResult>) {
                                          completed = true;
                                      });
        ASSERT_FALSE(is_error(started));
    }
    EXPECT_FALSE(completed);
    EXPECT_FALSE(loop.has_pending_work());
}

}  // namespace
