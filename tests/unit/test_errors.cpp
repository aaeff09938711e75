#include <gtest/gtest.h>
#include "core/errors/server_errors.hpp"

using namespace shellserver::core::errors;

// Simulates a tool that either answers or fails to spawn
Result<std::string> simulate_spawn(bool should_fail) {
    if (should_fail) {
        return ServerError{ErrorKind::SpawnFailure, "No such file or directory"};
    }
    return std::string("spawned");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_spawn(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "spawned");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_spawn(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.kind, ErrorKind::SpawnFailure);
    EXPECT_EQ(error.message, "No such file or directory");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, MapsKindsToJsonRpcCodes) {
    EXPECT_EQ(jsonrpc_code(ErrorKind::ParseError), -32700);
    EXPECT_EQ(jsonrpc_code(ErrorKind::InvalidRequest), -32600);
    EXPECT_EQ(jsonrpc_code(ErrorKind::MethodNotFound), -32601);
    EXPECT_EQ(jsonrpc_code(ErrorKind::InvalidArgument), -32602);
    EXPECT_EQ(jsonrpc_code(ErrorKind::Internal), -32603);
    EXPECT_EQ(jsonrpc_code(ErrorKind::SpawnFailure), -32001);
    EXPECT_EQ(jsonrpc_code(ErrorKind::Timeout), -32002);
}

TEST(ErrorModelTest, NamesKinds) {
    EXPECT_EQ(to_string(ErrorKind::SpawnFailure), "SpawnFailure");
    EXPECT_EQ(to_string(ErrorKind::MethodNotFound), "MethodNotFound");
    EXPECT_EQ(to_string(ErrorKind::InvalidArgument), "InvalidArgument");
    EXPECT_EQ(to_string(ErrorKind::Timeout), "Timeout");
}
