#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/event_loop.hpp"
#include "session/request_tracker.hpp"
#include "tools/resource_reader.hpp"

namespace shellserver::app {

inline constexpr const char* kServerName = "terminal-server";
inline constexpr const char* kServerVersion = "0.1.0";
inline constexpr const char* kDefaultProtocolVersion = "2024-11-05";

using MessageWriter = std::function<void(const nlohmann::json&)>;

// MCP server speaking newline-delimited JSON-RPC 2.0. Requests are handled as
// they arrive; responses are written whenever their dispatch completes, so
// they may come back in a different order than the requests.
class Server {
public:
    Server(runtime::EventLoop& loop, runtime::Dispatcher& dispatcher,
           const tools::ResourceReader& resources, MessageWriter writer);

    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Starts reading requests from `in_fd` on the event loop. On EOF the fd is
    // released and in-flight requests are left to finish.
    void attach_input(int in_fd);

    // Feeds raw bytes as if read from the input; complete lines are handled.
    void feed(const std::string& bytes);

    void handle_line(const std::string& line);
    void handle_message(const nlohmann::json& message);

    bool input_closed() const { return input_closed_; }
    std::size_t in_flight() const { return tracker_.in_flight_count(); }

    static nlohmann::json make_result(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json make_error(const nlohmann::json& id,
                                     const core::errors::ServerError& error);

private:
    void on_input_ready();
    void close_input();

    void handle_initialize(const nlohmann::json& id, const nlohmann::json& params);
    void handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);
    void handle_resources_list(const nlohmann::json& id);
    void handle_resources_read(const nlohmann::json& id, const nlohmann::json& params);
    void handle_cancelled(const nlohmann::json& params);

    // Runs a dispatch for request `id`; `shape` turns the tool output into
    // the MCP result object.
    void dispatch_request(const nlohmann::json& id, const std::string& tool,
                          const nlohmann::json& arguments,
                          std::function<nlohmann::json(const runtime::ToolOutput&)> shape);

    void send(const nlohmann::json& message);

    runtime::EventLoop& loop_;
    runtime::Dispatcher& dispatcher_;
    const tools::ResourceReader& resources_;
    MessageWriter writer_;
    session::RequestTracker tracker_;
    std::string pending_input_;
    int input_fd_ = -1;
    bool input_closed_ = false;
};

// Writes `message` plus a newline to `fd`, retrying short writes.
core::errors::Result<bool> write_message(int fd, const nlohmann::json& message);

}  // namespace shellserver::app
