#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/server_errors.hpp"
#include "tools/command_executor.hpp"

namespace shellserver::session {

enum class RequestState {
    Running,
    Completed,
    Failed,
    Cancelled
};

struct RequestRecord {
    std::string request_id;
    std::string method;
    RequestState state = RequestState::Running;
    std::optional<tools::ExecutionId> execution;
    std::optional<std::string> failure_reason;
};

// Tracks in-flight protocol requests by their JSON-RPC id. Only touched from
// the event loop thread.
class RequestTracker {
public:
    core::errors::Result<RequestState> start(const std::string& request_id,
                                             const std::string& method);
    core::errors::Result<RequestState> attach_execution(const std::string& request_id,
                                                        tools::ExecutionId execution);

    // Marks the request cancelled and returns the execution to kill, if any.
    core::errors::Result<std::optional<tools::ExecutionId>> cancel(
        const std::string& request_id);

    core::errors::Result<RequestState> mark_completed(const std::string& request_id);
    core::errors::Result<RequestState> mark_failed(const std::string& request_id,
                                                   const std::string& reason);

    core::errors::Result<RequestState> get_state(const std::string& request_id) const;

    // Drops a terminal record once its response has been handled.
    void release(const std::string& request_id);

    std::size_t in_flight_count() const;

    static std::string to_string(RequestState state);

private:
    core::errors::Result<RequestState> transition_to_terminal(
        const std::string& request_id, RequestState next_state,
        const std::optional<std::string>& failure_reason);
    static bool is_terminal(RequestState state);

    std::unordered_map<std::string, RequestRecord> requests_;
};

}  // namespace shellserver::session
