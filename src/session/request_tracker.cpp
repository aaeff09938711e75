#include "session/request_tracker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace shellserver::session {

using core::errors::ErrorKind;
using core::errors::ServerError;

bool RequestTracker::is_terminal(const RequestState state) {
    return state == RequestState::Completed || state == RequestState::Failed ||
           state == RequestState::Cancelled;
}

std::string RequestTracker::to_string(const RequestState state) {
    switch (state) {
        case RequestState::Running:
            return "running";
        case RequestState::Completed:
            return "completed";
        case RequestState::Failed:
            return "failed";
        case RequestState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<RequestState> RequestTracker::start(const std::string& request_id,
                                                         const std::string& method) {
    if (request_id.empty()) {
        return ServerError{ErrorKind::InvalidRequest, "Request ID cannot be empty.",
                           "invalid_request_id"};
    }

    auto it = requests_.find(request_id);
    if (it != requests_.end() && !is_terminal(it->second.state)) {
        return ServerError{ErrorKind::InvalidRequest,
                           "Request ID is already in flight: " + request_id,
                           "duplicate_request_id"};
    }

    RequestRecord record;
    record.request_id = request_id;
    record.method = method;
    record.state = RequestState::Running;
    requests_[request_id] = std::move(record);
    LOG_DEBUG("RequestTracker: request " + request_id + " (" + method + ") running");
    return RequestState::Running;
}

core::errors::Result<RequestState> RequestTracker::attach_execution(
    const std::string& request_id, const tools::ExecutionId execution) {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Request ID not found: " + request_id, "request_not_found"};
    }
    it->second.execution = execution;
    return it->second.state;
}

core::errors::Result<std::optional<tools::ExecutionId>> RequestTracker::cancel(
    const std::string& request_id) {
    auto it = requests_.find(request_id);
    const std::optional<tools::ExecutionId> execution =
        it == requests_.end() ? std::nullopt : it->second.execution;

    auto transitioned =
        transition_to_terminal(request_id, RequestState::Cancelled, std::nullopt);
    if (core::errors::is_error(transitioned)) {
        return core::errors::get_error(transitioned);
    }
    return execution;
}

core::errors::Result<RequestState> RequestTracker::mark_completed(
    const std::string& request_id) {
    return transition_to_terminal(request_id, RequestState::Completed, std::nullopt);
}

core::errors::Result<RequestState> RequestTracker::mark_failed(
    const std::string& request_id, const std::string& reason) {
    return transition_to_terminal(request_id, RequestState::Failed, reason);
}

core::errors::Result<RequestState> RequestTracker::transition_to_terminal(
    const std::string& request_id, const RequestState next_state,
    const std::optional<std::string>& failure_reason) {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Request ID not found: " + request_id, "request_not_found"};
    }

    if (is_terminal(it->second.state)) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Request is already terminal: " +
                               to_string(it->second.state),
                           "invalid_state_transition"};
    }

    const std::string prev = to_string(it->second.state);
    it->second.state = next_state;
    it->second.failure_reason = failure_reason;
    LOG_DEBUG("RequestTracker: request " + request_id + " transition " + prev +
              " -> " + to_string(next_state));
    return it->second.state;
}

core::errors::Result<RequestState> RequestTracker::get_state(
    const std::string& request_id) const {
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Request ID not found: " + request_id, "request_not_found"};
    }
    return it->second.state;
}

void RequestTracker::release(const std::string& request_id) {
    auto it = requests_.find(request_id);
    if (it != requests_.end() && is_terminal(it->second.state)) {
        requests_.erase(it);
    }
}

std::size_t RequestTracker::in_flight_count() const {
    std::size_t count = 0;
    for (const auto& entry : requests_) {
        if (!is_terminal(entry.second.state)) {
            ++count;
        }
    }
    return count;
}

}  // namespace shellserver::session
