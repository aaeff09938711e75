#include "app/server.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace shellserver::app {

using core::errors::ErrorKind;
using core::errors::ServerError;
using nlohmann::json;
using session::RequestState;

namespace {

constexpr std::size_t kReadChunkBytes = 64 * 1024;

std::string dump_json(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

void log_if_error(const core::errors::Result<RequestState>& result,
                  const std::string& context) {
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        LOG_WARN("Server: " + context + " [" + err.code + "]: " + err.message);
    }
}

}  // namespace

Server::Server(runtime::EventLoop& loop, runtime::Dispatcher& dispatcher,
               const tools::ResourceReader& resources, MessageWriter writer)
    : loop_(loop),
      dispatcher_(dispatcher),
      resources_(resources),
      writer_(std::move(writer)) {}

Server::~Server() {
    if (input_fd_ >= 0) {
        loop_.unwatch_fd(input_fd_);
    }
}

json Server::make_result(const json& id, const json& result) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

json Server::make_error(const json& id, const ServerError& error) {
    json data;
    data["kind"] = core::errors::to_string(error.kind);
    data["code"] = error.code;
    if (!error.hint.empty()) {
        data["hint"] = error.hint;
    }

    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"] = {{"code", core::errors::jsonrpc_code(error.kind)},
                         {"message", error.message},
                         {"data", data}};
    return response;
}

void Server::send(const json& message) {
    writer_(message);
}

void Server::attach_input(const int in_fd) {
    input_fd_ = in_fd;
    input_closed_ = false;
    // One read per wake-up never blocks, so the fd can stay in blocking mode
    // and the terminal or pipe it shares with the parent is left untouched.
    loop_.watch_fd(in_fd, POLLIN, [this](short) { on_input_ready(); });
}

void Server::on_input_ready() {
    char buffer[kReadChunkBytes];
    const ssize_t n = read(input_fd_, buffer, sizeof(buffer));
    if (n > 0) {
        feed(std::string(buffer, static_cast<std::size_t>(n)));
        return;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
    }
    if (n < 0) {
        LOG_ERROR(std::string("Server: input read failed: ") + std::strerror(errno));
    }
    close_input();
}

void Server::close_input() {
    if (input_fd_ >= 0) {
        loop_.unwatch_fd(input_fd_);
        input_fd_ = -1;
    }
    input_closed_ = true;

    if (!pending_input_.empty()) {
        std::string last_line;
        last_line.swap(pending_input_);
        handle_line(last_line);
    }
    LOG_INFO("Server: input closed with " + std::to_string(in_flight()) +
             " request(s) in flight");
}

void Server::feed(const std::string& bytes) {
    pending_input_ += bytes;
    std::size_t newline = pending_input_.find('\n');
    while (newline != std::string::npos) {
        const std::string line = pending_input_.substr(0, newline);
        pending_input_.erase(0, newline + 1);
        handle_line(line);
        newline = pending_input_.find('\n');
    }
}

void Server::handle_line(const std::string& line) {
    if (is_blank(line)) {
        return;
    }

    const json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        LOG_WARN("Server: dropping malformed message");
        send(make_error(nullptr, ServerError{ErrorKind::ParseError, "Parse error",
                                             "invalid_json"}));
        return;
    }
    handle_message(message);
}

void Server::handle_message(const json& message) {
    if (!message.is_object()) {
        send(make_error(nullptr, ServerError{ErrorKind::InvalidRequest,
                                             "Message must be a JSON object.",
                                             "invalid_request"}));
        return;
    }

    const auto id_it = message.find("id");
    const bool has_id = id_it != message.end();
    const json id = has_id ? *id_it : json(nullptr);
    if (has_id && !id.is_string() && !id.is_number_integer() && !id.is_null()) {
        send(make_error(nullptr, ServerError{ErrorKind::InvalidRequest,
                                             "Request id must be a string or integer.",
                                             "invalid_request_id"}));
        return;
    }

    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (has_id && (message.contains("result") || message.contains("error"))) {
            LOG_DEBUG("Server: ignoring response from client for id " + id.dump());
            return;
        }
        send(make_error(id, ServerError{ErrorKind::InvalidRequest,
                                        "Missing method.", "missing_method"}));
        return;
    }
    const std::string method = method_it->get<std::string>();

    const auto params_it = message.find("params");
    const json params =
        params_it == message.end() || params_it->is_null() ? json::object() : *params_it;

    if (method.rfind("notifications/", 0) == 0) {
        if (method == "notifications/cancelled") {
            handle_cancelled(params);
        } else if (method == "notifications/initialized") {
            LOG_DEBUG("Server: client finished initialization");
        } else {
            LOG_DEBUG("Server: ignoring notification " + method);
        }
        return;
    }

    if (!has_id) {
        LOG_WARN("Server: ignoring " + method + " sent without an id");
        return;
    }

    if (method == "initialize") {
        handle_initialize(id, params);
    } else if (method == "ping") {
        send(make_result(id, json::object()));
    } else if (method == "tools/list") {
        send(make_result(id, {{"tools", runtime::Dispatcher::tool_definitions()}}));
    } else if (method == "tools/call") {
        handle_tools_call(id, params);
    } else if (method == "resources/list") {
        handle_resources_list(id);
    } else if (method == "resources/read") {
        handle_resources_read(id, params);
    } else {
        send(make_error(id, ServerError{ErrorKind::MethodNotFound,
                                        "Method not found: " + method,
                                        "method_not_found"}));
    }
}

void Server::handle_initialize(const json& id, const json& params) {
    std::string protocol_version = kDefaultProtocolVersion;
    const auto version_it = params.find("protocolVersion");
    if (version_it != params.end() && version_it->is_string()) {
        protocol_version = version_it->get<std::string>();
    }

    json result;
    result["protocolVersion"] = protocol_version;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}},
        {"resources", {{"subscribe", false}, {"listChanged", false}}}};
    result["serverInfo"] = {{"name", kServerName}, {"version", kServerVersion}};
    result["instructions"] =
        "run_command executes shell commands on the server host without "
        "restriction. Commands run concurrently; each call returns stdout, "
        "stderr and return_code.";

    LOG_INFO("Server: initialized with protocol " + protocol_version);
    send(make_result(id, result));
}

void Server::handle_tools_call(const json& id, const json& params) {
    const auto name_it = params.find("name");
    if (!params.is_object() || name_it == params.end() || !name_it->is_string()) {
        send(make_error(id, ServerError{ErrorKind::InvalidArgument,
                                        "tools/call requires a string 'name'.",
                                        "missing_tool_name"}));
        return;
    }

    const auto args_it = params.find("arguments");
    const json arguments = args_it == params.end() ? json::object() : *args_it;

    dispatch_request(id, name_it->get<std::string>(), arguments,
                     [](const runtime::ToolOutput& output) {
                         json result;
                         result["content"] = json::array(
                             {{{"type", "text"}, {"text", output.text}}});
                         result["structuredContent"] = output.structured;
                         result["isError"] = false;
                         return result;
                     });
}

void Server::handle_resources_list(const json& id) {
    auto listed = resources_.list();
    if (core::errors::is_error(listed)) {
        send(make_error(id, core::errors::get_error(listed)));
        return;
    }

    json resources = json::array();
    for (const auto& descriptor : core::errors::get_value(listed)) {
        resources.push_back({{"uri", descriptor.uri},
                             {"name", descriptor.name},
                             {"mimeType", descriptor.mime_type}});
    }
    send(make_result(id, {{"resources", resources}}));
}

void Server::handle_resources_read(const json& id, const json& params) {
    const auto uri_it = params.find("uri");
    if (!params.is_object() || uri_it == params.end() || !uri_it->is_string()) {
        send(make_error(id, ServerError{ErrorKind::InvalidArgument,
                                        "resources/read requires a string 'uri'.",
                                        "missing_uri"}));
        return;
    }

    dispatch_request(id, protocol::kReadResourceTool, {{"uri", *uri_it}},
                     [](const runtime::ToolOutput& output) {
                         return json{{"contents", json::array({output.structured})}};
                     });
}

void Server::handle_cancelled(const json& params) {
    const auto request_it = params.find("requestId");
    if (!params.is_object() || request_it == params.end()) {
        LOG_WARN("Server: cancellation without requestId ignored");
        return;
    }

    const std::string key = request_it->dump();
    auto cancelled = tracker_.cancel(key);
    if (core::errors::is_error(cancelled)) {
        LOG_DEBUG("Server: nothing to cancel for " + key + ": " +
                  core::errors::get_error(cancelled).message);
        return;
    }

    const auto execution = core::errors::get_value(cancelled);
    LOG_INFO("Server: request " + key + " cancelled by client");
    if (execution.has_value() && !dispatcher_.cancel(execution.value())) {
        LOG_WARN("Server: execution for " + key + " was already finishing");
    }
}

void Server::dispatch_request(const json& id, const std::string& tool,
                              const json& arguments,
                              std::function<json(const runtime::ToolOutput&)> shape) {
    const std::string key = id.dump();
    auto started = tracker_.start(key, tool);
    if (core::errors::is_error(started)) {
        send(make_error(id, core::errors::get_error(started)));
        return;
    }

    auto on_complete = [this, id, key, shape = std::move(shape)](
                           core::errors::Result<runtime::ToolOutput> outcome) {
        auto state = tracker_.get_state(key);
        if (!core::errors::is_error(state) &&
            core::errors::get_value(state) == RequestState::Cancelled) {
            // A cancelled request gets no response.
            tracker_.release(key);
            return;
        }

        if (core::errors::is_error(outcome)) {
            const auto& err = core::errors::get_error(outcome);
            log_if_error(tracker_.mark_failed(key, err.message), "mark_failed " + key);
            send(make_error(id, err));
        } else {
            log_if_error(tracker_.mark_completed(key), "mark_completed " + key);
            send(make_result(id, shape(core::errors::get_value(outcome))));
        }
        tracker_.release(key);
    };

    const auto execution = dispatcher_.dispatch(tool, arguments, on_complete, key);
    if (execution.has_value()) {
        log_if_error(tracker_.attach_execution(key, execution.value()),
                     "attach_execution " + key);
    }
}

core::errors::Result<bool> write_message(const int fd, const json& message) {
    const std::string text = dump_json(message) + "\n";
    std::size_t written = 0;
    while (written < text.size()) {
        const ssize_t n = write(fd, text.data() + written, text.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            static_cast<void>(poll(&pfd, 1, 100));
            continue;
        }
        return ServerError{ErrorKind::Internal,
                           std::string("Failed to write response: ") + std::strerror(errno),
                           "output_write_failed"};
    }
    return true;
}

}  // namespace shellserver::app
