#pragma once
#include <string>
#include <variant>

namespace shellserver::core::errors {

    // 1. Typed error kinds, each one surfaced to the remote caller as-is
    enum class ErrorKind {
        InvalidArgument,   // Missing or mistyped tool argument
        MethodNotFound,    // Unregistered tool or protocol method
        SpawnFailure,      // Child process could not be created
        Timeout,           // Command exceeded its deadline and was killed
        Cancelled,         // Caller cancelled an in-flight command
        PolicyViolation,   // Command or path rejected by the policy hook
        ParseError,        // Incoming message is not valid JSON
        InvalidRequest,    // Valid JSON, but not a JSON-RPC request
        Internal           // Bug or unexpected OS failure
    };

    // The standardized error payload
    struct ServerError {
        ErrorKind kind;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a ServerError.
    template <typename T>
    using Result = std::variant<T, ServerError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ServerError>(result);
    }

    template <typename T>
    const ServerError& get_error(const Result<T>& result) {
        return std::get<ServerError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::InvalidArgument: return "InvalidArgument";
            case ErrorKind::MethodNotFound:  return "MethodNotFound";
            case ErrorKind::SpawnFailure:    return "SpawnFailure";
            case ErrorKind::Timeout:         return "Timeout";
            case ErrorKind::Cancelled:       return "Cancelled";
            case ErrorKind::PolicyViolation: return "PolicyViolation";
            case ErrorKind::ParseError:      return "ParseError";
            case ErrorKind::InvalidRequest:  return "InvalidRequest";
            case ErrorKind::Internal:        return "Internal";
            default: return "Internal";
        }
    }

    // 3. JSON-RPC 2.0 error codes. Server-defined kinds live in the -32000 range.
    inline int jsonrpc_code(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::ParseError:      return -32700;
            case ErrorKind::InvalidRequest:  return -32600;
            case ErrorKind::MethodNotFound:  return -32601;
            case ErrorKind::InvalidArgument: return -32602;
            case ErrorKind::Internal:        return -32603;
            case ErrorKind::SpawnFailure:    return -32001;
            case ErrorKind::Timeout:         return -32002;
            case ErrorKind::Cancelled:       return -32003;
            case ErrorKind::PolicyViolation: return -32004;
            default: return -32603;
        }
    }

} // namespace shellserver::core::errors
