#pragma once
#include <cstdint>
#include <string>
#include <variant>

namespace shellserver::protocol {

    inline constexpr const char* kRunCommandTool = "run_command";
    inline constexpr const char* kReadResourceTool = "read_resource";

    // The closed set of tools the dispatcher knows how to run.
    struct RunCommandCall {
        std::string command;
        std::uint32_t timeout_ms = 0;
    };

    struct ReadResourceCall {
        std::string uri;
    };

    using ToolInvocation = std::variant<
        RunCommandCall,
        ReadResourceCall
    >;

    // A read-only file exposed to the client
    struct ResourceDescriptor {
        std::string uri;
        std::string name;
        std::string mime_type = "text/plain";
    };

    struct ResourceContent {
        std::string uri;
        std::string mime_type = "text/plain";
        std::string text;
    };

} // namespace shellserver::protocol
