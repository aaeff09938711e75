#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace shellserver::core::config {

    // Validated startup options shared by the `serve` and `exec` commands
    struct ServerConfig {
        std::filesystem::path workspace_root = std::filesystem::current_path();
        std::filesystem::path shell_path = "/bin/sh";
        std::uint32_t default_timeout_ms = 0;  // 0 = unbounded
        logging::LogLevel log_level = logging::LogLevel::INFO;
        std::vector<std::string> blocked_substrings;
        std::optional<std::filesystem::path> audit_log;
    };

} // namespace shellserver::core::config
