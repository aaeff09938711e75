#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/server_errors.hpp"

namespace shellserver::policy {

// Commands run unrestricted unless an integrator fills this in. An empty
// policy is the trust-the-caller default.
struct CommandPolicy {
    std::vector<std::string> blocked_substrings;

    // Returns a rejection reason, or nullopt to allow the command.
    std::function<std::optional<std::string>(const std::string&)> validator;
};

class PolicyGuard {
public:
    explicit PolicyGuard(CommandPolicy command_policy = {});

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

    bool is_unrestricted() const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static std::string lowercase(std::string value);

    CommandPolicy command_policy_;
};

}  // namespace shellserver::policy
