#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/server_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"

namespace shellserver::tools {

// Exposes the regular text files directly under the workspace root as
// read-only `file://` resources.
class ResourceReader {
public:
    explicit ResourceReader(std::filesystem::path workspace_root,
                            policy::PolicyGuard policy_guard = policy::PolicyGuard{});

    core::errors::Result<std::vector<protocol::ResourceDescriptor>> list() const;

    core::errors::Result<protocol::ResourceContent> read(const std::string& uri) const;

    const std::filesystem::path& workspace_root() const { return workspace_root_; }

private:
    std::filesystem::path workspace_root_;
    policy::PolicyGuard policy_guard_;
};

std::string to_file_uri(const std::filesystem::path& path);

}  // namespace shellserver::tools
