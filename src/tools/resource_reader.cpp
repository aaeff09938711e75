#include "tools/resource_reader.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/text/utf8.hpp"

namespace shellserver::tools {

using core::errors::ErrorKind;
using core::errors::ServerError;
using protocol::ResourceContent;
using protocol::ResourceDescriptor;

namespace {

constexpr const char* kFileScheme = "file://";
constexpr std::uintmax_t kMaxResourceBytes = 4 * 1024 * 1024;

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string to_file_uri(const std::filesystem::path& path) {
    return std::string(kFileScheme) + path.generic_string();
}

ResourceReader::ResourceReader(std::filesystem::path workspace_root,
                               policy::PolicyGuard policy_guard)
    : workspace_root_(std::move(workspace_root)),
      policy_guard_(std::move(policy_guard)) {}

core::errors::Result<std::vector<ResourceDescriptor>> ResourceReader::list() const {
    auto resolved = policy_guard_.validate_path_in_workspace(workspace_root_, ".");
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path root = core::errors::get_value(resolved);

    std::error_code iter_ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::directory_iterator it(root, options, iter_ec);
    if (iter_ec) {
        return ServerError{ErrorKind::Internal,
                           "Unable to list workspace: " + root.string(),
                           "resource_list_failed"};
    }

    std::vector<ResourceDescriptor> resources;
    for (const auto& entry : it) {
        std::error_code ec;
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        const auto size = entry.file_size(ec);
        if (ec || size > kMaxResourceBytes || is_probably_binary(entry.path())) {
            continue;
        }
        ResourceDescriptor descriptor;
        descriptor.uri = to_file_uri(entry.path());
        descriptor.name = entry.path().filename().string();
        resources.push_back(std::move(descriptor));
    }

    std::sort(resources.begin(), resources.end(),
              [](const ResourceDescriptor& a, const ResourceDescriptor& b) {
                  return a.name < b.name;
              });
    return resources;
}

core::errors::Result<ResourceContent> ResourceReader::read(const std::string& uri) const {
    const std::string scheme = kFileScheme;
    if (uri.rfind(scheme, 0) != 0 || uri.size() == scheme.size()) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Unsupported resource URI: " + uri, "unsupported_uri",
                           "Resources are addressed as file:///absolute/path."};
    }

    auto resolved = policy_guard_.validate_path_in_workspace(
        workspace_root_, std::filesystem::path(uri.substr(scheme.size())));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Resource does not exist: " + file_path.string(),
                           "resource_not_found"};
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Resource is not a regular file: " + file_path.string(),
                           "resource_not_file"};
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec || size > kMaxResourceBytes) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Resource is too large: " + file_path.string(),
                           "resource_too_large"};
    }
    if (is_probably_binary(file_path)) {
        return ServerError{ErrorKind::InvalidArgument,
                           "Refusing to read binary resource: " + file_path.string(),
                           "resource_binary"};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return ServerError{ErrorKind::Internal,
                           "Failed to open resource: " + file_path.string(),
                           "resource_open_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return ServerError{ErrorKind::Internal,
                           "I/O error while reading resource: " + file_path.string(),
                           "resource_read_failed"};
    }

    ResourceContent content;
    content.uri = to_file_uri(file_path);
    content.text = core::text::sanitize_utf8(buffer.str());
    return content;
}

}  // namespace shellserver::tools
