#include "policy/request_guard.hpp"

#include <system_error>
#include <utility>

namespace sandrun::policy {

using core::errors::ErrorCategory;
using core::errors::ExecError;

RequestGuard::RequestGuard(RequestPolicy request_policy)
    : request_policy_(std::move(request_policy)) {}

bool RequestGuard::is_within_root(const std::filesystem::path& root,
                                  const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() && child_it != child.end();
}

core::errors::Result<std::uint32_t> RequestGuard::validate_request(
    const protocol::ExecutionRequest& request) const {
    std::uint32_t timeout = request_policy_.default_timeout_seconds;
    if (request.timeout_seconds.has_value()) {
        timeout = request.timeout_seconds.value();
        if (timeout == 0 || timeout > request_policy_.max_timeout_seconds) {
            return ExecError{ErrorCategory::Input,
                             "timeout_seconds out of bounds: " + std::to_string(timeout),
                             "invalid_timeout",
                             "Must be between 1 and " +
                                 std::to_string(request_policy_.max_timeout_seconds) + "."};
        }
    }

    if (request.source.size() > request_policy_.max_source_bytes) {
        return ExecError{ErrorCategory::Input,
                         "Snippet is " + std::to_string(request.source.size()) +
                             " bytes, limit is " +
                             std::to_string(request_policy_.max_source_bytes),
                         "source_too_large"};
    }

    return timeout;
}

core::errors::Result<std::filesystem::path> RequestGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return ExecError{ErrorCategory::Resource,
                         "Workspace is not a directory: " + workspace_root.string(),
                         "invalid_workspace"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return ExecError{ErrorCategory::Resource,
                         "Unable to resolve workspace: " + workspace_root.string(),
                         "invalid_workspace"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return ExecError{ErrorCategory::Input,
                         "Unable to resolve snippet path: " + target_path.string(),
                         "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return ExecError{ErrorCategory::Policy,
                         "Snippet path escapes workspace: " +
                             canonical_candidate.string(),
                         "path_outside_workspace"};
    }

    return canonical_candidate;
}

}  // namespace sandrun::policy
