#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_request.hpp"

namespace sandrun::policy {

struct RequestPolicy {
    std::uint32_t default_timeout_seconds = 10;
    std::uint32_t max_timeout_seconds = 60;
    std::size_t max_source_bytes = 256 * 1024;
};

class RequestGuard {
public:
    explicit RequestGuard(RequestPolicy request_policy = {});

    // Returns the effective timeout in seconds.
    core::errors::Result<std::uint32_t> validate_request(
        const protocol::ExecutionRequest& request) const;

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    RequestPolicy request_policy_;
};

}  // namespace sandrun::policy
