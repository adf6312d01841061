#include "workspace/workspace_manager.hpp"

#include <chrono>
#include <string>
#include <system_error>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"

namespace sandrun::workspace {

using core::errors::ErrorCategory;
using core::errors::ExecError;

WorkspaceManager::WorkspaceManager(std::filesystem::path root)
    : root_(std::move(root)) {}

core::errors::Result<Workspace> WorkspaceManager::acquire() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return ExecError{ErrorCategory::Resource,
                         "Unable to create workspace root " + root_.string() + ": " +
                             ec.message(),
                         "workspace_root_unavailable"};
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const auto candidate = root_ / ("ws-" + core::config::random_hex());

        // create_directory reports false without an error when the name is taken.
        const bool created = std::filesystem::create_directory(candidate, ec);
        if (ec) {
            return ExecError{ErrorCategory::Resource,
                             "Unable to create workspace " + candidate.string() + ": " +
                                 ec.message(),
                             "workspace_create_failed"};
        }
        if (!created) {
            continue;
        }

        std::filesystem::permissions(candidate, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            LOG_WARN("WorkspaceManager: unable to restrict permissions on " +
                     candidate.string() + ": " + ec.message());
        }

        LOG_DEBUG("WorkspaceManager: acquired " + candidate.string());
        return Workspace{candidate, std::chrono::system_clock::now()};
    }

    return ExecError{ErrorCategory::Resource,
                     "Unable to allocate a unique workspace under " + root_.string(),
                     "workspace_name_exhausted"};
}

void WorkspaceManager::release(const Workspace& workspace) const noexcept {
    if (workspace.path.empty()) {
        return;
    }

    std::error_code ec;
    const auto removed = std::filesystem::remove_all(workspace.path, ec);
    if (ec) {
        LOG_WARN("WorkspaceManager: failed to remove " + workspace.path.string() +
                 ": " + ec.message());
        return;
    }
    if (removed == 0) {
        LOG_DEBUG("WorkspaceManager: " + workspace.path.string() + " already released");
        return;
    }
    const auto lifetime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - workspace.created_at);
    LOG_DEBUG("WorkspaceManager: released " + workspace.path.string() + " after " +
              std::to_string(lifetime.count()) + " ms");
}

ScopedWorkspace::ScopedWorkspace(const WorkspaceManager& manager, Workspace workspace)
    : manager_(&manager), workspace_(std::move(workspace)) {}

ScopedWorkspace::~ScopedWorkspace() {
    release();
}

ScopedWorkspace::ScopedWorkspace(ScopedWorkspace&& other) noexcept
    : manager_(other.manager_),
      workspace_(std::move(other.workspace_)),
      released_(other.released_) {
    other.released_ = true;
}

void ScopedWorkspace::release() noexcept {
    if (released_) {
        return;
    }
    released_ = true;
    manager_->release(workspace_);
}

}  // namespace sandrun::workspace
