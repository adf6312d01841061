#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "core/errors/exec_errors.hpp"

namespace sandrun::workspace {

struct Workspace {
    std::filesystem::path path;
    std::chrono::system_clock::time_point created_at;
};

class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path root);

    // Creates a fresh owner-only directory under the root.
    core::errors::Result<Workspace> acquire() const;

    // Recursively removes the workspace. Safe to call on an already removed
    // workspace; failures are logged, never returned.
    void release(const Workspace& workspace) const noexcept;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Owns one acquired workspace and releases it exactly once, on whichever exit
// path comes first.
class ScopedWorkspace {
public:
    ScopedWorkspace(const WorkspaceManager& manager, Workspace workspace);
    ~ScopedWorkspace();

    ScopedWorkspace(ScopedWorkspace&& other) noexcept;
    ScopedWorkspace& operator=(ScopedWorkspace&&) = delete;
    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    const Workspace& get() const { return workspace_; }
    const std::filesystem::path& path() const { return workspace_.path; }

    void release() noexcept;
    bool released() const { return released_; }

private:
    const WorkspaceManager* manager_;
    Workspace workspace_;
    bool released_ = false;
};

}  // namespace sandrun::workspace
