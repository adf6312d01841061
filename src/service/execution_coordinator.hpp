#pragma once

#include <cstdint>
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "execution/process_executor.hpp"
#include "policy/request_guard.hpp"
#include "protocol/execution_request.hpp"
#include "protocol/execution_result.hpp"
#include "runners/runner_registry.hpp"
#include "workspace/workspace_manager.hpp"

namespace sandrun::service {

// The entry point for callers. Holds only immutable state after construction,
// so one instance can serve concurrent execute() calls.
class ExecutionCoordinator {
public:
    explicit ExecutionCoordinator(core::config::ServiceConfig config = {});

    // resolve -> validate -> acquire -> run -> release. The workspace is
    // released on every path, after the child process group is gone.
    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::ExecutionRequest& request) const;

    const runners::RunnerRegistry& registry() const { return registry_; }

private:
    core::errors::Result<protocol::ExecutionResult> run_in_workspace(
        const protocol::ExecutionRequest& request, const runners::RunnerSpec& runner,
        std::uint32_t timeout_seconds) const;

    core::config::ServiceConfig config_;
    policy::RequestGuard guard_;
    runners::RunnerRegistry registry_;
    workspace::WorkspaceManager workspaces_;
    execution::ProcessExecutor executor_;
};

}  // namespace sandrun::service
