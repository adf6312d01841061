#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_result.hpp"
#include "runners/runner_registry.hpp"
#include "workspace/workspace_manager.hpp"

namespace sandrun::execution {

struct ExecutorOptions {
    std::size_t output_cap_bytes = 1024 * 1024;  // per stream
    core::config::ResourceLimits limits;
    // How long to keep draining pipes once the process group has been killed.
    std::chrono::milliseconds drain_grace{250};
};

// Runs one snippet file in a child process group with a hard wall-clock
// deadline. The whole group is killed before run() returns, whether the child
// exited on its own or hit the deadline.
class ProcessExecutor {
public:
    explicit ProcessExecutor(ExecutorOptions options = {});

    // Writes `source` to `snippet_path` (which must be inside the workspace) and
    // runs it with `runner`. Non-zero exit codes and timeouts are results, not
    // errors; errors are launch failures only.
    core::errors::Result<protocol::ExecutionResult> run(
        const workspace::Workspace& workspace,
        const std::filesystem::path& snippet_path,
        const std::string& source,
        const runners::RunnerSpec& runner,
        std::chrono::milliseconds timeout) const;

private:
    ExecutorOptions options_;
};

}  // namespace sandrun::execution
