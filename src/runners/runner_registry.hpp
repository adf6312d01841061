#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_request.hpp"

namespace sandrun::runners {

struct RunnerSpec {
    protocol::Language language;
    std::string interpreter_command;
    std::string file_extension;
    std::vector<std::string> args_template;
};

// Fixed language -> runner table. Built once from the service configuration and
// never modified afterwards, so concurrent resolve() calls need no locking.
class RunnerRegistry {
public:
    explicit RunnerRegistry(const core::config::ServiceConfig& config = {});

    core::errors::Result<RunnerSpec> resolve(protocol::Language language) const;
    core::errors::Result<RunnerSpec> resolve(const std::string& identifier) const;

    const std::vector<RunnerSpec>& languages() const { return runners_; }

private:
    std::vector<RunnerSpec> runners_;
};

// Expands the args template: interpreter first, then every token with "{file}"
// replaced by the snippet path.
std::vector<std::string> build_argv(const RunnerSpec& spec,
                                    const std::string& interpreter_path,
                                    const std::filesystem::path& snippet_path);

}  // namespace sandrun::runners
