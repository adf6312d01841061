#include "service/execution_coordinator.hpp"

#include <chrono>
#include <exception>
#include <utility>
#include "core/config/request_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/result_json.hpp"

namespace sandrun::service {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using protocol::ExecutionRequest;
using protocol::ExecutionResult;

namespace {

policy::RequestPolicy make_policy(const core::config::ServiceConfig& config) {
    policy::RequestPolicy request_policy;
    request_policy.default_timeout_seconds = config.default_timeout_seconds;
    request_policy.max_timeout_seconds = config.max_timeout_seconds;
    request_policy.max_source_bytes = config.max_source_bytes;
    return request_policy;
}

execution::ExecutorOptions make_executor_options(
    const core::config::ServiceConfig& config) {
    execution::ExecutorOptions options;
    options.output_cap_bytes = config.output_cap_bytes;
    options.limits = config.limits;
    return options;
}

}  // namespace

ExecutionCoordinator::ExecutionCoordinator(core::config::ServiceConfig config)
    : config_(std::move(config)),
      guard_(make_policy(config_)),
      registry_(config_),
      workspaces_(config_.workspace_root),
      executor_(make_executor_options(config_)) {}

core::errors::Result<ExecutionResult> ExecutionCoordinator::execute(
    const ExecutionRequest& request) const {
    // Rejections below happen before any workspace or process exists. An
    // unregistered language is reported as such whatever else is wrong.
    auto runner = registry_.resolve(request.language);
    if (core::errors::is_error(runner)) {
        LOG_INFO("ExecutionCoordinator: rejected language '" + request.language + "'");
        return core::errors::get_error(runner);
    }

    auto timeout = guard_.validate_request(request);
    if (core::errors::is_error(timeout)) {
        return core::errors::get_error(timeout);
    }

    try {
        return run_in_workspace(request, core::errors::get_value(runner),
                                core::errors::get_value(timeout));
    } catch (const std::exception& ex) {
        // The workspace guard has already released by the time we get here.
        LOG_ERROR(std::string("ExecutionCoordinator: unexpected failure: ") + ex.what());
        return ExecError{ErrorCategory::Internal,
                         std::string("Unexpected failure during execution: ") + ex.what(),
                         "internal_error"};
    }
}

core::errors::Result<ExecutionResult> ExecutionCoordinator::run_in_workspace(
    const ExecutionRequest& request, const runners::RunnerSpec& runner,
    const std::uint32_t timeout_seconds) const {
    const std::string request_id = core::config::generate_request_id();

    auto acquired = workspaces_.acquire();
    if (core::errors::is_error(acquired)) {
        const auto& err = core::errors::get_error(acquired);
        LOG_ERROR("ExecutionCoordinator: " + request_id + " workspace unavailable [" +
                  err.code + "]: " + err.message);
        return err;
    }
    workspace::ScopedWorkspace scoped(workspaces_,
                                      core::errors::take_value(std::move(acquired)));

    LOG_INFO("ExecutionCoordinator: " + request_id + " running " + request.language +
             " snippet (" + std::to_string(request.source.size()) + " bytes, timeout " +
             std::to_string(timeout_seconds) + " s)");

    const auto snippet_path = scoped.path() / ("snippet" + runner.file_extension);
    auto outcome = executor_.run(scoped.get(), snippet_path, request.source, runner,
                                 std::chrono::seconds(timeout_seconds));

    // run() has reaped the child and killed its group; nothing writes here any more.
    scoped.release();

    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        LOG_ERROR("ExecutionCoordinator: " + request_id + " failed [" + err.code +
                  "]: " + err.message);
        return err;
    }

    LOG_INFO("ExecutionCoordinator: " + request_id + " " +
             protocol::summarize(core::errors::get_value(outcome)));
    return outcome;
}

}  // namespace sandrun::service
