#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/request_id.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/result_json.hpp"
#include "service/execution_coordinator.hpp"

namespace {

using sandrun::core::errors::ErrorCategory;
using sandrun::core::errors::ExecError;

// Child output is arbitrary bytes; invalid UTF-8 is replaced rather than thrown on.
std::string dump(const nlohmann::json& payload) {
    return payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

int exit_code_for(const ExecError& err) {
    switch (err.category) {
        case ErrorCategory::Input:
        case ErrorCategory::Policy:
            return 2;
        case ErrorCategory::UnsupportedLanguage:
        case ErrorCategory::RunnerUnavailable:
            return 3;
        case ErrorCategory::Resource:
            return 4;
        case ErrorCategory::Internal:
        default:
            return 5;
    }
}

int report_error(const ExecError& err) {
    LOG_ERROR("Error [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    std::cout << dump(sandrun::protocol::to_json(err)) << std::endl;
    return exit_code_for(err);
}

void print_text(const sandrun::protocol::ExecutionResult& result) {
    std::cout << "--- stdout" << (result.stdout_truncated ? " (truncated)" : "") << "\n"
              << result.stdout_text;
    if (!result.stdout_text.empty() && result.stdout_text.back() != '\n') {
        std::cout << "\n";
    }
    std::cout << "--- stderr" << (result.stderr_truncated ? " (truncated)" : "") << "\n"
              << result.stderr_text;
    if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
        std::cout << "\n";
    }
    std::cout << "--- " << sandrun::protocol::summarize(result) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag this process's log lines
    sandrun::core::logging::Logger::get().set_tag(
        sandrun::core::config::generate_request_id());

    // 2. Parse CLI input and return normalized input errors
    auto parsed = sandrun::app::cli::parse_and_validate(argc, argv);
    if (sandrun::core::errors::is_error(parsed)) {
        return report_error(sandrun::core::errors::get_error(parsed));
    }
    const auto& command = sandrun::core::errors::get_value(parsed);
    if (command.verbose) {
        sandrun::core::logging::Logger::get().set_min_level(
            sandrun::core::logging::LogLevel::DEBUG);
    }
    LOG_DEBUG("sandrun: bootstrapping");

    // 3. Load configuration
    sandrun::core::config::ServiceConfig config;
    if (command.config_path.has_value()) {
        auto loaded = sandrun::core::config::load_service_config(command.config_path.value());
        if (sandrun::core::errors::is_error(loaded)) {
            return report_error(sandrun::core::errors::get_error(loaded));
        }
        config = sandrun::core::errors::get_value(loaded);
        LOG_DEBUG("Loaded configuration from " + command.config_path->string());
    }

    const sandrun::service::ExecutionCoordinator coordinator(config);

    if (command.kind == sandrun::app::cli::CommandKind::Languages) {
        nlohmann::json listing = nlohmann::json::array();
        for (const auto& runner : coordinator.registry().languages()) {
            nlohmann::json entry;
            entry["language"] = sandrun::protocol::to_string(runner.language);
            entry["interpreter"] = runner.interpreter_command;
            entry["extension"] = runner.file_extension;
            entry["args"] = runner.args_template;
            listing.push_back(entry);
        }
        std::cout << dump(listing) << std::endl;
        return 0;
    }

    // 4. Execute
    auto request = sandrun::app::cli::build_request(command);
    if (sandrun::core::errors::is_error(request)) {
        return report_error(sandrun::core::errors::get_error(request));
    }

    auto execution = coordinator.execute(sandrun::core::errors::get_value(request));
    if (sandrun::core::errors::is_error(execution)) {
        return report_error(sandrun::core::errors::get_error(execution));
    }

    const auto& result = sandrun::core::errors::get_value(execution);
    if (command.format == sandrun::app::cli::OutputFormat::Text) {
        print_text(result);
    } else {
        std::cout << dump(sandrun::protocol::to_json(result)) << std::endl;
    }
    return 0;
}
