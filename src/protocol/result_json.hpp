#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_result.hpp"

namespace sandrun::protocol {

nlohmann::json to_json(const ExecutionResult& result);

nlohmann::json to_json(const core::errors::ExecError& error);

// One line for humans: "exit 0", "timed out after 10000 ms", "killed by signal 11"
// plus a truncation note when either stream was capped.
std::string summarize(const ExecutionResult& result);

}  // namespace sandrun::protocol
