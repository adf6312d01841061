#include "protocol/result_json.hpp"

namespace sandrun::protocol {

using nlohmann::json;

json to_json(const ExecutionResult& result) {
    json payload;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["stdout_truncated"] = result.stdout_truncated;
    payload["stderr_truncated"] = result.stderr_truncated;
    payload["exit_code"] =
        result.exit_code.has_value() ? json(result.exit_code.value()) : json(nullptr);
    payload["term_signal"] =
        result.term_signal.has_value() ? json(result.term_signal.value()) : json(nullptr);
    payload["timed_out"] = result.timed_out;
    payload["duration_ms"] = result.duration_ms;
    return payload;
}

json to_json(const core::errors::ExecError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }

    json event;
    event["error"] = payload;
    return event;
}

std::string summarize(const ExecutionResult& result) {
    std::string summary;
    if (result.timed_out) {
        summary = "timed out after " + std::to_string(result.duration_ms) + " ms";
    } else if (result.term_signal.has_value()) {
        summary = "killed by signal " + std::to_string(result.term_signal.value()) +
                  " (exit " + std::to_string(result.exit_code.value_or(-1)) + ")";
    } else {
        summary = "exit " + std::to_string(result.exit_code.value_or(-1)) + " in " +
                  std::to_string(result.duration_ms) + " ms";
    }

    if (result.stdout_truncated && result.stderr_truncated) {
        summary += ", stdout and stderr truncated";
    } else if (result.stdout_truncated) {
        summary += ", stdout truncated";
    } else if (result.stderr_truncated) {
        summary += ", stderr truncated";
    }
    return summary;
}

}  // namespace sandrun::protocol
