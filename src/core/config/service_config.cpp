#include "core/config/service_config.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>

namespace sandrun::core::config {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using nlohmann::json;

namespace {

constexpr std::uint32_t kTimeoutCeilingSeconds = 600;

ExecError invalid_config(const std::string& message) {
    return ExecError{ErrorCategory::Input, message, "invalid_config",
                     "Check the configuration file against ServiceConfig."};
}

bool reject_unknown_keys(const json& object,
                         const std::unordered_set<std::string>& known,
                         const std::string& where, ExecError& error) {
    for (const auto& item : object.items()) {
        if (known.count(item.key()) == 0) {
            error = invalid_config("Unknown key in " + where + ": " + item.key());
            return true;
        }
    }
    return false;
}

template <typename T>
bool read_unsigned(const json& object, const char* key, T& out, ExecError& error) {
    if (!object.contains(key)) {
        return false;
    }
    const json& value = object.at(key);
    if (!value.is_number_unsigned()) {
        error = invalid_config(std::string("Expected a non-negative integer for ") + key);
        return true;
    }
    const auto raw = value.get<std::uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        error = invalid_config(std::string("Value out of range for ") + key);
        return true;
    }
    out = static_cast<T>(raw);
    return false;
}

bool read_runner(const json& runners, const char* key, RunnerSettings& out,
                 ExecError& error) {
    if (!runners.contains(key)) {
        return false;
    }
    const json& runner = runners.at(key);
    if (!runner.is_object()) {
        error = invalid_config(std::string("runners.") + key + " must be an object");
        return true;
    }
    if (reject_unknown_keys(runner, {"interpreter", "args"},
                            std::string("runners.") + key, error)) {
        return true;
    }

    if (runner.contains("interpreter")) {
        const json& interpreter = runner.at("interpreter");
        if (!interpreter.is_string() || interpreter.get<std::string>().empty()) {
            error = invalid_config(std::string("runners.") + key +
                                   ".interpreter must be a non-empty string");
            return true;
        }
        out.interpreter = interpreter.get<std::string>();
    }

    if (runner.contains("args")) {
        const json& args = runner.at("args");
        if (!args.is_array()) {
            error = invalid_config(std::string("runners.") + key + ".args must be an array");
            return true;
        }
        std::vector<std::string> parsed;
        bool has_file_placeholder = false;
        for (const auto& arg : args) {
            if (!arg.is_string()) {
                error = invalid_config(std::string("runners.") + key +
                                       ".args must contain only strings");
                return true;
            }
            parsed.push_back(arg.get<std::string>());
            if (parsed.back().find("{file}") != std::string::npos) {
                has_file_placeholder = true;
            }
        }
        if (!has_file_placeholder) {
            error = invalid_config(std::string("runners.") + key +
                                   ".args must reference {file}");
            return true;
        }
        out.args = std::move(parsed);
    }
    return false;
}

}  // namespace

std::filesystem::path ServiceConfig::default_workspace_root() {
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "sandrun";
}

core::errors::Result<ServiceConfig> parse_service_config(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return invalid_config("Configuration is not valid JSON");
    }
    if (!root.is_object()) {
        return invalid_config("Configuration must be a JSON object");
    }

    ExecError error{ErrorCategory::Input, "", ""};
    if (reject_unknown_keys(root,
                            {"workspace_root", "default_timeout_seconds",
                             "max_timeout_seconds", "output_cap_bytes",
                             "max_source_bytes", "limits", "runners"},
                            "configuration", error)) {
        return error;
    }

    ServiceConfig config;
    if (root.contains("workspace_root")) {
        const json& value = root.at("workspace_root");
        if (!value.is_string() || value.get<std::string>().empty()) {
            return invalid_config("workspace_root must be a non-empty string");
        }
        config.workspace_root = value.get<std::string>();
    }

    if (read_unsigned(root, "default_timeout_seconds", config.default_timeout_seconds, error) ||
        read_unsigned(root, "max_timeout_seconds", config.max_timeout_seconds, error) ||
        read_unsigned(root, "output_cap_bytes", config.output_cap_bytes, error) ||
        read_unsigned(root, "max_source_bytes", config.max_source_bytes, error)) {
        return error;
    }

    if (root.contains("limits")) {
        const json& limits = root.at("limits");
        if (!limits.is_object()) {
            return invalid_config("limits must be an object");
        }
        if (reject_unknown_keys(limits,
                                {"max_memory_bytes", "max_cpu_seconds",
                                 "max_file_bytes", "max_open_files"},
                                "limits", error) ||
            read_unsigned(limits, "max_memory_bytes", config.limits.max_memory_bytes, error) ||
            read_unsigned(limits, "max_cpu_seconds", config.limits.max_cpu_seconds, error) ||
            read_unsigned(limits, "max_file_bytes", config.limits.max_file_bytes, error) ||
            read_unsigned(limits, "max_open_files", config.limits.max_open_files, error)) {
            return error;
        }
    }

    if (root.contains("runners")) {
        const json& runners = root.at("runners");
        if (!runners.is_object()) {
            return invalid_config("runners must be an object");
        }
        if (reject_unknown_keys(runners, {"python", "javascript"}, "runners", error) ||
            read_runner(runners, "python", config.python, error) ||
            read_runner(runners, "javascript", config.javascript, error)) {
            return error;
        }
    }

    if (config.max_timeout_seconds == 0 ||
        config.max_timeout_seconds > kTimeoutCeilingSeconds) {
        return invalid_config("max_timeout_seconds must be between 1 and " +
                              std::to_string(kTimeoutCeilingSeconds));
    }
    if (config.default_timeout_seconds == 0 ||
        config.default_timeout_seconds > config.max_timeout_seconds) {
        return invalid_config(
            "default_timeout_seconds must be between 1 and max_timeout_seconds");
    }
    if (config.output_cap_bytes == 0) {
        return invalid_config("output_cap_bytes must be greater than zero");
    }
    if (config.max_source_bytes == 0) {
        return invalid_config("max_source_bytes must be greater than zero");
    }

    return config;
}

core::errors::Result<ServiceConfig> load_service_config(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return ExecError{ErrorCategory::Input,
                         "Unable to open configuration file: " + path.string(),
                         "config_not_found"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return ExecError{ErrorCategory::Input,
                         "I/O error while reading configuration: " + path.string(),
                         "config_read_failed"};
    }
    return parse_service_config(buffer.str());
}

}  // namespace sandrun::core::config
