#include "runners/interpreter_locator.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace sandrun::runners {

using core::errors::ErrorCategory;
using core::errors::ExecError;

namespace {

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

ExecError unavailable(const std::string& command, const std::string& detail) {
    return ExecError{ErrorCategory::RunnerUnavailable,
                     "Interpreter '" + command + "' " + detail,
                     "runner_unavailable",
                     "Install '" + command +
                         "' or point the runner at it in the configuration file."};
}

}  // namespace

core::errors::Result<std::filesystem::path> locate_interpreter(
    const std::string& command) {
    if (command.empty()) {
        return unavailable(command, "is not configured");
    }

    if (command.find('/') != std::string::npos) {
        const std::filesystem::path path(command);
        if (!is_executable_file(path)) {
            return unavailable(command, "does not exist or is not executable");
        }
        return path;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return unavailable(command, "cannot be searched for: PATH is not set");
    }

    std::stringstream path_stream(path_env);
    std::string dir;
    while (std::getline(path_stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const auto candidate = std::filesystem::path(dir) / command;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }

    return unavailable(command, "was not found on PATH");
}

}  // namespace sandrun::runners
