#pragma once

#include <filesystem>
#include <string>
#include "core/errors/exec_errors.hpp"

namespace sandrun::runners {

// Resolves an interpreter command to an executable file. Commands containing a
// '/' are taken as paths; bare names are searched on PATH.
core::errors::Result<std::filesystem::path> locate_interpreter(
    const std::string& command);

}  // namespace sandrun::runners
