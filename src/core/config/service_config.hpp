#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/exec_errors.hpp"

namespace sandrun::core::config {

// Applied to the child with setrlimit; 0 leaves the inherited limit in place.
struct ResourceLimits {
    std::uint64_t max_memory_bytes = 0;
    std::uint64_t max_cpu_seconds = 0;
    std::uint64_t max_file_bytes = 0;
    std::uint64_t max_open_files = 0;
};

struct RunnerSettings {
    std::string interpreter;
    // "{file}" is replaced with the snippet path.
    std::vector<std::string> args;
};

struct ServiceConfig {
    std::filesystem::path workspace_root = default_workspace_root();
    std::uint32_t default_timeout_seconds = 10;
    std::uint32_t max_timeout_seconds = 60;
    std::size_t output_cap_bytes = 1024 * 1024;
    std::size_t max_source_bytes = 256 * 1024;
    ResourceLimits limits;
    RunnerSettings python{"python3", {"-u", "{file}"}};
    RunnerSettings javascript{"node", {"{file}"}};

    static std::filesystem::path default_workspace_root();
};

// Reads a JSON object; keys that are absent keep their defaults.
core::errors::Result<ServiceConfig> load_service_config(
    const std::filesystem::path& path);

core::errors::Result<ServiceConfig> parse_service_config(const std::string& text);

}  // namespace sandrun::core::config
