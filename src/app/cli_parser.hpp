#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/exec_errors.hpp"
#include "protocol/execution_request.hpp"

namespace sandrun::app::cli {

    enum class CommandKind {
        Run,
        Languages
    };

    enum class OutputFormat {
        Json,
        Text
    };

    // Validated command line. Exactly one snippet source is set for Run.
    struct CliCommand {
        CommandKind kind = CommandKind::Run;
        std::optional<std::string> language;
        std::optional<std::string> code;
        std::optional<std::filesystem::path> file;
        std::optional<std::filesystem::path> markdown;
        std::uint32_t block = 1;  // 1-based index into the markdown's code blocks
        std::optional<std::uint32_t> timeout_seconds;
        std::optional<std::filesystem::path> config_path;
        OutputFormat format = OutputFormat::Json;
        bool verbose = false;
    };

    sandrun::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

    // Reads the snippet named by a Run command and builds the service request.
    sandrun::core::errors::Result<sandrun::protocol::ExecutionRequest> build_request(
        const CliCommand& command);
}
