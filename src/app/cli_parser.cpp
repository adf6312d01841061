#include "cli_parser.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "snippets/code_blocks.hpp"

namespace sandrun::app::cli {

    using namespace sandrun::core::errors;
    using sandrun::protocol::ExecutionRequest;

    constexpr const char* kUsage =
        "Usage: sandrun_cli run --language <python|javascript> "
        "(--code <text> | --file <path> | --markdown <path> [--block <n>]) "
        "[--timeout <seconds>] [--config <path>] [--format json|text] [--verbose]\n"
        "       sandrun_cli languages [--config <path>]";

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> language;
        std::optional<std::string> code;
        std::optional<std::string> file;
        std::optional<std::string> markdown;
        std::optional<std::string> block;
        std::optional<std::string> timeout;
        std::optional<std::string> config;
        std::optional<std::string> format;
        bool verbose = false;
    };

    namespace {

    // Exception-free integer parsing
    bool parse_uint(const std::string& text, std::uint32_t& out) {
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, out);
        return ec == std::errc() && ptr == end;
    }

    Result<std::string> read_text_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) {
            return ExecError{ErrorCategory::Input, "Not a readable file: " + path.string(), "invalid_path"};
        }
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return ExecError{ErrorCategory::Input, "Failed to open file: " + path.string(), "invalid_path"};
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (!in.good() && !in.eof()) {
            return ExecError{ErrorCategory::Input, "I/O error while reading file: " + path.string(), "read_failed"};
        }
        return buffer.str();
    }

    } // namespace

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ExecError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliCommand command;
        const std::string name = argv[1];
        if (name == "run") {
            command.kind = CommandKind::Run;
        } else if (name == "languages") {
            command.kind = CommandKind::Languages;
        } else {
            return ExecError{ErrorCategory::Input, "Unknown command: " + name, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--language", &raw.language}, {"--code", &raw.code},
            {"--file", &raw.file},         {"--markdown", &raw.markdown},
            {"--block", &raw.block},       {"--timeout", &raw.timeout},
            {"--config", &raw.config},     {"--format", &raw.format}};

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            bool matched = false;
            for (const auto& [flag, slot] : valued) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    return ExecError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return ExecError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        command.verbose = raw.verbose;
        if (raw.config) command.config_path = std::filesystem::path(raw.config.value());

        if (command.kind == CommandKind::Languages) {
            if (raw.language || raw.code || raw.file || raw.markdown || raw.block || raw.timeout || raw.format) {
                return ExecError{ErrorCategory::Input, "'languages' only accepts --config and --verbose", "unknown_argument"};
            }
            return command;
        }

        const int sources = (raw.code ? 1 : 0) + (raw.file ? 1 : 0) + (raw.markdown ? 1 : 0);
        if (sources == 0) {
            return ExecError{ErrorCategory::Input, "Must provide one of --code, --file or --markdown", "missing_required_flag"};
        }
        if (sources > 1) {
            return ExecError{ErrorCategory::Input, "--code, --file and --markdown are mutually exclusive", "conflicting_flags"};
        }
        if (!raw.language && !raw.markdown) {
            return ExecError{ErrorCategory::Input, "Must provide --language", "missing_required_flag"};
        }
        if (raw.block && !raw.markdown) {
            return ExecError{ErrorCategory::Input, "--block requires --markdown", "conflicting_flags"};
        }

        command.language = raw.language;
        command.code = raw.code;
        if (raw.file) command.file = std::filesystem::path(raw.file.value());
        if (raw.markdown) command.markdown = std::filesystem::path(raw.markdown.value());

        if (raw.block) {
            std::uint32_t block = 0;
            if (!parse_uint(raw.block.value(), block)) {
                return ExecError{ErrorCategory::Input, "Invalid number for --block", "invalid_integer", "Provide a positive integer."};
            }
            if (block == 0) {
                return ExecError{ErrorCategory::Input, "--block out of bounds", "bounds_error", "Blocks are numbered from 1."};
            }
            command.block = block;
        }

        // Upper bound is the service's; only shape is checked here.
        if (raw.timeout) {
            std::uint32_t seconds = 0;
            if (!parse_uint(raw.timeout.value(), seconds)) {
                return ExecError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer", "Provide a positive integer."};
            }
            command.timeout_seconds = seconds;
        }

        if (raw.format) {
            if (raw.format.value() == "json") {
                command.format = OutputFormat::Json;
            } else if (raw.format.value() == "text") {
                command.format = OutputFormat::Text;
            } else {
                return ExecError{ErrorCategory::Input, "Unknown --format: " + raw.format.value(), "invalid_format", "Use json or text."};
            }
        }

        return command;
    }

    Result<ExecutionRequest> build_request(const CliCommand& command) {
        if (command.kind != CommandKind::Run) {
            return ExecError{ErrorCategory::Input, "Only 'run' carries a snippet", "invalid_command"};
        }

        ExecutionRequest request;
        request.timeout_seconds = command.timeout_seconds;

        if (command.code) {
            request.language = command.language.value_or("");
            request.source = command.code.value();
            return request;
        }

        if (command.file) {
            auto text = read_text_file(command.file.value());
            if (is_error(text)) {
                return get_error(text);
            }
            request.language = command.language.value_or("");
            request.source = get_value(text);
            return request;
        }

        if (!command.markdown) {
            return ExecError{ErrorCategory::Input, "No snippet source given", "missing_required_flag"};
        }
        auto text = read_text_file(command.markdown.value());
        if (is_error(text)) {
            return get_error(text);
        }
        const auto blocks = sandrun::snippets::extract_code_blocks(get_value(text));
        if (command.block > blocks.size()) {
            return ExecError{ErrorCategory::Input,
                             "Markdown has " + std::to_string(blocks.size()) + " code block(s), asked for block " +
                                 std::to_string(command.block),
                             "block_not_found"};
        }
        const auto& block = blocks[command.block - 1];
        // An explicit --language overrides the fence tag.
        request.language = command.language.value_or(block.language);
        request.source = block.code;
        return request;
    }

} // namespace sandrun::app::cli
