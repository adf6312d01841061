#include "runners/runner_registry.hpp"

#include <utility>

namespace sandrun::runners {

using core::errors::ErrorCategory;
using core::errors::ExecError;
using protocol::Language;

namespace {

RunnerSpec make_runner(const Language language,
                       const core::config::ServiceConfig& config) {
    switch (language) {
        case Language::Python:
            return RunnerSpec{language, config.python.interpreter, ".py",
                              config.python.args};
        case Language::JavaScript:
            return RunnerSpec{language, config.javascript.interpreter, ".js",
                              config.javascript.args};
    }
    return RunnerSpec{language, "", "", {}};
}

ExecError unsupported(const std::string& identifier) {
    return ExecError{ErrorCategory::UnsupportedLanguage,
                     "Language is not supported for execution: " + identifier,
                     "unsupported_language",
                     "Supported languages: python, javascript."};
}

}  // namespace

RunnerRegistry::RunnerRegistry(const core::config::ServiceConfig& config)
    : runners_{make_runner(Language::Python, config),
               make_runner(Language::JavaScript, config)} {}

core::errors::Result<RunnerSpec> RunnerRegistry::resolve(const Language language) const {
    for (const auto& runner : runners_) {
        if (runner.language == language) {
            return runner;
        }
    }
    return unsupported(protocol::to_string(language));
}

core::errors::Result<RunnerSpec> RunnerRegistry::resolve(
    const std::string& identifier) const {
    const auto language = protocol::parse_language(identifier);
    if (!language.has_value()) {
        return unsupported(identifier);
    }
    return resolve(language.value());
}

std::vector<std::string> build_argv(const RunnerSpec& spec,
                                    const std::string& interpreter_path,
                                    const std::filesystem::path& snippet_path) {
    static const std::string kPlaceholder = "{file}";

    std::vector<std::string> argv;
    argv.reserve(spec.args_template.size() + 1);
    argv.push_back(interpreter_path);
    for (const auto& token : spec.args_template) {
        std::string arg = token;
        std::size_t pos = 0;
        while ((pos = arg.find(kPlaceholder, pos)) != std::string::npos) {
            arg.replace(pos, kPlaceholder.size(), snippet_path.string());
            pos += snippet_path.string().size();
        }
        argv.push_back(std::move(arg));
    }
    return argv;
}

}  // namespace sandrun::runners
