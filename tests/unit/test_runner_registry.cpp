#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"
#include "runners/interpreter_locator.hpp"
#include "runners/runner_registry.hpp"

namespace {

using sandrun::core::config::ServiceConfig;
using sandrun::core::errors::ErrorCategory;
using sandrun::core::errors::get_error;
using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;
using sandrun::protocol::Language;
using sandrun::runners::RunnerRegistry;
using sandrun::runners::RunnerSpec;

TEST(RunnerRegistryTest, ResolvesPythonRecipe) {
    RunnerRegistry registry;
    auto result = registry.resolve("python");
    ASSERT_FALSE(is_error(result));

    const auto& spec = get_value(result);
    EXPECT_EQ(spec.language, Language::Python);
    EXPECT_EQ(spec.interpreter_command, "python3");
    EXPECT_EQ(spec.file_extension, ".py");
    EXPECT_EQ(spec.args_template, (std::vector<std::string>{"-u", "{file}"}));
}

TEST(RunnerRegistryTest, ResolvesJavaScriptRecipe) {
    RunnerRegistry registry;
    auto result = registry.resolve(Language::JavaScript);
    ASSERT_FALSE(is_error(result));

    const auto& spec = get_value(result);
    EXPECT_EQ(spec.interpreter_command, "node");
    EXPECT_EQ(spec.file_extension, ".js");
}

TEST(RunnerRegistryTest, RejectsUnregisteredLanguage) {
    RunnerRegistry registry;
    for (const std::string identifier : {"cobol", "java", "Python", "", "bash"}) {
        auto result = registry.resolve(identifier);
        ASSERT_TRUE(is_error(result)) << identifier;
        EXPECT_EQ(get_error(result).category, ErrorCategory::UnsupportedLanguage);
        EXPECT_EQ(get_error(result).code, "unsupported_language");
    }
}

TEST(RunnerRegistryTest, ListsOneEntryPerLanguage) {
    RunnerRegistry registry;
    ASSERT_EQ(registry.languages().size(), 2u);
    EXPECT_EQ(registry.languages()[0].language, Language::Python);
    EXPECT_EQ(registry.languages()[1].language, Language::JavaScript);
}

TEST(RunnerRegistryTest, UsesConfiguredInterpreters) {
    ServiceConfig config;
    config.python.interpreter = "/opt/python/bin/python3.12";
    config.python.args = {"-I", "-u", "{file}"};

    RunnerRegistry registry(config);
    auto result = registry.resolve(Language::Python);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).interpreter_command, "/opt/python/bin/python3.12");
    EXPECT_EQ(get_value(result).args_template.front(), "-I");
}

TEST(RunnerRegistryTest, ConcurrentResolvesAgree) {
    const RunnerRegistry registry;
    std::vector<std::thread> threads;
    std::vector<int> failures(8, 0);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&registry, &failures, t]() {
            for (int i = 0; i < 1000; ++i) {
                auto result = registry.resolve(t % 2 == 0 ? "python" : "javascript");
                if (is_error(result)) {
                    ++failures[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const int count : failures) {
        EXPECT_EQ(count, 0);
    }
}

TEST(BuildArgvTest, SubstitutesFilePlaceholder) {
    const RunnerSpec spec{Language::Python, "python3", ".py", {"-u", "{file}", "--tag={file}"}};
    const auto argv = sandrun::runners::build_argv(spec, "/usr/bin/python3", "/ws/snippet.py");

    const std::vector<std::string> expected = {"/usr/bin/python3", "-u", "/ws/snippet.py",
                                               "--tag=/ws/snippet.py"};
    EXPECT_EQ(argv, expected);
}

TEST(InterpreterLocatorTest, FindsShellOnPath) {
    auto result = sandrun::runners::locate_interpreter("sh");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).is_absolute());
    EXPECT_EQ(get_value(result).filename().string(), "sh");
}

TEST(InterpreterLocatorTest, AcceptsAbsolutePath) {
    auto result = sandrun::runners::locate_interpreter("/bin/sh");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), std::filesystem::path("/bin/sh"));
}

TEST(InterpreterLocatorTest, ReportsMissingInterpreterByName) {
    auto result = sandrun::runners::locate_interpreter("sandrun-no-such-interpreter");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::RunnerUnavailable);
    EXPECT_NE(get_error(result).message.find("sandrun-no-such-interpreter"), std::string::npos);
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(InterpreterLocatorTest, RejectsNonExecutableFile) {
    const auto plain = std::filesystem::temp_directory_path() /
                       (".tmp_not_executable_" + sandrun::core::config::random_hex());
    std::ofstream(plain) << "#!/bin/sh\n";
    std::filesystem::permissions(plain, std::filesystem::perms::owner_read |
                                            std::filesystem::perms::owner_write);

    auto result = sandrun::runners::locate_interpreter(plain.string());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "runner_unavailable");

    std::error_code ec;
    std::filesystem::remove(plain, ec);
}

}  // namespace
