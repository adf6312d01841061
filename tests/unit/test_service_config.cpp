#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/request_id.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/exec_errors.hpp"

namespace {

using sandrun::core::config::load_service_config;
using sandrun::core::config::parse_service_config;
using sandrun::core::config::ServiceConfig;
using sandrun::core::errors::ErrorCategory;
using sandrun::core::errors::get_error;
using sandrun::core::errors::get_value;
using sandrun::core::errors::is_error;

TEST(ServiceConfigTest, DefaultsMatchDocumentedValues) {
    const ServiceConfig config;
    EXPECT_EQ(config.default_timeout_seconds, 10u);
    EXPECT_EQ(config.max_timeout_seconds, 60u);
    EXPECT_EQ(config.output_cap_bytes, 1024u * 1024u);
    EXPECT_EQ(config.python.interpreter, "python3");
    EXPECT_EQ(config.javascript.interpreter, "node");
    EXPECT_EQ(config.workspace_root.filename().string(), "sandrun");
    EXPECT_EQ(config.limits.max_memory_bytes, 0u);
}

TEST(ServiceConfigTest, EmptyObjectKeepsDefaults) {
    auto result = parse_service_config("{}");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).default_timeout_seconds, 10u);
    EXPECT_EQ(get_value(result).python.args, (std::vector<std::string>{"-u", "{file}"}));
}

TEST(ServiceConfigTest, ParsesAllSections) {
    auto result = parse_service_config(R"({
        "workspace_root": "/var/tmp/sandrun-test",
        "default_timeout_seconds": 5,
        "max_timeout_seconds": 30,
        "output_cap_bytes": 4096,
        "max_source_bytes": 1000,
        "limits": {"max_memory_bytes": 268435456, "max_cpu_seconds": 20},
        "runners": {
            "python": {"interpreter": "/usr/bin/python3.11", "args": ["-I", "{file}"]},
            "javascript": {"interpreter": "nodejs"}
        }
    })");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.workspace_root, std::filesystem::path("/var/tmp/sandrun-test"));
    EXPECT_EQ(config.default_timeout_seconds, 5u);
    EXPECT_EQ(config.max_timeout_seconds, 30u);
    EXPECT_EQ(config.output_cap_bytes, 4096u);
    EXPECT_EQ(config.max_source_bytes, 1000u);
    EXPECT_EQ(config.limits.max_memory_bytes, 268435456u);
    EXPECT_EQ(config.limits.max_cpu_seconds, 20u);
    EXPECT_EQ(config.limits.max_file_bytes, 0u);
    EXPECT_EQ(config.python.interpreter, "/usr/bin/python3.11");
    EXPECT_EQ(config.python.args, (std::vector<std::string>{"-I", "{file}"}));
    EXPECT_EQ(config.javascript.interpreter, "nodejs");
    EXPECT_EQ(config.javascript.args, (std::vector<std::string>{"{file}"}));
}

TEST(ServiceConfigTest, RejectsMalformedJson) {
    auto result = parse_service_config("{\"default_timeout_seconds\": ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(ServiceConfigTest, RejectsUnknownKeys) {
    auto top = parse_service_config(R"({"languages": ["ruby"]})");
    ASSERT_TRUE(is_error(top));
    EXPECT_NE(get_error(top).message.find("languages"), std::string::npos);

    auto runner = parse_service_config(R"({"runners": {"ruby": {"interpreter": "ruby"}}})");
    ASSERT_TRUE(is_error(runner));
    EXPECT_EQ(get_error(runner).code, "invalid_config");
}

TEST(ServiceConfigTest, RejectsNegativeAndOversizedNumbers) {
    EXPECT_TRUE(is_error(parse_service_config(R"({"output_cap_bytes": -1})")));
    EXPECT_TRUE(is_error(parse_service_config(R"({"default_timeout_seconds": 1.5})")));
    EXPECT_TRUE(is_error(parse_service_config(R"({"max_timeout_seconds": 5000000000})")));
}

TEST(ServiceConfigTest, RejectsInconsistentTimeouts) {
    EXPECT_TRUE(is_error(parse_service_config(R"({"max_timeout_seconds": 0})")));
    EXPECT_TRUE(is_error(parse_service_config(R"({"max_timeout_seconds": 601})")));
    EXPECT_TRUE(is_error(
        parse_service_config(R"({"default_timeout_seconds": 20, "max_timeout_seconds": 10})")));
}

TEST(ServiceConfigTest, RejectsRunnerArgsWithoutFilePlaceholder) {
    auto result = parse_service_config(R"({"runners": {"python": {"args": ["-u"]}}})");
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).message.find("{file}"), std::string::npos);
}

TEST(ServiceConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      (".tmp_service_config_" + sandrun::core::config::random_hex() + ".json");
    {
        std::ofstream out(path);
        out << R"({"default_timeout_seconds": 3})";
    }

    auto result = load_service_config(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).default_timeout_seconds, 3u);
}

TEST(ServiceConfigTest, ReportsMissingFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("__missing_config_" + sandrun::core::config::random_hex() + ".json");
    auto result = load_service_config(path);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "config_not_found");
}

}  // namespace
