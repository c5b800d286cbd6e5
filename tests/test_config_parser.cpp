#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace esa {
namespace {

std::string WriteConfig(const testutil::TemporaryDirectory& dir, const std::string& json) {
    const std::string path = dir.Path() + "/config.json";
    testutil::WriteFile(path, json);
    return path;
}

TEST(ConfigParserTest, LoadsAllKeys) {
    testutil::TemporaryDirectory dir;
    const auto path = WriteConfig(dir, R"({
        "LogLevel": "debug",
        "TempDir": "/var/tmp",
        "MaxComponentBytes": 1048576,
        "ComponentExtraction": "memory"
    })");

    config::ToolConfigFromFile cfg;
    const auto res = cfg.LoadFile(path);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.temp_dir, "/var/tmp");
    EXPECT_EQ(cfg.max_component_bytes, 1048576u);
    EXPECT_EQ(cfg.component_extraction, "memory");
}

TEST(ConfigParserTest, AbsentKeysStayUnset) {
    testutil::TemporaryDirectory dir;
    const auto path = WriteConfig(dir, R"({"TempDir": "/scratch"})");

    config::ToolConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(path).is_ok());
    EXPECT_EQ(cfg.temp_dir, "/scratch");
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_FALSE(cfg.max_component_bytes.has_value());
    EXPECT_FALSE(cfg.component_extraction.has_value());
}

TEST(ConfigParserTest, RejectsInvalidValues) {
    testutil::TemporaryDirectory dir;
    const char* bad[] = {
        R"({"LogLevel": "chatty"})",
        R"({"LogLevel": 3})",
        R"({"TempDir": ""})",
        R"({"MaxComponentBytes": 0})",
        R"({"MaxComponentBytes": "big"})",
        R"({"ComponentExtraction": "mmap"})",
        R"(["not", "an", "object"])",
        R"({"LogLevel": )",
    };
    for (const char* json : bad) {
        config::ToolConfigFromFile cfg;
        const auto res = cfg.LoadFile(WriteConfig(dir, json));
        EXPECT_FALSE(res.is_ok()) << json;
        EXPECT_EQ(res.code(), ErrorCode::kConfig) << json;
        EXPECT_EQ(res.msg.rfind("Config: ", 0), 0u) << res.msg;
        EXPECT_FALSE(cfg.log_level.has_value()) << json;
        EXPECT_FALSE(cfg.temp_dir.has_value()) << json;
    }
}

TEST(ConfigParserTest, MissingFileFails) {
    config::ToolConfigFromFile cfg;
    const auto res = cfg.LoadFile("/nonexistent/esareq.json");
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("cannot open"), std::string::npos);
}

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(ParseLogLevel("none"), LogLevel::None);
    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
}

} // namespace
} // namespace esa
