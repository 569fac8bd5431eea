/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author DeadlineGroup contributors
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace deadline_group;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "dg_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.group.name, "default");
    EXPECT_EQ(config.group.timeout_ms, 0);
    EXPECT_FALSE(config.group.collect_results);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.sink, "stdout");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [group]
        name = "fanout"
        timeout_ms = 1500
        collect_results = true

        [logging]
        level = "debug"
        sink = "file"
        log_dir = "/tmp/dg_logs"
        max_file_size_mb = 10
        rotate_count = 3
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.group.name, "fanout");
    EXPECT_EQ(config.group.timeout_ms, 1500);
    EXPECT_TRUE(config.group.collect_results);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.sink, "file");
    EXPECT_EQ(config.logging.log_dir, std::filesystem::path{"/tmp/dg_logs"});
    EXPECT_EQ(config.logging.max_file_size_mb, 10u);
    EXPECT_EQ(config.logging.rotate_count, 3u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [group]
        timeout_ms = 250
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->group.timeout_ms, 250);
    // Defaults for everything else
    EXPECT_EQ(result->group.name, "default");
    EXPECT_FALSE(result->group.collect_results);
    EXPECT_EQ(result->logging.sink, "stdout");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigNotFound);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigParse);
}

TEST_F(ConfigTest, NegativeTimeoutRejected) {
    auto result = parse_config("[group]\ntimeout_ms = -5\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalid);
}

TEST_F(ConfigTest, UnknownSinkRejected) {
    auto result = parse_config("[logging]\nsink = \"syslog\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalid);
}

TEST_F(ConfigTest, UnknownLevelRejected) {
    auto result = parse_config("[logging]\nlevel = \"chatty\"\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalid);
}

TEST_F(ConfigTest, NegativeRotateCountRejected) {
    auto result = parse_config("[logging]\nrotate_count = -1\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalid);
}

TEST_F(ConfigTest, NegativeFileSizeRejected) {
    auto result = parse_config("[logging]\nmax_file_size_mb = -1\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalid);
}

TEST_F(ConfigTest, OversizedRotationSettingsRejected) {
    EXPECT_FALSE(parse_config("[logging]\nrotate_count = 5000000000\n").has_value());
    EXPECT_FALSE(parse_config("[logging]\nmax_file_size_mb = 5000000000\n").has_value());
}

TEST_F(ConfigTest, ZeroRotationSettingsAccepted) {
    auto result = parse_config("[logging]\nmax_file_size_mb = 0\nrotate_count = 0\n");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->logging.max_file_size_mb, 0u);
    EXPECT_EQ(result->logging.rotate_count, 0u);
}
