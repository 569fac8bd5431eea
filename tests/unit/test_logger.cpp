/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger rendering and the log sinks.
 * @author DeadlineGroup contributors
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace deadline_group;

namespace {

struct CapturingLogger {
    MemorySink* sink;
    std::shared_ptr<Logger> logger;
};

CapturingLogger make_capturing(LogLevel level = LogLevel::Debug) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    return {raw, std::make_shared<Logger>(std::move(sink), level)};
}

}  // namespace

TEST(LoggerTest, RendersJsonLineWithFields) {
    auto [sink, logger] = make_capturing();
    logger->info("hello", {{"group", "g1"}, {"index", "3"}});

    auto lines = sink->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find(R"({"level":"info",)"), 0u);
    EXPECT_NE(lines[0].find(R"("msg":"hello")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("group":"g1")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("index":"3")"), std::string::npos);
    EXPECT_EQ(lines[0].back(), '}');
}

TEST(LoggerTest, ErrorFormAddsErrorFields) {
    auto [sink, logger] = make_capturing();
    logger->error("task run error", Error{ErrorCode::TaskException, "boom"}, {{"index", "0"}});

    auto lines = sink->lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"("level":"error")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("error":"boom")"), std::string::npos);
    EXPECT_NE(lines[0].find(R"("error_code":"task_exception")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto [sink, logger] = make_capturing(LogLevel::Warn);
    logger->debug("d");
    logger->info("i");
    logger->warn("w");
    logger->error("e");
    EXPECT_EQ(sink->lines().size(), 2u);

    logger->set_level(LogLevel::Debug);
    EXPECT_EQ(logger->level(), LogLevel::Debug);
    logger->debug("d");
    EXPECT_EQ(sink->lines().size(), 3u);
}

TEST(LoggerTest, EscapesControlCharacters) {
    EXPECT_EQ(json_escape(R"(a"b\c)"), R"(a\"b\\c)");
    EXPECT_EQ(json_escape("line1\nline2\t"), R"(line1\nline2\t)");
    EXPECT_EQ(json_escape(std::string{"\x01"}), R"(\u0001)");
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LoggerTest, ConcurrentWritersProduceWholeLines) {
    auto [sink, logger] = make_capturing();
    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([logger = logger, t] {
            for (int i = 0; i < 50; ++i) {
                logger->info("tick", {{"writer", std::to_string(t)}});
            }
        });
    }
    for (auto& w : writers) w.join();

    auto lines = sink->lines();
    ASSERT_EQ(lines.size(), 400u);
    for (const auto& line : lines) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
    }
}

// ─── JsonFileSink ────────────────────────────

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "dg_test_sink";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(JsonFileSinkTest, WritesOneLinePerEntry) {
    {
        JsonFileSink sink(temp_dir_, "run");
        sink.write(R"({"a":1})");
        sink.write(R"({"b":2})");
        sink.flush();
    }

    std::ifstream in(temp_dir_ / "run.ndjson");
    std::string first, second;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));
    EXPECT_EQ(first, R"({"a":1})");
    EXPECT_EQ(second, R"({"b":2})");
}

TEST_F(JsonFileSinkTest, RotatesWhenSizeExceeded) {
    // 1 MB limit: two half-megabyte lines fill the first file.
    std::string big(512 * 1024, 'x');
    {
        JsonFileSink sink(temp_dir_, "rot", 1, 2);
        sink.write(big);
        sink.write(big);
        sink.write("after-rotation");
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(temp_dir_ / "rot.1.ndjson"));
    std::ifstream in(temp_dir_ / "rot.ndjson");
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_EQ(line, "after-rotation");
}

TEST(NullSinkTest, DiscardsEverything) {
    Logger logger(std::make_unique<NullSink>());
    logger.info("nothing");
    logger.flush();
    SUCCEED();
}
