/**
 * @file test_logger.cpp
 * @brief Unit tests for the Logger front-end and log sinks.
 */

#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace runexec;

namespace {

/// Collects records in memory; shared so the test can inspect them.
struct CapturedLines {
    std::mutex mutex;
    std::vector<std::string> lines;
    int flushes = 0;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::shared_ptr<CapturedLines> out) : out_(std::move(out)) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(out_->mutex);
        out_->lines.emplace_back(json_line);
    }
    void flush() override {
        std::lock_guard lock(out_->mutex);
        ++out_->flushes;
    }

private:
    std::shared_ptr<CapturedLines> out_;
};

}  // namespace

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(*parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(*parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(*parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(*parse_log_level("error"), LogLevel::Error);

    auto bad = parse_log_level("loud");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::Config);
}

TEST(JsonEscapeTest, SpecialCharacters) {
    EXPECT_EQ(json_escape(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("line\nnext\ttab"), "line\\nnext\\ttab");
    EXPECT_EQ(json_escape(std::string_view{"\x01", 1}), "\\u0001");
    EXPECT_EQ(json_escape("plain"), "plain");
}

TEST(LoggerTest, WritesJsonRecord) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Debug, "test");

    logger.info("run \"started\"");

    ASSERT_EQ(captured->lines.size(), 1u);
    const auto& line = captured->lines.front();
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("component":"test")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"run \"started\"")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown");
    EXPECT_EQ(captured->lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("now shown");
    EXPECT_EQ(captured->lines.size(), 3u);
}

TEST(LoggerTest, NullSinkPointerIsIgnored) {
    Logger logger(nullptr, LogLevel::Debug);
    logger.error("nowhere");
    logger.flush();
    SUCCEED();
}

TEST(LoggerTest, ConcurrentWritersProduceWholeLines) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured), LogLevel::Info);

    std::vector<std::jthread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&logger, t] {
            for (int i = 0; i < 100; ++i) {
                logger.info("writer " + std::to_string(t) + " record " + std::to_string(i));
            }
        });
    }
    writers.clear();

    ASSERT_EQ(captured->lines.size(), 400u);
    for (const auto& line : captured->lines) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.back(), '}');
    }
}

TEST(LoggerTest, FlushReachesSink) {
    auto captured = std::make_shared<CapturedLines>();
    Logger logger(std::make_unique<CaptureSink>(captured));
    logger.flush();
    EXPECT_EQ(captured->flushes, 1);
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
               / ("runexec_test_logs_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(JsonFileSinkTest, WritesNdjsonLines) {
    {
        JsonFileSink sink(dir_, "runexec");
        sink.write(R"({"msg":"one"})");
        sink.write(R"({"msg":"two"})");
        sink.flush();
    }

    std::ifstream in(dir_ / "runexec.ndjson");
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], R"({"msg":"two"})");
}

TEST_F(JsonFileSinkTest, RotatesWhenFull) {
    JsonFileSink sink(dir_, "runexec", /*max_file_size_mb=*/1, /*max_files=*/2);
    const std::string record(64 * 1024, 'x');

    // Three files' worth of data: current, .1 and .2 exist, nothing beyond.
    for (int i = 0; i < 3 * 17; ++i) sink.write(record);
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(sink.current_path()));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "runexec.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "runexec.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "runexec.3.ndjson"));
    EXPECT_LE(std::filesystem::file_size(sink.current_path()), 1024u * 1024u + record.size() + 1);
}
