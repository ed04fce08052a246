/**
 * @file test_logger.cpp
 * @brief Unit tests for the logger front-end and the NDJSON file sink.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace jobguard;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

size_t count_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    size_t n = 0;
    for (std::string line; std::getline(in, line);) ++n;
    return n;
}

}  // namespace

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(JsonEscapeTest, SpecialCharacters) {
    EXPECT_EQ(json_escape(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("line\nnext\t"), "line\\nnext\\t");
    EXPECT_EQ(json_escape(std::string_view{"\x01", 1}), "\\u0001");
}

TEST(TimestampTest, IsoFormatWithMilliseconds) {
    auto tp = std::chrono::system_clock::time_point{std::chrono::milliseconds{1714564800250}};
    EXPECT_EQ(format_timestamp(tp), "2024-05-01T12:00:00.250Z");
}

TEST(LoggerTest, FiltersBelowLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("shown too");
    ASSERT_EQ(lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("now visible");
    EXPECT_EQ(lines.size(), 3u);
}

TEST(LoggerTest, EmitsJsonLine) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));

    logger.info("Job \"sync\" started");
    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("level":"info")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"Job \"sync\" started")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "jg_test_sink";
        std::filesystem::remove_all(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(JsonFileSinkTest, CreatesDirectoryAndAppends) {
    {
        JsonFileSink sink(temp_dir_, "app");
        ASSERT_TRUE(sink.is_open());
        sink.write(R"({"n":1})");
        sink.write(R"({"n":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), temp_dir_ / "app.ndjson");
    }
    {
        JsonFileSink sink(temp_dir_, "app");
        sink.write(R"({"n":3})");
    }
    EXPECT_EQ(count_lines(temp_dir_ / "app.ndjson"), 3u);
}

TEST_F(JsonFileSinkTest, RotatesAndKeepsBoundedFileCount) {
    JsonFileSink sink(temp_dir_, "app", 1, 3);
    sink.set_max_file_size_bytes(20);

    // Each line is 10 bytes with its newline, so every second write rotates.
    for (int i = 0; i < 10; ++i) {
        sink.write(R"({"n":100})");
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(sink.current_path()));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));
    EXPECT_EQ(count_lines(sink.rotated_path(1)), 2u);
}

TEST_F(JsonFileSinkTest, SingleFileTruncatesOnRotation) {
    JsonFileSink sink(temp_dir_, "app", 1, 1);
    sink.set_max_file_size_bytes(20);

    for (int i = 0; i < 5; ++i) {
        sink.write(R"({"n":100})");
    }
    sink.flush();

    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_EQ(count_lines(sink.current_path()), 1u);
}

TEST_F(JsonFileSinkTest, ForFileKeepsConfiguredName) {
    auto sink = JsonFileSink::for_file(temp_dir_ / "runs.json", 1, 2);
    EXPECT_EQ(sink->current_path(), temp_dir_ / "runs.json");
    EXPECT_EQ(sink->rotated_path(1), temp_dir_ / "runs.1.json");

    sink->write(R"({"n":1})");
    sink->flush();
    EXPECT_EQ(count_lines(temp_dir_ / "runs.json"), 1u);
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "runs.ndjson"));

    auto bare = JsonFileSink::for_file(temp_dir_ / "history", 1, 2);
    EXPECT_EQ(bare->current_path(), temp_dir_ / "history");
}
