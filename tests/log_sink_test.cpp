#include "../cbzxl_cli/src/utils/file_log_sink.hpp"
#include "logger.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace cbzxl;
using namespace cbzxl::test;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

struct CaptureSink final : ILogSink {
    explicit CaptureSink(std::vector<std::string>& out) : out_(out) {}
    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        out_.push_back(std::string(Logger::level_to_string(level)) + "|" + std::string(tag) + "|" +
                       std::string(message));
    }
    std::vector<std::string>& out_;
};

struct ThrowingSink final : ILogSink {
    void log(LogLevel, std::string_view, std::string_view) override {
        throw std::runtime_error("disk full");
    }
};

} // namespace

TEST(FileLogSinkTest, DryRunPrefixesEveryLine) {
    const TempDir dir;
    const auto path = dir / "run.log";
    {
        FileLogSink sink(path, true);
        ASSERT_TRUE(sink.is_open());
        sink.log(LogLevel::Info, "first", "Pipeline");
        sink.log(LogLevel::Error, "second", "");
    }
    const auto lines = lines_of(read_file(path));
    ASSERT_EQ(lines.size(), 2u);
    for (const auto& line : lines) {
        EXPECT_TRUE(line.starts_with("[DRY-RUN] ")) << line;
    }
    EXPECT_TRUE(lines[0].ends_with("[INFO][Pipeline] first")) << lines[0];
    EXPECT_TRUE(lines[1].ends_with("[ERROR] second")) << lines[1];
}

TEST(FileLogSinkTest, AppendsToExistingLog) {
    const TempDir dir;
    const auto path = dir / "run.log";
    write_file(path, "earlier run\n");
    {
        FileLogSink sink(path);
        sink.log(LogLevel::Warning, "later run", "main");
    }
    const auto lines = lines_of(read_file(path));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "earlier run");
    EXPECT_FALSE(lines[1].starts_with("[DRY-RUN]"));
    EXPECT_TRUE(lines[1].ends_with("[WARN][main] later run"));
}

TEST(LoggerTest, FansOutToEverySink) {
    std::vector<std::string> a;
    std::vector<std::string> b;
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<CaptureSink>(a));
    Logger::add_sink(std::make_unique<CaptureSink>(b));

    Logger::log(LogLevel::Debug, "hello", "Test");
    Logger::log(LogLevel::Info, "default tag");
    Logger::clear_sinks();
    Logger::log(LogLevel::Info, "dropped");

    const std::vector<std::string> expected{"DEBUG|Test|hello", "INFO|cbzxl|default tag"};
    EXPECT_EQ(a, expected);
    EXPECT_EQ(b, expected);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(Logger::string_to_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("INFO"), LogLevel::Info);
    EXPECT_EQ(Logger::string_to_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("anything"), LogLevel::Error);
}

TEST(LoggerTest, ThrowingSinkDoesNotSilenceTheOthers) {
    std::vector<std::string> captured;
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<ThrowingSink>());
    Logger::add_sink(std::make_unique<CaptureSink>(captured));
    Logger::add_sink(nullptr);
    EXPECT_EQ(Logger::sink_count(), 2u);

    EXPECT_NO_THROW(Logger::log(LogLevel::Warning, "still delivered", "Encoder"));
    Logger::clear_sinks();

    EXPECT_EQ(captured, std::vector<std::string>{"WARN|Encoder|still delivered"});
}
