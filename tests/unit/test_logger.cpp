#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <psgraph/errors.hpp>
#include <psgraph/logger.hpp>
#include <psgraph/scale.hpp>
#include <string>
#include <vector>

using namespace psgraph;

class LoggerTest : public ::testing::Test
{
   protected:
    std::vector<Logger::LogEntry> entries_;

    void SetUp() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::memory_sink(entries_));
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    Logger::instance().log_formatted(LogLevel::Info, "test", "{} + {} = {}", 1, 2.5, "x");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "1 + 2.5 = x");
    EXPECT_EQ(entries_[0].category, "test");
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, SurplusArgumentsAreDropped)
{
    Logger::instance().log_formatted(LogLevel::Info, "test", "only {}", std::string("one"), 2);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "only one");
}

TEST_F(LoggerTest, LevelFiltersEntries)
{
    Logger::instance().set_level(LogLevel::Warning);
    PSGRAPH_LOG_INFO("test", "dropped");
    PSGRAPH_LOG_WARN("test", "kept {}", true);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept true");
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
}

TEST_F(LoggerTest, FailuresAreLoggedBeforeThrowing)
{
    ScaleRequest r;
    r.axis   = "y_axis";
    r.low    = 5.0;
    r.high   = 5.0;
    r.extent = 100.0;
    EXPECT_THROW(compute_numeric_scale(r), ConfigurationError);

    ASSERT_FALSE(entries_.empty());
    const auto& last = entries_.back();
    EXPECT_EQ(last.level, LogLevel::Error);
    EXPECT_EQ(last.category, "scale");
    EXPECT_EQ(last.message, "y_axis: low (5) must be below high (5)");
}

TEST_F(LoggerTest, ScaleDecisionsAtDebug)
{
    ScaleRequest r;
    r.axis            = "x_axis";
    r.extent          = 475.0;
    r.labels_required = 15;
    compute_numeric_scale(r);

    bool found = false;
    for (const auto& e : entries_)
    {
        if (e.category == "scale" && e.level == LogLevel::Debug)
            found = e.message.find("x_axis: 0 to 100") == 0;
    }
    EXPECT_TRUE(found);
}

TEST_F(LoggerTest, DisabledWithoutSinks)
{
    Logger::instance().clear_sinks();
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Critical));
}

TEST(LoggerNames, LevelStrings)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST(LoggerNames, TimestampHasMilliseconds)
{
    auto text = Logger::timestamp_to_string(std::chrono::system_clock::now());
    // YYYY-MM-DD HH:MM:SS.mmm
    EXPECT_EQ(text.size(), 23u);
    EXPECT_EQ(text[19], '.');
}

TEST(LoggerSinks, FileSinkAppendsLines)
{
    auto path = (std::filesystem::temp_directory_path() / "psgraph_test_log.txt").string();
    std::remove(path.c_str());

    Logger::instance().clear_sinks();
    Logger::instance().add_sink(sinks::file_sink(path));
    PSGRAPH_LOG_ERROR("document", "cannot open '{}'", "out.ps");
    Logger::instance().clear_sinks();

    std::ifstream in(path);
    std::string   line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("ERROR [document] cannot open 'out.ps'"), std::string::npos);
    std::remove(path.c_str());
}
