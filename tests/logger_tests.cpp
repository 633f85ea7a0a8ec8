#include "core/util/logger.h"

#include <gtest/gtest.h>

TEST(Logger, ParsesLevelNames)
{
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("loud").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST(Logger, CountsFilteredMessagesToo)
{
    const LogLevel previous = Logger::get_level();
    Logger::set_level(LogLevel::Error);
    Logger::reset_counts();

    Logger::debug("hidden {}", 1);
    Logger::warn("hidden {}", 2);
    Logger::at(LogLevel::Warn, "hidden {}", 3);
    Logger::error("shown {}", 4);

    EXPECT_EQ(Logger::count(LogLevel::Debug), 1u);
    EXPECT_EQ(Logger::count(LogLevel::Warn), 2u);
    EXPECT_EQ(Logger::count(LogLevel::Error), 1u);
    EXPECT_EQ(Logger::count(LogLevel::Info), 0u);

    Logger::set_level(previous);
}

TEST(Logger, ErrorsAreNeverFiltered)
{
    Logger::set_level(LogLevel::Error);
    EXPECT_TRUE(Logger::enabled(LogLevel::Error));
    EXPECT_FALSE(Logger::enabled(LogLevel::Warn));

    Logger::set_level(LogLevel::Debug);
    EXPECT_TRUE(Logger::enabled(LogLevel::Debug));
    Logger::set_level(LogLevel::Info);
}
