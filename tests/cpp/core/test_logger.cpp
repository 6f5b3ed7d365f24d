#include "logging/logger.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

using castgrid::logging::LogConfig;
using castgrid::logging::LogLevel;

TEST(Logger, LevelNamesRoundTrip) {
    EXPECT_EQ(castgrid::logging::levelToString(LogLevel::Warn), "warn");
    EXPECT_EQ(castgrid::logging::stringToLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(castgrid::logging::stringToLevel("error"), LogLevel::Error);
}

TEST(Logger, AppliesLoggingSection) {
    LogConfig config;
    auto section = nlohmann::json::parse(R"({
        "level": "debug",
        "filePath": "/tmp/castgrid_test.log",
        "consoleOutput": false
    })");
    castgrid::logging::applyLogSection(section, config);

    EXPECT_EQ(config.level, LogLevel::Debug);
    EXPECT_EQ(config.filePath, "/tmp/castgrid_test.log");
    EXPECT_FALSE(config.consoleOutput);
}

TEST(Logger, MistypedKeysKeepDefaults) {
    LogConfig config;
    castgrid::logging::applyLogSection(nlohmann::json::parse(R"({"maxBackups": "many"})"),
                                       config);
    EXPECT_EQ(config.maxBackups, 5u);
}

TEST(Logger, SetLevelIsObservable) {
    ASSERT_TRUE(castgrid::logging::initialize(LogConfig{}));
    castgrid::logging::setLevel(LogLevel::Error);
    EXPECT_EQ(castgrid::logging::getLevel(), LogLevel::Error);
    LOG_INFO("filtered out");
    castgrid::logging::setLevel(LogLevel::Info);
    castgrid::logging::flush();
}

TEST(Logger, ParsesLevelAliases) {
    EXPECT_EQ(castgrid::logging::tryParseLevel("WARNING"), LogLevel::Warn);
    EXPECT_EQ(castgrid::logging::tryParseLevel("fatal"), LogLevel::Critical);
    EXPECT_EQ(castgrid::logging::tryParseLevel("none"), LogLevel::Off);
    EXPECT_FALSE(castgrid::logging::tryParseLevel("loud").has_value());
    EXPECT_EQ(castgrid::logging::stringToLevel("loud"), LogLevel::Info);
}

TEST(Logger, EnvironmentLevelOverridesConfigFile) {
    std::string path = "/tmp/castgrid_logger_test_" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"logging": {"level": "info", "consoleOutput": true}})";
    }

    ::setenv(castgrid::logging::LOG_LEVEL_ENV, "error", 1);
    EXPECT_EQ(castgrid::logging::levelFromEnvironment(), LogLevel::Error);
    ASSERT_TRUE(castgrid::logging::initializeFromConfig(path));
    EXPECT_EQ(castgrid::logging::getLevel(), LogLevel::Error);

    ::unsetenv(castgrid::logging::LOG_LEVEL_ENV);
    EXPECT_FALSE(castgrid::logging::levelFromEnvironment().has_value());
    ASSERT_TRUE(castgrid::logging::initializeFromConfig(path));
    EXPECT_EQ(castgrid::logging::getLevel(), LogLevel::Info);

    std::remove(path.c_str());
}

TEST(Logger, RateLimitedMacrosCompileAtCallSites) {
    for (int i = 0; i < 5; ++i) {
        LOG_EVERY_N(DEBUG, 3, "tick {}", i);
        LOG_ONCE(DEBUG, "first tick only");
        LOG_IF(DEBUG, i == 4, "last tick");
    }
    SUCCEED();
}
