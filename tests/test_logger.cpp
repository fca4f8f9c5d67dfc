// Test: Component logging
// Named component loggers, per-component levels and the logging macros

#define SAMS_LOG_COMPONENT "logger_test"

#include <gtest/gtest.h>
#include "utils/logger.h"
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using sams::utils::Logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::initWithSinks({std::make_shared<spdlog::sinks::ostream_sink_mt>(out_)}, Logger::Level::INFO);
        Logger::setPattern("[%n] [%l] %v");
    }

    void TearDown() override {
        Logger::shutdown();
    }

    bool logged(const std::string& line) const {
        return out_.str().find(line) != std::string::npos;
    }

    std::ostringstream out_;
};

TEST_F(LoggerTest, ComponentNameIsPartOfEveryLine) {
    Logger::info("router", "write to {}", "A");
    EXPECT_TRUE(logged("[sams.router] [info] write to A"));
}

TEST_F(LoggerTest, MacrosLogUnderTheFileComponent) {
    SAMS_WARN("{} rows left", 3);
    EXPECT_TRUE(logged("[sams.logger_test] [warning] 3 rows left"));
}

TEST_F(LoggerTest, ComponentLevelOverridesRootLevel) {
    Logger::setComponentLevel("migration", Logger::Level::WARN);

    Logger::info("migration", "hidden");
    Logger::warn("migration", "kept");
    Logger::info("router", "shown");

    EXPECT_FALSE(logged("hidden"));
    EXPECT_TRUE(logged("[sams.migration] [warning] kept"));
    EXPECT_TRUE(logged("[sams.router] [info] shown"));
}

TEST_F(LoggerTest, OverrideAppliesToLoggerCreatedEarlier) {
    Logger::debug("health", "before");
    Logger::setComponentLevel("health", Logger::Level::DEBUG);
    Logger::debug("health", "after");

    EXPECT_FALSE(logged("before"));
    EXPECT_TRUE(logged("[sams.health] [debug] after"));
}

TEST_F(LoggerTest, RootLevelReachesComponentsWithoutOverride) {
    Logger::setComponentLevel("rebalance", Logger::Level::INFO);
    Logger::setLevel(Logger::Level::ERROR);

    Logger::warn("router", "dropped");
    Logger::info("rebalance", "still here");

    EXPECT_FALSE(logged("dropped"));
    EXPECT_TRUE(logged("still here"));
}

TEST_F(LoggerTest, ConfiguredLevelsAreParsed) {
    Logger::setComponentLevels({{"health", "debug"}, {"scatter_gather", "ERROR"}});

    EXPECT_EQ(Logger::getComponentLevel("health"), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::getComponentLevel("scatter_gather"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::getComponentLevel("router"), Logger::Level::INFO);
}

TEST(LoggerLevelTest, LevelNames) {
    EXPECT_EQ(Logger::levelFromString("WARNING"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("crit"), Logger::Level::CRITICAL);
    EXPECT_EQ(Logger::levelFromString("verbose"), Logger::Level::INFO);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::TRACE), "trace");
}
