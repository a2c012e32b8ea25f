#include <gtest/gtest.h>
#include "geoarea/log.hpp"

class LogTest : public ::testing::Test {
protected:
    void TearDown() override {
        geoarea::set_log_level(spdlog::level::warn);
    }
};

TEST_F(LogTest, RegisteredUnderLibraryName) {
    auto log = geoarea::logger();
    ASSERT_NE(log, nullptr);
    EXPECT_EQ(log->name(), geoarea::LOGGER_NAME);
    EXPECT_EQ(spdlog::get(geoarea::LOGGER_NAME), log);
    EXPECT_EQ(geoarea::logger(), log);
}

TEST_F(LogTest, StartsAtWarn) {
    EXPECT_EQ(geoarea::logger()->level(), spdlog::level::warn);
}

TEST_F(LogTest, SetLevelByName) {
    geoarea::set_log_level("debug");
    EXPECT_EQ(geoarea::logger()->level(), spdlog::level::debug);

    geoarea::set_log_level("off");
    EXPECT_EQ(geoarea::logger()->level(), spdlog::level::off);

    EXPECT_THROW(geoarea::set_log_level("loud"), std::invalid_argument);
    EXPECT_EQ(geoarea::logger()->level(), spdlog::level::off);
}
