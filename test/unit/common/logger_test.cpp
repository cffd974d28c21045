#include <gtest/gtest.h>

#include "kgraph/common/logger.h"

namespace kgraph {
namespace common {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Init();
        saved_ = spdlog::get_level();
    }
    void TearDown() override { spdlog::set_level(saved_); }

    spdlog::level::level_enum saved_ = spdlog::level::info;
};

TEST_F(LoggerTest, InitIsRepeatable) {
    Logger::Init();
    ASSERT_NE(spdlog::get("kgraph"), nullptr);
    EXPECT_EQ(spdlog::default_logger()->name(), "kgraph");
}

TEST_F(LoggerTest, LevelByName) {
    EXPECT_TRUE(Logger::SetLevel("debug"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    EXPECT_TRUE(Logger::SetLevel("off"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
}

TEST_F(LoggerTest, UnknownNameKeepsLevel) {
    Logger::SetLevel(spdlog::level::warn);
    EXPECT_FALSE(Logger::SetLevel("shouting"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}

} // namespace
} // namespace common
} // namespace kgraph
