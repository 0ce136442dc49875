#include <labelscan/core/logging.hpp>
#include <gtest/gtest.h>

namespace nc = labelscan::core;

TEST(Logging, SharedNamedLogger) {
  auto a = nc::logger();
  auto b = nc::logger();
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a, b);
  EXPECT_EQ(a->name(), "labelscan");
}

TEST(Logging, SetLevelByName) {
  EXPECT_TRUE(nc::set_log_level("debug"));
  EXPECT_EQ(nc::logger()->level(), spdlog::level::debug);
  EXPECT_TRUE(nc::set_log_level("off"));
  EXPECT_EQ(nc::logger()->level(), spdlog::level::off);
  EXPECT_TRUE(nc::set_log_level("warn"));
}

TEST(Logging, UnknownLevelLeavesLevelUnchanged) {
  ASSERT_TRUE(nc::set_log_level("error"));
  EXPECT_FALSE(nc::set_log_level("loud"));
  EXPECT_EQ(nc::logger()->level(), spdlog::level::err);
  nc::set_log_level("warn");
}
