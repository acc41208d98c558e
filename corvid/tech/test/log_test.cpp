#include "corvid/log.hpp"

#include <gtest/gtest.h>

namespace corvid {

TEST(LogLevelFromName, KnownNames) {
  EXPECT_EQ(LogLevelFromName("trace"), log::level::trace);
  EXPECT_EQ(LogLevelFromName("warning"), log::level::warn);
  EXPECT_EQ(LogLevelFromName("critical"), log::level::critical);
  EXPECT_EQ(LogLevelFromName("off"), log::level::off);
}

TEST(LogLevelFromName, UnknownNames) {
  EXPECT_FALSE(LogLevelFromName(""));
  EXPECT_FALSE(LogLevelFromName("verbose"));
}

}  // namespace corvid
