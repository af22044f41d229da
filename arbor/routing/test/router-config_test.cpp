#include "arbor/router-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "arbor/log.hpp"

namespace arbor {

TEST(RouterConfigTest, DefaultsAreValid) {
  RouterConfig config;

  EXPECT_EQ(config.failureLogLevel, log::level::debug);
  EXPECT_EQ(config.dispatchLogLevel, log::level::trace);
  EXPECT_NO_THROW(config.validate());
}

TEST(RouterConfigTest, FluentSetters) {
  auto config = RouterConfig{}.withFailureLogLevel(log::level::err).withDispatchLogLevel(log::level::off);

  EXPECT_EQ(config.failureLogLevel, log::level::err);
  EXPECT_EQ(config.dispatchLogLevel, log::level::off);
  EXPECT_NO_THROW(config.validate());
}

TEST(RouterConfigTest, OutOfRangeLevelsAreInvalid) {
  RouterConfig config;

  config.failureLogLevel = static_cast<log::level::level_enum>(-1);
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config.failureLogLevel = log::level::info;
  config.dispatchLogLevel = static_cast<log::level::level_enum>(log::level::n_levels);
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

}  // namespace arbor
