#include "arbor/router-config.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>

#include "arbor/log.hpp"

namespace arbor {

namespace {

void ValidateLevel(std::string_view name, log::level::level_enum level) {
  if (level < log::level::trace || level > log::level::off) {
    throw std::invalid_argument(fmt::format("Invalid {} {}", name, static_cast<int>(level)));
  }
}

}  // namespace

void RouterConfig::validate() const {
  ValidateLevel("failure log level", failureLogLevel);
  ValidateLevel("dispatch log level", dispatchLogLevel);
}

RouterConfig& RouterConfig::withFailureLogLevel(log::level::level_enum level) {
  failureLogLevel = level;
  return *this;
}

RouterConfig& RouterConfig::withDispatchLogLevel(log::level::level_enum level) {
  dispatchLogLevel = level;
  return *this;
}

}  // namespace arbor
