#pragma once

#include "arbor/log.hpp"

namespace arbor {

struct RouterConfig {
  // Check that the configuration is usable, throws std::invalid_argument otherwise.
  void validate() const;

  // Level used to log routing failures (no matching child, handler-less route), whether they are then
  // delegated to the failure handler or thrown to the caller.
  // Default: debug
  log::level::level_enum failureLogLevel{log::level::debug};

  // Level used to log the start of each dispatch together with the dispatched path.
  // Default: trace
  log::level::level_enum dispatchLogLevel{log::level::trace};

  RouterConfig& withFailureLogLevel(log::level::level_enum level);

  RouterConfig& withDispatchLogLevel(log::level::level_enum level);
};

}  // namespace arbor
