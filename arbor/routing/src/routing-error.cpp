#include "arbor/routing-error.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace arbor {

EmptyKeyError::EmptyKeyError(std::string_view rawKey)
    : NodeError(fmt::format("Node key cannot be empty (got '{}')", rawKey)) {}

SelfReferenceError::SelfReferenceError(std::string_view key)
    : NodeError(fmt::format("Node '{}' cannot be a child of itself or of one of its descendants", key)) {}

InvalidChildError::InvalidChildError(std::string_view parentKey)
    : NodeError(fmt::format("Only valid nodes can be added as children of '{}'", parentKey)) {}

ChildNotFoundError::ChildNotFoundError(std::string_view parentKey, std::string_view childKey)
    : NodeError(fmt::format("Node '{}' has no child '{}'", parentKey, childKey)) {}

ChildKeyMismatchError::ChildKeyMismatchError(std::string_view slotKey, std::string_view childKey)
    : NodeError(fmt::format("Slot key '{}' does not match child key '{}'", slotKey, childKey)) {}

NoHandlerError::NoHandlerError(std::string_view key) : NodeError(fmt::format("Node '{}' has no handler", key)) {}

NodeNotInTreeError::NodeNotInTreeError(std::string_view nodeKey, std::string_view stopAtKey)
    : std::logic_error(fmt::format("Node '{}' is not under the specified stop node '{}'", nodeKey, stopAtKey)) {}

RouteError::RouteError(const std::string& what, std::string_view path) : std::runtime_error(what), _path(path) {}

RouteNotFoundError::RouteNotFoundError(std::string_view path, std::string_view segment)
    : RouteError(fmt::format("No route for '{}': segment '{}' has no match", path, segment), path),
      _segment(segment) {}

InvalidRouteError::InvalidRouteError(std::string_view path, std::string_view nodeKey)
    : RouteError(fmt::format("Route '{}' reaches node '{}' which has no handler", path, nodeKey), path),
      _nodeKey(nodeKey) {}

}  // namespace arbor
