#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "arbor/node-tree.hpp"
#include "arbor/node.hpp"
#include "arbor/router-config.hpp"
#include "arbor/routing-error.hpp"
#include "arbor/segment-cursor.hpp"

namespace arbor {

// Matches a path, segment by segment, against a NodeTree and invokes the handler of the node it ends on.
//
// Dispatch algorithm:
//   1. The tree's active node is reset to the root (the cursor is not rewound: pass a fresh cursor per call).
//   2. Each segment of the cursor steps the tree to the child keyed by it.
//   3. A segment without matching child fails with RouteNotFoundError (the active node is then reset to the root).
//   4. Once all segments are consumed, the active node must have a handler, otherwise InvalidRouteError.
//   5. The handler is invoked without arguments and its result is returned.
// An empty path matches the root itself.
//
// If a failure handler is installed, RouteError failures of steps 2 to 4 are given to it and its result is
// returned instead. Exceptions thrown by the route handler itself are never intercepted.
//
// Threading: a dispatch mutates the active node of the tree. Concurrent dispatches on the same Router are
// not supported without external synchronization.
class Router {
 public:
  // Receives the routing failure and returns the value substituted for the dispatch result.
  using FailureHandler = std::function<std::string(const RouteError&)>;

  // Creates a Router over given tree, with an optional failure handler.
  // Throws std::invalid_argument if config is invalid.
  explicit Router(NodeTree nodeTree, FailureHandler failureHandler = {}, RouterConfig config = {});

  // Route the segments of 'cursor' and return the result of the matched handler (or of the failure handler).
  std::string dispatch(SegmentCursor& cursor);

  // Same as above, with a fresh cursor built from 'path'.
  std::string dispatch(std::string_view path);

  // Shorthand for dispatch.
  std::string operator()(SegmentCursor& cursor) { return dispatch(cursor); }

  std::string operator()(std::string_view path) { return dispatch(path); }

  // Resolve the handler-bearing node for 'cursor' without invoking it.
  // The tree's active node is left untouched, and failures are always thrown (never given to the failure handler).
  [[nodiscard]] const Node& match(SegmentCursor& cursor) const;

  [[nodiscard]] NodeTree& nodeTree() noexcept { return _nodeTree; }
  [[nodiscard]] const NodeTree& nodeTree() const noexcept { return _nodeTree; }

  void setNodeTree(NodeTree nodeTree) noexcept { _nodeTree = std::move(nodeTree); }

  [[nodiscard]] const FailureHandler& failureHandler() const noexcept { return _failureHandler; }

  // Install (or remove, with an empty handler) the failure handler.
  void setFailureHandler(FailureHandler failureHandler) noexcept { _failureHandler = std::move(failureHandler); }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Throws std::invalid_argument if config is invalid, in which case the current one is kept.
  void setConfig(RouterConfig config);

 private:
  const Node& traverse(SegmentCursor& cursor);

  NodeTree _nodeTree;
  FailureHandler _failureHandler;
  RouterConfig _config;
};

}  // namespace arbor
