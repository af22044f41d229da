#include "arbor/router.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "arbor/log.hpp"
#include "arbor/node-tree.hpp"
#include "arbor/node.hpp"
#include "arbor/router-config.hpp"
#include "arbor/routing-error.hpp"
#include "arbor/segment-cursor.hpp"

namespace arbor {

namespace {

// Consumes the remaining segments of 'cursor', moving from 'start' with 'step' (the tree's active node or an
// independent NodeTree::Walker), and returns the handler-bearing node reached at the end.
template <class StepFunc>
const Node& Descend(SegmentCursor& cursor, Node& start, StepFunc step) {
  const Node* pNode = &start;
  while (std::optional<std::string_view> segment = cursor.next()) {
    pNode = step(*segment);
    if (pNode == nullptr) {
      throw RouteNotFoundError(cursor.str(), *segment);
    }
  }
  if (!pNode->hasHandler()) {
    throw InvalidRouteError(cursor.str(), pNode->key());
  }
  return *pNode;
}

}  // namespace

Router::Router(NodeTree nodeTree, FailureHandler failureHandler, RouterConfig config)
    : _nodeTree(std::move(nodeTree)), _failureHandler(std::move(failureHandler)), _config(std::move(config)) {
  _config.validate();
}

void Router::setConfig(RouterConfig config) {
  config.validate();
  _config = std::move(config);
}

const Node& Router::traverse(SegmentCursor& cursor) {
  _nodeTree.resetActiveNode();
  return Descend(cursor, _nodeTree.rootNode(), [this](std::string_view segment) {
    return _nodeTree.stepToChild(segment);
  });
}

const Node& Router::match(SegmentCursor& cursor) const {
  NodeTree::Walker walker = _nodeTree.walk();
  return Descend(cursor, _nodeTree.rootNode(), [&walker](std::string_view segment) { return walker.step(segment); });
}

std::string Router::dispatch(SegmentCursor& cursor) {
  log::log(_config.dispatchLogLevel, "Dispatching '{}'", cursor.path());

  const Node* pMatched;
  try {
    pMatched = &traverse(cursor);
  } catch (const RouteError& error) {
    // The 'no match' state of a failed step does not outlive the dispatch.
    if (_nodeTree.activeNode() == nullptr) {
      _nodeTree.resetActiveNode();
    }
    log::log(_config.failureLogLevel, "Routing failure: {}", error.what());
    if (!_failureHandler) {
      throw;
    }
    log::debug("Delegating failure on '{}' to the failure handler", error.path());
    return _failureHandler(error);
  }

  // Out of the try block: exceptions from the route handler always reach the caller.
  return pMatched->execute();
}

std::string Router::dispatch(std::string_view path) {
  SegmentCursor cursor(path);
  return dispatch(cursor);
}

}  // namespace arbor
