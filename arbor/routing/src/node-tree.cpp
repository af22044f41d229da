#include "arbor/node-tree.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "arbor/log.hpp"
#include "arbor/node.hpp"
#include "arbor/routing-error.hpp"

namespace arbor {

namespace {

const Node::Ptr& CheckedRoot(const Node::Ptr& rootNode) {
  if (!rootNode) {
    throw std::invalid_argument("NodeTree requires a root node");
  }
  return rootNode;
}

}  // namespace

NodeTree::NodeTree(Node::Ptr rootNode) : _pRootNode(std::move(rootNode)), _active(CheckedRoot(_pRootNode)) {}

void NodeTree::setRootNode(Node::Ptr rootNode) {
  log::debug("Replacing root node '{}' with '{}'", _pRootNode->key(), CheckedRoot(rootNode)->key());
  _pRootNode = std::move(rootNode);
  resetActiveNode();
}

Node* NodeTree::activeNode() const noexcept {
  Node* pActive = _active.node();
  if (pActive != nullptr && !contains(*pActive)) {
    return _pRootNode.get();
  }
  return pActive;
}

Node* NodeTree::stepToChild(std::string_view key) noexcept {
  const Node* pActive = _active.node();
  if (pActive != nullptr && !contains(*pActive)) {
    resetActiveNode();
  }
  return _active.step(key);
}

NodeTree::PathKeys NodeTree::TracePathKeys(const Node& node, const Node* pStopAt) {
  PathKeys keys;
  const Node* pCur = &node;
  for (; pCur != nullptr && pCur != pStopAt; pCur = pCur->parent()) {
    keys.emplace_back(pCur->key());
  }

  if (pStopAt != nullptr && pCur != pStopAt) {
    throw NodeNotInTreeError(node.key(), pStopAt->key());
  }

  std::ranges::reverse(keys);
  return keys;
}

bool NodeTree::contains(const Node& node) const noexcept {
  for (const Node* pCur = &node; pCur != nullptr; pCur = pCur->parent()) {
    if (pCur == _pRootNode.get()) {
      return true;
    }
  }
  return false;
}

}  // namespace arbor
