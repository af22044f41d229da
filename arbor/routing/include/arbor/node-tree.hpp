#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "arbor/node.hpp"
#include "arbor/vector.hpp"

namespace arbor {

// Wraps a root node and tracks an "active" node: the current traversal position in the tree.
//
// The active node is mutable state of the tree instance. Two traversals running at the same time on one
// NodeTree would corrupt each other's position: use one NodeTree per concurrent traversal (copies share the
// node structure but not the active node), or independent Walker objects for read-only lookups.
//
// The active node is always the root or a node reachable from it. If the active node leaves the tree
// (removed, replaced or detached from it, or the tree re-rooted elsewhere), the tree falls back to the root.
class NodeTree {
 public:
  using PathKeys = vector<std::string>;

  // Traversal position inside a tree, as a value.
  // The position shares ownership of its node, so it stays valid even if the node is removed from its tree.
  // A Walker whose step failed points to no node (node() == nullptr) and stays there until reset.
  class Walker {
   public:
    explicit Walker(Node::Ptr start) noexcept : _pNode(std::move(start)) {}

    [[nodiscard]] Node* node() const noexcept { return _pNode.get(); }

    // Moves to the child of the current node with given key and returns it.
    // If there is no such child, moves to the 'no node' state and returns nullptr.
    Node* step(std::string_view key) noexcept {
      if (_pNode) {
        _pNode = _pNode->childPtr(key);
      }
      return _pNode.get();
    }

    void reset(Node::Ptr start) noexcept { _pNode = std::move(start); }

   private:
    Node::Ptr _pNode;
  };

  // Creates a tree whose active node is 'rootNode'.
  // Throws std::invalid_argument if rootNode is null.
  explicit NodeTree(Node::Ptr rootNode);

  // Active node, or nullptr if the last step did not find a matching child.
  [[nodiscard]] Node* activeNode() const noexcept;

  [[nodiscard]] Node& rootNode() const noexcept { return *_pRootNode; }

  [[nodiscard]] const Node::Ptr& rootNodePtr() const noexcept { return _pRootNode; }

  // Makes the root the active node again.
  void resetActiveNode() noexcept { _active.reset(_pRootNode); }

  // Moves the active node to its child with given key and returns it.
  // If there is no such child, the active node becomes nullptr (no match) and nullptr is returned.
  Node* stepToChild(std::string_view key) noexcept;

  // Shorthand for stepToChild.
  Node* operator()(std::string_view key) noexcept { return stepToChild(key); }

  // Replaces the root and resets the active node to it.
  // Nodes only reachable from the previous root are no longer members of this tree.
  // Throws std::invalid_argument if rootNode is null.
  void setRootNode(Node::Ptr rootNode);

  // Returns a new traversal position starting at the root, independent from the active node.
  [[nodiscard]] Walker walk() const noexcept { return Walker(_pRootNode); }

  // Keys of 'node' and its ancestors, from the top-most one down to 'node' itself, stopping before 'pStopAt'.
  // - pStopAt == nullptr: walks up to the top of the chain, whose key is included
  // - node is pStopAt: empty result
  // Throws NodeNotInTreeError if pStopAt is not null and not an ancestor of node.
  static PathKeys TracePathKeys(const Node& node, const Node* pStopAt = nullptr);

  // Path keys of 'node' below the root (root key excluded).
  // Throws NodeNotInTreeError if node is not reachable from the root.
  [[nodiscard]] PathKeys pathKeys(const Node& node) const { return TracePathKeys(node, _pRootNode.get()); }

  // Tells whether node is the root or one of its descendants.
  [[nodiscard]] bool contains(const Node& node) const noexcept;

 private:
  Node::Ptr _pRootNode;
  Walker _active;
};

}  // namespace arbor
