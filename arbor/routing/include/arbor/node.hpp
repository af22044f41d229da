#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace arbor {

// A named vertex of the routing tree.
//
// A node exclusively owns its children (stored by strong reference, keyed by their own key) and keeps a
// non-owning back pointer to its parent, used only to trace paths upwards. A node has at most one parent
// at a time: attaching it somewhere else detaches it from its previous parent first.
//
// Nodes are handled through std::shared_ptr so that an external holder may keep a node alive after it
// has been removed from (or replaced in) its parent.
class Node {
 public:
  // Ordered positional arguments given to a handler.
  using HandlerArgs = std::span<const std::string_view>;

  // Route handler: an opaque callable whose result is returned as is to the caller of execute().
  // The result is a string body (a rendered page, a serialized payload) so that Node and Router stay
  // non-templated and a whole tree shares one handler type.
  using Handler = std::function<std::string(HandlerArgs)>;

  using Ptr = std::shared_ptr<Node>;

  // Children keyed by their key, iterated in key order.
  using ChildMap = std::map<std::string, Ptr, std::less<>>;

  // Creates a detached node. The stored key is the given key trimmed from surrounding blanks.
  // Throws EmptyKeyError if nothing is left after trimming.
  explicit Node(std::string_view key, Handler handler = {});

  // Convenience factory returning a shared node.
  static Ptr Create(std::string_view key, Handler handler = {}) {
    return std::make_shared<Node>(key, std::move(handler));
  }

  // Creates a node and immediately attaches it to 'parent', exactly like parent.addChild(node).
  static Ptr Create(std::string_view key, Handler handler, Node& parent);

  // Parent links of the remaining children are cleared so that externally held children never point
  // to a destroyed node.
  ~Node();

  // Children point back to their parent by address.
  Node(const Node&) = delete;
  Node(Node&&) = delete;
  Node& operator=(const Node&) = delete;
  Node& operator=(Node&&) = delete;

  [[nodiscard]] const std::string& key() const noexcept { return _key; }

  // Process-unique identifier, useful to tell apart nodes sharing the same key.
  [[nodiscard]] uint64_t id() const noexcept { return _id; }

  // String representation of a node: its key.
  [[nodiscard]] std::string_view str() const noexcept { return _key; }

  // Attach 'child' under this node, keyed by its own key.
  // - child is first detached from its current parent, if any
  // - a previous child with the same key is replaced and loses its parent link
  // Throws InvalidChildError if child is null, SelfReferenceError if child is this node or one of its ancestors.
  void addChild(Ptr child);

  // Applies addChild to each element in order. On error, elements before the offending one stay attached.
  void addChildren(std::span<const Ptr> children);

  void addChildren(std::initializer_list<Ptr> children) {
    addChildren(std::span<const Ptr>(children.begin(), children.size()));
  }

  // Array-style assignment: 'slotKey' must be equal to the child's key.
  // Throws ChildKeyMismatchError otherwise, and the same errors as addChild.
  void setChild(std::string_view slotKey, Ptr child);

  // Returns the child with exactly this key, or nullptr.
  [[nodiscard]] Node* child(std::string_view key) const noexcept;

  // Same as child, sharing ownership of the returned node (empty if there is no such child).
  [[nodiscard]] Ptr childPtr(std::string_view key) const noexcept;

  [[nodiscard]] bool hasChild(std::string_view key) const noexcept { return _children.contains(key); }

  // Detaches and returns the child with given key. Throws ChildNotFoundError if there is none.
  Ptr removeChild(std::string_view key);

  // Same as removeChild, but returns nullptr instead of throwing when there is no such child.
  Ptr tryRemoveChild(std::string_view key);

  // Removes this node from its parent, if it has one.
  // The returned pointer keeps the node alive if the parent was its only owner.
  Ptr detach();

  // Replaces (or clears, with an empty handler) the handler of this node.
  void setHandler(Handler handler) noexcept { _handler = std::move(handler); }

  [[nodiscard]] const Handler& handler() const noexcept { return _handler; }

  [[nodiscard]] bool hasHandler() const noexcept { return static_cast<bool>(_handler); }

  // Invokes the handler with given arguments and returns its result.
  // The handler may replace or clear itself, or detach its own node, while it runs.
  // Throws NoHandlerError if no handler is attached. Exceptions thrown by the handler propagate unchanged.
  std::string execute(HandlerArgs args = {}) const;

  // Variadic shorthand for execute: node("a", str, sv).
  template <class... Args>
  std::string operator()(const Args&... args) const {
    const std::array<std::string_view, sizeof...(Args)> argList{std::string_view(args)...};
    return execute(HandlerArgs(argList.data(), argList.size()));
  }

  [[nodiscard]] Node* parent() const noexcept { return _pParent; }

  [[nodiscard]] bool isLeaf() const noexcept { return _children.empty(); }

  [[nodiscard]] std::size_t childCount() const noexcept { return _children.size(); }

  [[nodiscard]] const ChildMap& children() const noexcept { return _children; }

 private:
  bool isSelfOrAncestor(const Node& node) const noexcept;

  Ptr releaseChild(ChildMap::iterator it);

  std::string _key;
  Handler _handler;
  ChildMap _children;
  Node* _pParent{nullptr};
  uint64_t _id;
};

}  // namespace arbor
