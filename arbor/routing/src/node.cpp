#include "arbor/node.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "arbor/log.hpp"
#include "arbor/routing-error.hpp"
#include "arbor/string-trim.hpp"

namespace arbor {

namespace {

uint64_t NextNodeId() noexcept {
  static std::atomic<uint64_t> gNextId{1};
  return gNextId.fetch_add(1, std::memory_order_relaxed);
}

std::string ValidatedKey(std::string_view rawKey) {
  const std::string_view key = TrimSpaces(rawKey);
  if (key.empty()) {
    throw EmptyKeyError(rawKey);
  }
  return std::string(key);
}

}  // namespace

Node::Node(std::string_view key, Handler handler)
    : _key(ValidatedKey(key)), _handler(std::move(handler)), _id(NextNodeId()) {}

Node::Ptr Node::Create(std::string_view key, Handler handler, Node& parent) {
  Ptr node = Create(key, std::move(handler));
  parent.addChild(node);
  return node;
}

Node::~Node() {
  for (auto& [childKey, child] : _children) {
    child->_pParent = nullptr;
  }
}

bool Node::isSelfOrAncestor(const Node& node) const noexcept {
  for (const Node* pCur = this; pCur != nullptr; pCur = pCur->_pParent) {
    if (pCur == &node) {
      return true;
    }
  }
  return false;
}

void Node::addChild(Ptr child) {
  if (!child) {
    throw InvalidChildError(_key);
  }
  if (isSelfOrAncestor(*child)) {
    throw SelfReferenceError(child->_key);
  }

  // 'child' keeps the node alive while it leaves its previous parent.
  if (child->_pParent == this) {
    return;
  }
  child->detach();

  auto [it, inserted] = _children.try_emplace(child->_key);
  if (!inserted) {
    log::debug("Replacing child '{}' of node '{}'", it->first, _key);
    it->second->_pParent = nullptr;
  }
  child->_pParent = this;
  it->second = std::move(child);
}

void Node::addChildren(std::span<const Ptr> children) {
  for (const Ptr& child : children) {
    addChild(child);
  }
}

void Node::setChild(std::string_view slotKey, Ptr child) {
  if (!child) {
    throw InvalidChildError(_key);
  }
  if (slotKey != child->_key) {
    throw ChildKeyMismatchError(slotKey, child->_key);
  }
  addChild(std::move(child));
}

Node* Node::child(std::string_view key) const noexcept {
  const auto it = _children.find(key);
  return it == _children.end() ? nullptr : it->second.get();
}

Node::Ptr Node::childPtr(std::string_view key) const noexcept {
  const auto it = _children.find(key);
  return it == _children.end() ? nullptr : it->second;
}

Node::Ptr Node::releaseChild(ChildMap::iterator it) {
  Ptr released = std::move(it->second);
  _children.erase(it);
  released->_pParent = nullptr;
  log::trace("Removed child '{}' from node '{}'", released->_key, _key);
  return released;
}

Node::Ptr Node::removeChild(std::string_view key) {
  const auto it = _children.find(key);
  if (it == _children.end()) {
    throw ChildNotFoundError(_key, key);
  }
  return releaseChild(it);
}

Node::Ptr Node::tryRemoveChild(std::string_view key) {
  const auto it = _children.find(key);
  if (it == _children.end()) {
    return nullptr;
  }
  return releaseChild(it);
}

Node::Ptr Node::detach() {
  if (_pParent == nullptr) {
    return nullptr;
  }
  return _pParent->releaseChild(_pParent->_children.find(_key));
}

std::string Node::execute(HandlerArgs args) const {
  if (!_handler) {
    throw NoHandlerError(_key);
  }
  // Run a copy: the handler may reset '_handler' (and its captures) during the call.
  const Handler handler = _handler;
  return handler(args);
}

}  // namespace arbor
