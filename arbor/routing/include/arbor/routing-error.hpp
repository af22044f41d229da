#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace arbor {

// Structural errors raised by Node operations. They always propagate to the immediate caller.
class NodeError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// A node key is empty once blanks are trimmed.
class EmptyKeyError : public NodeError {
 public:
  explicit EmptyKeyError(std::string_view rawKey);
};

// A node was added as a child of itself (or of one of its descendants).
class SelfReferenceError : public NodeError {
 public:
  explicit SelfReferenceError(std::string_view key);
};

// A null node was supplied where a child node is required.
class InvalidChildError : public NodeError {
 public:
  explicit InvalidChildError(std::string_view parentKey);
};

class ChildNotFoundError : public NodeError {
 public:
  ChildNotFoundError(std::string_view parentKey, std::string_view childKey);
};

// Array-style child assignment with a key that differs from the child's own key.
class ChildKeyMismatchError : public NodeError {
 public:
  ChildKeyMismatchError(std::string_view slotKey, std::string_view childKey);
};

class NoHandlerError : public NodeError {
 public:
  explicit NoHandlerError(std::string_view key);
};

// Path tracing walked the whole parent chain without meeting the requested stop node.
class NodeNotInTreeError : public std::logic_error {
 public:
  NodeNotInTreeError(std::string_view nodeKey, std::string_view stopAtKey);
};

// Base of the router taxonomy: the only errors a Router failure handler may intercept.
class RouteError : public std::runtime_error {
 public:
  // Canonical path of the dispatched cursor.
  [[nodiscard]] const std::string& path() const noexcept { return _path; }

 protected:
  RouteError(const std::string& what, std::string_view path);

 private:
  std::string _path;
};

class RouteNotFoundError : public RouteError {
 public:
  RouteNotFoundError(std::string_view path, std::string_view segment);

  // Segment for which no matching child exists.
  [[nodiscard]] const std::string& segment() const noexcept { return _segment; }

 private:
  std::string _segment;
};

// Traversal ended on an existing node that has no handler.
class InvalidRouteError : public RouteError {
 public:
  InvalidRouteError(std::string_view path, std::string_view nodeKey);

  [[nodiscard]] const std::string& nodeKey() const noexcept { return _nodeKey; }

 private:
  std::string _nodeKey;
};

}  // namespace arbor
