#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "arbor/vector.hpp"

namespace arbor {

// Splits a path into its non-empty '/'-separated segments and hands them out one at a time.
// Leading, trailing and repeated separators produce no segment, so "/login//" and "login" yield
// the same single segment.
//
// Returned string_views point into the cursor's own storage and stay valid as long as the cursor
// is alive.
class SegmentCursor {
 public:
  static constexpr char kSeparator = '/';

  using SegmentVector = vector<std::string>;

  // Creates a cursor with no segment. Its canonical form is "/".
  SegmentCursor() : _path(1U, kSeparator) {}

  // Creates a cursor from a raw path.
  explicit SegmentCursor(std::string_view path);

  // Creates a cursor directly from an ordered list of segments.
  // The path is reconstructed as '/' followed by the segments joined with '/'.
  static SegmentCursor FromSegments(std::span<const std::string_view> segments);

  static SegmentCursor FromSegments(std::initializer_list<std::string_view> segments) {
    return FromSegments(std::span<const std::string_view>(segments.begin(), segments.size()));
  }

  // Tells whether some segments are still unconsumed.
  [[nodiscard]] bool hasNext() const noexcept { return _pos < _segments.size(); }

  // Returns the segment at the current position and advances by one, or std::nullopt if exhausted.
  std::optional<std::string_view> next() noexcept {
    if (!hasNext()) {
      return std::nullopt;
    }
    return std::string_view(_segments[_pos++]);
  }

  // Shorthand for next().
  std::optional<std::string_view> operator()() noexcept { return next(); }

  // Returns the segment at the current position without consuming it, or std::nullopt if exhausted.
  [[nodiscard]] std::optional<std::string_view> current() const noexcept {
    if (!hasNext()) {
      return std::nullopt;
    }
    return std::string_view(_segments[_pos]);
  }

  // Rewinds to the first segment. The segments themselves are untouched.
  SegmentCursor& reset() noexcept {
    _pos = 0;
    return *this;
  }

  // Returns all unconsumed segments, in order, and moves the cursor to the end.
  SegmentVector remainingSegments();

  // 0-based index of the next segment to be consumed, in [0, size()].
  [[nodiscard]] uint32_t position() const noexcept { return _pos; }

  [[nodiscard]] uint32_t size() const noexcept { return static_cast<uint32_t>(_segments.size()); }

  [[nodiscard]] std::span<const std::string> segments() const noexcept {
    return {_segments.data(), _segments.size()};
  }

  // Path this cursor was built from, as given.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Canonical form: '/' followed by the segments joined with '/'.
  [[nodiscard]] std::string str() const;

  // Two cursors are equal when they hold the same segment sequence, whatever their positions.
  bool operator==(const SegmentCursor& other) const noexcept;

 private:
  SegmentVector _segments;
  std::string _path;
  uint32_t _pos{};
};

}  // namespace arbor
