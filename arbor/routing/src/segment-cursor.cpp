#include "arbor/segment-cursor.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace arbor {

namespace {

std::string JoinSegments(std::span<const std::string> segments) {
  std::size_t sz = 1U;
  for (const auto& segment : segments) {
    sz += segment.size() + 1U;
  }

  std::string out;
  out.reserve(sz);
  for (const auto& segment : segments) {
    out.push_back(SegmentCursor::kSeparator);
    out.append(segment);
  }
  if (out.empty()) {
    out.push_back(SegmentCursor::kSeparator);
  }
  return out;
}

}  // namespace

SegmentCursor::SegmentCursor(std::string_view path) : _path(path) {
  std::size_t pos = 0;
  while (pos < path.size()) {
    std::size_t nextSlash = path.find(kSeparator, pos);
    if (nextSlash == std::string_view::npos) {
      nextSlash = path.size();
    }
    if (nextSlash != pos) {
      _segments.emplace_back(path.substr(pos, nextSlash - pos));
    }
    pos = nextSlash + 1U;
  }
}

SegmentCursor SegmentCursor::FromSegments(std::span<const std::string_view> segments) {
  SegmentCursor cursor;
  cursor._segments.reserve(static_cast<SegmentVector::size_type>(segments.size()));
  for (std::string_view segment : segments) {
    cursor._segments.emplace_back(segment);
  }
  cursor._path = cursor.str();
  return cursor;
}

SegmentCursor::SegmentVector SegmentCursor::remainingSegments() {
  SegmentVector unused;
  unused.reserve(size() - _pos);
  while (hasNext()) {
    unused.emplace_back(_segments[_pos++]);
  }
  return unused;
}

std::string SegmentCursor::str() const { return JoinSegments(segments()); }

bool SegmentCursor::operator==(const SegmentCursor& other) const noexcept {
  return std::ranges::equal(segments(), other.segments());
}

}  // namespace arbor
