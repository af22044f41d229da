#pragma once

#include <string_view>

namespace arbor {

constexpr bool IsTrimmableSpace(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\0';
}

// Trim leading and trailing blanks (SP, HTAB, CR, LF, VT and NUL).
constexpr std::string_view TrimSpaces(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && IsTrimmableSpace(*begin)) {
    ++begin;
  }
  while (begin != end) {
    --end;
    if (!IsTrimmableSpace(*end)) {
      ++end;
      break;
    }
  }
  return {begin, end};
}

}  // namespace arbor
