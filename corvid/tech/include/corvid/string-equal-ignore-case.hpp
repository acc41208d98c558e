#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace corvid {

constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch + ('a' - 'A')) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  const auto lhsSize = lhs.size();
  if (lhsSize != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type charPos{}; charPos < lhsSize; ++charPos) {
    if (tolower(lhs[charPos]) != tolower(rhs[charPos])) {
      return false;
    }
  }
  return true;
}

constexpr bool CaseInsensitiveLess(std::string_view lhs, std::string_view rhs) {
  const auto lhsSize = lhs.size();
  const auto rhsSize = rhs.size();
  for (std::string_view::size_type charPos = 0; charPos < lhsSize && charPos < rhsSize; ++charPos) {
    const auto lhsChar = tolower(lhs[charPos]);
    const auto rhsChar = tolower(rhs[charPos]);
    if (lhsChar != rhsChar) {
      return lhsChar < rhsChar;
    }
  }
  return lhsSize < rhsSize;
}

// Transparent comparator for associative containers keyed by header-like names.
struct CaseInsensitiveLessFunc {
  using is_transparent = void;

  bool operator()(std::string_view lhs, std::string_view rhs) const noexcept { return CaseInsensitiveLess(lhs, rhs); }
};

inline std::string ToLower(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = tolower(ch);
  }
  return ret;
}

}  // namespace corvid
