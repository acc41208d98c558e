#pragma once

namespace corvid {

// Returns the value of an hexadecimal digit (either case), or -1 if ch is not one.
constexpr int from_hex_digit(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

inline constexpr char kHexDigitsUpper[] = "0123456789ABCDEF";

}  // namespace corvid
