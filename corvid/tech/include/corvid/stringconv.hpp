#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string_view>
#include <system_error>

namespace corvid {

// Strict conversion of the whole input. Returns std::nullopt on empty input, trailing garbage or overflow.
template <std::integral T>
std::optional<T> StringToIntegral(std::string_view str, int base = 10) {
  T value{};
  const char* end = str.data() + str.size();
  auto [ptr, errc] = std::from_chars(str.data(), end, value, base);
  if (str.empty() || errc != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

template <std::floating_point T>
std::optional<T> StringToFloating(std::string_view str) {
  T value{};
  const char* end = str.data() + str.size();
  auto [ptr, errc] = std::from_chars(str.data(), end, value);
  if (str.empty() || errc != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace corvid
