#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace corvid::http {

struct Version {
  uint8_t major{1};
  uint8_t minor{1};

  bool operator==(const Version&) const noexcept = default;
};

inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

inline constexpr std::string_view kHttp10 = "HTTP/1.0";
inline constexpr std::string_view kHttp11 = "HTTP/1.1";

constexpr std::string_view VersionToStr(Version version) { return version == HTTP_1_0 ? kHttp10 : kHttp11; }

// Parses "HTTP/x.y" (single digits). Returns std::nullopt if the token is not of that form.
constexpr std::optional<Version> ParseVersion(std::string_view token) {
  if (token.size() != 8 || token.substr(0, 5) != "HTTP/" || token[6] != '.' || token[5] < '0' || token[5] > '9' ||
      token[7] < '0' || token[7] > '9') {
    return std::nullopt;
  }
  return Version{static_cast<uint8_t>(token[5] - '0'), static_cast<uint8_t>(token[7] - '0')};
}

}  // namespace corvid::http
