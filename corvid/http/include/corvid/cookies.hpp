#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/string-equal-ignore-case.hpp"

namespace corvid::http {

using CookieMap = std::map<std::string, std::string, std::less<>>;

// Parse a request "Cookie" header value: "a=1; b=2". Names and values are trimmed, pairs without '=' are ignored.
void ParseCookieHeader(std::string_view headerValue, CookieMap& cookies);

// A cookie set by a server response.
struct ResponseCookie {
  std::string name;
  std::string value;
  std::string path;
  std::string domain;
  std::optional<int64_t> maxAge;
  bool httpOnly{false};
  bool secure{false};

  // "name=value; Path=/; Max-Age=10; HttpOnly"
  [[nodiscard]] std::string serialize() const;
};

// A cookie as received by a client in a "Set-Cookie" header.
struct ClientCookie {
  std::string value;
  bool httpOnly{false};
  bool secure{false};
  // Remaining attributes (Path, Domain, Expires, Max-Age, SameSite...) with their raw value.
  std::map<std::string, std::string, CaseInsensitiveLessFunc> attributes;

  bool operator==(const ClientCookie&) const = default;
};

// Parse a "Set-Cookie" header value. Returns std::nullopt if it has no "name=value" leading pair.
std::optional<std::pair<std::string, ClientCookie>> ParseSetCookie(std::string_view headerValue);

}  // namespace corvid::http
