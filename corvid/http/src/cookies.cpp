#include "corvid/cookies.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/string-trim.hpp"

namespace corvid::http {

namespace {

// Calls func(name, value, hasEq) for each ';' separated element of str.
template <class Func>
void ForEachSemicolonPair(std::string_view str, Func&& func) {
  while (!str.empty()) {
    const auto sepPos = str.find(';');
    const std::string_view part = str.substr(0, sepPos);
    const auto eqPos = part.find('=');
    if (eqPos == std::string_view::npos) {
      func(TrimOws(part), std::string_view{}, false);
    } else {
      func(TrimOws(part.substr(0, eqPos)), TrimOws(part.substr(eqPos + 1)), true);
    }
    if (sepPos == std::string_view::npos) {
      break;
    }
    str.remove_prefix(sepPos + 1);
  }
}

std::string_view Unquote(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace

void ParseCookieHeader(std::string_view headerValue, CookieMap& cookies) {
  ForEachSemicolonPair(headerValue, [&cookies](std::string_view name, std::string_view value, bool hasEq) {
    if (hasEq && !name.empty()) {
      cookies.insert_or_assign(std::string(name), std::string(Unquote(value)));
    }
  });
}

std::string ResponseCookie::serialize() const {
  std::string ret(name);
  ret.push_back('=');
  ret.append(value);
  if (!path.empty()) {
    ret.append("; Path=").append(path);
  }
  if (!domain.empty()) {
    ret.append("; Domain=").append(domain);
  }
  if (maxAge) {
    ret.append("; Max-Age=").append(std::to_string(*maxAge));
  }
  if (secure) {
    ret.append("; Secure");
  }
  if (httpOnly) {
    ret.append("; HttpOnly");
  }
  return ret;
}

std::optional<std::pair<std::string, ClientCookie>> ParseSetCookie(std::string_view headerValue) {
  std::optional<std::pair<std::string, ClientCookie>> ret;
  bool first = true;
  bool invalid = false;
  ForEachSemicolonPair(headerValue, [&](std::string_view name, std::string_view value, bool hasEq) {
    if (first) {
      first = false;
      if (!hasEq || name.empty()) {
        invalid = true;
        return;
      }
      ret.emplace(std::string(name), ClientCookie{});
      ret->second.value = std::string(Unquote(value));
      return;
    }
    if (invalid || name.empty()) {
      return;
    }
    if (CaseInsensitiveEqual(name, "HttpOnly")) {
      ret->second.httpOnly = true;
    } else if (CaseInsensitiveEqual(name, "Secure")) {
      ret->second.secure = true;
    } else {
      ret->second.attributes.insert_or_assign(std::string(name), std::string(value));
    }
  });
  if (invalid) {
    return std::nullopt;
  }
  return ret;
}

}  // namespace corvid::http
