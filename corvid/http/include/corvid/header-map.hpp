#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "corvid/string-equal-ignore-case.hpp"

namespace corvid::http {

// Header names are case-insensitive. A later occurrence of a name replaces the earlier one,
// except where the caller explicitly combines values.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLessFunc>;

inline std::optional<std::string_view> FindHeader(const HeaderMap& headers, std::string_view name) {
  auto it = headers.find(name);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

// True if the comma separated header value contains token (case-insensitive).
bool HeaderValueHasToken(std::string_view value, std::string_view token);

}  // namespace corvid::http
