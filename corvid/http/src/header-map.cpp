#include "corvid/header-map.hpp"

#include <string_view>

#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/string-trim.hpp"

namespace corvid::http {

bool HeaderValueHasToken(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    const std::string_view part = TrimOws(value.substr(0, commaPos));
    if (CaseInsensitiveEqual(part, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace corvid::http
