#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>

namespace corvid::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

// Name of the Action member function invoked for each method. DELETE maps to 'del'
// because 'delete' is a reserved word.
inline constexpr std::string_view kMethodVerbs[] = {"get",     "head",    "post",  "put",  "del",
                                                    "connect", "options", "trace", "patch"};

static_assert(std::size(kMethodStrings) == kNbMethods && std::size(kMethodVerbs) == kNbMethods);

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<MethodIdx>(method)]; }

constexpr std::string_view MethodToVerb(Method method) { return kMethodVerbs[static_cast<MethodIdx>(method)]; }

// Case-sensitive match of a request line method token.
constexpr std::optional<Method> MethodFromStr(std::string_view str) {
  for (MethodIdx idx = 0; idx < kNbMethods; ++idx) {
    if (kMethodStrings[idx] == str) {
      return static_cast<Method>(idx);
    }
  }
  return std::nullopt;
}

}  // namespace corvid::http
