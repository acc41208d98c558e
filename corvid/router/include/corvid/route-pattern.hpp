#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "corvid/param-coercion.hpp"
#include "corvid/param-value.hpp"

namespace corvid {

// Regular expression (ECMAScript flavour) whose capturing groups may be named and typed.
//
// Group syntax:
//  - "(name:sub)"        named group. If name is itself a known type tag (number, word, int...)
//                        the captured text is coerced to that type, otherwise it stays a string.
//  - "(name<tag>:sub)"   named group with an explicit type tag. An unknown tag is rejected.
//  - "(sub)"             positional string group, exposed under its 1-based capture index ("1", "2"...).
//  - "(?...)"            non capturing constructs are left untouched.
//
// Example: "/validate/(number:\d+)/(word:\w+)" against "/validate/42/justatest"
// gives {number: 42 (int64_t), word: "justatest"}.
class RoutePattern {
 public:
  struct Group {
    std::string name;
    ParamType type;

    bool operator==(const Group&) const = default;
  };

  // Throws std::invalid_argument for a malformed or duplicated group, an unknown type tag or an invalid regex.
  explicit RoutePattern(std::string_view pattern);

  // Pattern as registered.
  [[nodiscard]] std::string_view source() const noexcept { return _source; }

  // Regular expression actually compiled (typed group prefixes removed).
  [[nodiscard]] std::string_view compiledSource() const noexcept { return _compiled; }

  [[nodiscard]] const std::vector<Group>& groups() const noexcept { return _groups; }

  // Matches the whole text. On success, coerced captures are added to params.
  // A capture failing its coercion makes the whole match fail (params is then left untouched).
  [[nodiscard]] bool fullMatch(std::string_view text, ValueMap& params) const;

  // Matches a prefix of text. Returns the length of the matched prefix on success.
  [[nodiscard]] std::optional<std::size_t> prefixMatch(std::string_view text, ValueMap& params) const;

 private:
  using MatchResults = std::match_results<std::string_view::const_iterator>;

  bool extract(const MatchResults& matchResults, ValueMap& params) const;

  std::string _source;
  std::string _compiled;
  std::regex _regex;
  std::vector<Group> _groups;  // index i describes capture i + 1
};

}  // namespace corvid
