#include "corvid/route-pattern.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/log.hpp"
#include "corvid/param-coercion.hpp"
#include "corvid/param-value.hpp"

namespace corvid {

namespace {

constexpr bool IsIdentStart(char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_'; }

constexpr bool IsIdentChar(char ch) { return IsIdentStart(ch) || (ch >= '0' && ch <= '9'); }

std::invalid_argument PatternError(std::string_view pattern, std::string_view reason) {
  return std::invalid_argument(std::string("Invalid route pattern '").append(pattern).append("': ").append(reason));
}

// Copies the bracket expression starting at pattern[pos] == '[' into out, returns the position after its ']'.
std::size_t CopyBracketExpression(std::string_view pattern, std::size_t pos, std::string& out) {
  const std::size_t start = pos++;
  if (pos < pattern.size() && pattern[pos] == '^') {
    ++pos;
  }
  if (pos < pattern.size() && pattern[pos] == ']') {
    // leading ']' is literal
    ++pos;
  }
  while (pos < pattern.size() && pattern[pos] != ']') {
    pos += pattern[pos] == '\\' ? 2 : 1;
  }
  if (pos >= pattern.size()) {
    throw PatternError(pattern, "unterminated '['");
  }
  ++pos;
  out.append(pattern.substr(start, pos - start));
  return pos;
}

}  // namespace

RoutePattern::RoutePattern(std::string_view pattern) : _source(pattern) {
  _compiled.reserve(pattern.size());
  for (std::size_t pos = 0; pos < pattern.size();) {
    const char ch = pattern[pos];
    if (ch == '\\') {
      _compiled.append(pattern.substr(pos, 2));
      pos += 2;
      continue;
    }
    if (ch == '[') {
      pos = CopyBracketExpression(pattern, pos, _compiled);
      continue;
    }
    _compiled.push_back(ch);
    ++pos;
    if (ch != '(' || (pos < pattern.size() && pattern[pos] == '?')) {
      continue;
    }

    // capturing group: look for "name:" or "name<tag>:"
    Group group{std::to_string(_groups.size() + 1), ParamType::String};
    std::size_t endName = pos;
    if (endName < pattern.size() && IsIdentStart(pattern[endName])) {
      while (endName < pattern.size() && IsIdentChar(pattern[endName])) {
        ++endName;
      }
    }
    if (endName != pos && endName < pattern.size() && (pattern[endName] == ':' || pattern[endName] == '<')) {
      std::string_view name = pattern.substr(pos, endName - pos);
      std::optional<ParamType> type;
      std::size_t afterName = endName;
      if (pattern[endName] == '<') {
        const auto closePos = pattern.find('>', endName);
        if (closePos == std::string_view::npos || closePos + 1 >= pattern.size() || pattern[closePos + 1] != ':') {
          throw PatternError(pattern, "malformed typed group, expected '(name<tag>:...)'");
        }
        const std::string_view tag = pattern.substr(endName + 1, closePos - endName - 1);
        type = ParamTypeFromTag(tag);
        if (!type) {
          throw PatternError(pattern, std::string("unknown type tag '").append(tag).append("'"));
        }
        afterName = closePos + 1;
      } else {
        type = ParamTypeFromTag(name);
      }
      if (std::ranges::any_of(_groups, [name](const Group& other) { return other.name == name; })) {
        throw PatternError(pattern, std::string("duplicated group name '").append(name).append("'"));
      }
      group.name.assign(name);
      group.type = type.value_or(ParamType::String);
      pos = afterName + 1;  // skip ':'
    }
    _groups.push_back(std::move(group));
  }

  try {
    _regex.assign(_compiled, std::regex::ECMAScript);
  } catch (const std::regex_error& ex) {
    throw PatternError(pattern, ex.what());
  }
  if (_regex.mark_count() != _groups.size()) {
    throw PatternError(pattern, "unexpected number of capturing groups");
  }
  log::trace("Compiled route pattern '{}' as '{}' with {} group(s)", _source, _compiled, _groups.size());
}

bool RoutePattern::extract(const MatchResults& matchResults, ValueMap& params) const {
  ValueMap captured;
  for (std::size_t groupPos = 0; groupPos < _groups.size(); ++groupPos) {
    const auto& subMatch = matchResults[groupPos + 1];
    if (!subMatch.matched) {
      // optional group that did not participate
      continue;
    }
    const std::string_view text(subMatch.first, subMatch.second);
    auto value = Coerce(_groups[groupPos].type, text);
    if (!value) {
      log::debug("Capture '{}' = '{}' is not a valid {}", _groups[groupPos].name, text,
                 ParamTypeToStr(_groups[groupPos].type));
      return false;
    }
    captured.set(_groups[groupPos].name, std::move(*value));
  }
  params.merge(captured);
  return true;
}

bool RoutePattern::fullMatch(std::string_view text, ValueMap& params) const {
  MatchResults matchResults;
  if (!std::regex_match(text.begin(), text.end(), matchResults, _regex)) {
    return false;
  }
  return extract(matchResults, params);
}

std::optional<std::size_t> RoutePattern::prefixMatch(std::string_view text, ValueMap& params) const {
  MatchResults matchResults;
  if (!std::regex_search(text.begin(), text.end(), matchResults, _regex, std::regex_constants::match_continuous)) {
    return std::nullopt;
  }
  if (!extract(matchResults, params)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(matchResults.length(0));
}

}  // namespace corvid
