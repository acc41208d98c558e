#include "corvid/param-coercion.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/param-value.hpp"
#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/stringconv.hpp"

namespace corvid {

namespace {

constexpr std::pair<std::string_view, ParamType> kTags[] = {
    {"int", ParamType::Integer},    {"number", ParamType::Integer}, {"integer", ParamType::Integer},
    {"float", ParamType::Float},    {"decimal", ParamType::Float},  {"double", ParamType::Float},
    {"bool", ParamType::Boolean},   {"str", ParamType::String},     {"string", ParamType::String},
    {"word", ParamType::String},    {"slug", ParamType::String},    {"path", ParamType::String},
};

std::optional<bool> ParseBool(std::string_view text) {
  for (std::string_view word : {"true", "1", "yes"}) {
    if (CaseInsensitiveEqual(text, word)) {
      return true;
    }
  }
  for (std::string_view word : {"false", "0", "no"}) {
    if (CaseInsensitiveEqual(text, word)) {
      return false;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<ParamType> ParamTypeFromTag(std::string_view tag) {
  for (const auto& [name, type] : kTags) {
    if (CaseInsensitiveEqual(tag, name)) {
      return type;
    }
  }
  return std::nullopt;
}

std::string_view ParamTypeToStr(ParamType type) {
  switch (type) {
    case ParamType::String:
      return "string";
    case ParamType::Integer:
      return "integer";
    case ParamType::Float:
      return "float";
    case ParamType::Boolean:
      return "bool";
    default:
      return "unknown";
  }
}

std::optional<ParamValue> Coerce(ParamType type, std::string_view text) {
  switch (type) {
    case ParamType::String:
      return ParamValue(std::string(text));
    case ParamType::Integer:
      if (auto value = StringToIntegral<int64_t>(text)) {
        return ParamValue(*value);
      }
      return std::nullopt;
    case ParamType::Float:
      if (auto value = StringToFloating<double>(text)) {
        return ParamValue(*value);
      }
      return std::nullopt;
    case ParamType::Boolean:
      if (auto value = ParseBool(text)) {
        return ParamValue(*value);
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace corvid
