#include "corvid/param-value.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace corvid {

namespace {

struct ToStringVisitor {
  std::string operator()(const std::string& str) const { return str; }
  std::string operator()(int64_t value) const { return std::to_string(value); }
  std::string operator()(double value) const { return fmt::format("{}", value); }
  std::string operator()(bool value) const { return value ? "true" : "false"; }
};

}  // namespace

std::string ParamValueToString(const ParamValue& value) { return std::visit(ToStringVisitor{}, value); }

ValueMap::ValueMap(std::initializer_list<value_type> init) {
  for (const auto& [name, value] : init) {
    set(name, value);
  }
}

void ValueMap::set(std::string_view name, ParamValue value) {
  auto it = std::ranges::find_if(_values, [name](const value_type& elem) { return elem.first == name; });
  if (it == _values.end()) {
    _values.emplace_back(std::string(name), std::move(value));
  } else {
    it->second = std::move(value);
  }
}

const ParamValue* ValueMap::find(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_values, [name](const value_type& elem) { return elem.first == name; });
  return it == _values.end() ? nullptr : &it->second;
}

void ValueMap::merge(const ValueMap& other) {
  for (const auto& [name, value] : other) {
    set(name, value);
  }
}

}  // namespace corvid
