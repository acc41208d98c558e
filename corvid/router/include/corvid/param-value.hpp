#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace corvid {

using ParamValue = std::variant<std::string, int64_t, double, bool>;

// Human readable form of a value ("42", "3.5", "true", or the string itself).
std::string ParamValueToString(const ParamValue& value);

// Ordered name -> typed value mapping, used both for the parameters extracted from a path
// and for the constructor arguments attached to a route.
// Names are unique, insertion order is preserved.
class ValueMap {
 public:
  using value_type = std::pair<std::string, ParamValue>;

  ValueMap() noexcept = default;

  ValueMap(std::initializer_list<value_type> init);

  // Insert or replace the value for name.
  void set(std::string_view name, ParamValue value);

  [[nodiscard]] const ParamValue* find(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

  // Typed access. Throws std::out_of_range if name is absent and std::bad_variant_access
  // if it holds another type.
  template <class T>
  [[nodiscard]] const T& get(std::string_view name) const {
    const ParamValue* pValue = find(name);
    if (pValue == nullptr) {
      throw std::out_of_range(std::string("no value named '").append(name).append("'"));
    }
    return std::get<T>(*pValue);
  }

  // Typed access returning nullptr if absent or of another type.
  template <class T>
  [[nodiscard]] const T* getIf(std::string_view name) const noexcept {
    const ParamValue* pValue = find(name);
    return pValue == nullptr ? nullptr : std::get_if<T>(pValue);
  }

  // Copy all values of other into this map, values of other win.
  void merge(const ValueMap& other);

  [[nodiscard]] std::size_t size() const noexcept { return _values.size(); }
  [[nodiscard]] bool empty() const noexcept { return _values.empty(); }

  [[nodiscard]] auto begin() const noexcept { return _values.begin(); }
  [[nodiscard]] auto end() const noexcept { return _values.end(); }

  void clear() noexcept { _values.clear(); }

  bool operator==(const ValueMap&) const = default;

 private:
  std::vector<value_type> _values;
};

// Typed values captured from the request path.
using Params = ValueMap;

// Constructor arguments declared on a route, handed to the action factory on each match.
using RouteArgs = ValueMap;

}  // namespace corvid
