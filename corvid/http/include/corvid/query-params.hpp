#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace corvid::http {

// Ordered multimap of decoded query (or form body) parameters.
// get() returns the last value for a name, getAll() every value in order of appearance.
class QueryParams {
 public:
  using value_type = std::pair<std::string, std::string>;

  void add(std::string name, std::string value) { _params.emplace_back(std::move(name), std::move(value)); }

  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const;

  [[nodiscard]] std::vector<std::string_view> getAll(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return get(name).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }
  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  [[nodiscard]] auto begin() const noexcept { return _params.begin(); }
  [[nodiscard]] auto end() const noexcept { return _params.end(); }

  void clear() noexcept { _params.clear(); }

  bool operator==(const QueryParams&) const = default;

 private:
  std::vector<value_type> _params;
};

// Decode an application/x-www-form-urlencoded sequence ("a=1&b=x+y") appending into params.
// Returns false on an invalid percent escape (params may then be partially filled).
bool ParseUrlEncoded(std::string_view encoded, QueryParams& params);

}  // namespace corvid::http
