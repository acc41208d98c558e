#include "corvid/query-params.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "corvid/url-decode.hpp"

namespace corvid::http {

std::optional<std::string_view> QueryParams::get(std::string_view name) const {
  for (auto it = _params.rbegin(); it != _params.rend(); ++it) {
    if (it->first == name) {
      return std::string_view(it->second);
    }
  }
  return std::nullopt;
}

std::vector<std::string_view> QueryParams::getAll(std::string_view name) const {
  std::vector<std::string_view> ret;
  for (const auto& [key, value] : _params) {
    if (key == name) {
      ret.emplace_back(value);
    }
  }
  return ret;
}

bool ParseUrlEncoded(std::string_view encoded, QueryParams& params) {
  while (!encoded.empty()) {
    const auto ampPos = encoded.find('&');
    const std::string_view pair = encoded.substr(0, ampPos);
    if (!pair.empty()) {
      const auto eqPos = pair.find('=');
      auto name = url::Decode(pair.substr(0, eqPos), ' ');
      auto value = eqPos == std::string_view::npos ? std::optional<std::string>(std::string{})
                                                   : url::Decode(pair.substr(eqPos + 1), ' ');
      if (!name || !value) {
        return false;
      }
      params.add(std::move(*name), std::move(*value));
    }
    if (ampPos == std::string_view::npos) {
      break;
    }
    encoded.remove_prefix(ampPos + 1);
  }
  return true;
}

}  // namespace corvid::http
