#include "corvid/mime-types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string_view>

namespace corvid {

static_assert(std::ranges::is_sorted(kMimeTypes, {}, &MimeType::extension), "kMimeTypes must be sorted");

std::string_view MimeTypeForPath(std::string_view path) {
  static constexpr std::size_t kMaxExtensionLen = 8;

  const auto dotPos = path.rfind('.');
  if (dotPos == std::string_view::npos || path.find('/', dotPos) != std::string_view::npos) {
    return {};
  }
  const std::string_view ext = path.substr(dotPos + 1);
  if (ext.empty() || ext.size() > kMaxExtensionLen) {
    return {};
  }
  char lowerExt[kMaxExtensionLen];
  std::ranges::transform(ext, lowerExt, [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
  const std::string_view key(lowerExt, ext.size());

  const auto it = std::ranges::lower_bound(kMimeTypes, key, {}, &MimeType::extension);
  if (it == std::end(kMimeTypes) || it->extension != key) {
    return {};
  }
  return it->type;
}

}  // namespace corvid
