#include "corvid/http-request.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

#include "corvid/header-map.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-version.hpp"

namespace corvid {

std::optional<std::string_view> HttpRequest::cookie(std::string_view name) const {
  auto it = _cookies.find(name);
  if (it == _cookies.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

const http::UploadedFile* HttpRequest::upload(std::string_view fieldName) const noexcept {
  const auto it = std::ranges::find_if(
      _uploads, [fieldName](const http::UploadedFile& upload) { return upload.fieldName == fieldName; });
  return it == _uploads.end() ? nullptr : &*it;
}

std::string_view HttpRequest::uploadContent(const http::UploadedFile& upload) const noexcept {
  if (upload.error != http::UploadError::None) {
    return {};
  }
  return std::string_view(_body).substr(upload.bodyOffset, upload.size);
}

bool HttpRequest::wantsKeepAlive() const {
  const auto connection = headerValue(http::Connection);
  if (_version == http::HTTP_1_1) {
    return !connection || !http::HeaderValueHasToken(*connection, http::close);
  }
  return connection && http::HeaderValueHasToken(*connection, http::keepalive);
}

}  // namespace corvid
