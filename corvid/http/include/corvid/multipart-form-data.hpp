#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace corvid::http {

struct MultipartFormDataOptions {
  // 0 means unlimited.
  std::size_t maxParts{128};
  std::size_t maxHeadersPerPart{32};
};

// Parsed multipart/form-data body (RFC 7578).
// All views point into the Content-Type header value and the body given at construction,
// which must outlive this object. Parsing never throws: check valid() and invalidReason().
class MultipartFormData {
 public:
  struct Part {
    std::string_view name;
    // Present for file fields, possibly empty if the client sent 'filename=""'.
    std::optional<std::string_view> filename;
    // Content-Type header of the part, empty if absent.
    std::string_view contentType;
    std::string_view value;
  };

  MultipartFormData() noexcept = default;

  MultipartFormData(std::string_view contentTypeHeader, std::string_view body, MultipartFormDataOptions options = {});

  [[nodiscard]] bool valid() const noexcept { return _invalidReason.empty(); }

  [[nodiscard]] std::string_view invalidReason() const noexcept { return _invalidReason; }

  [[nodiscard]] const std::vector<Part>& parts() const noexcept { return _parts; }

  // First part with given name, nullptr if none.
  [[nodiscard]] const Part* part(std::string_view name) const noexcept;

 private:
  std::vector<Part> _parts;
  std::string_view _invalidReason;
};

// True if the Content-Type header value announces multipart/form-data.
bool IsMultipartFormData(std::string_view contentTypeHeader);

}  // namespace corvid::http
