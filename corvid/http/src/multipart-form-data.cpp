#include "corvid/multipart-form-data.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>

#include "corvid/http-constants.hpp"
#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/string-trim.hpp"

namespace corvid::http {

namespace {

constexpr std::string_view kDoubleDash = "--";

std::string_view StripQuotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

std::string_view MediaType(std::string_view contentType) {
  return TrimOws(contentType.substr(0, contentType.find(';')));
}

// Value of parameter 'key' in a "type; k1=v1; k2=v2" header value.
std::optional<std::string_view> HeaderParam(std::string_view headerValue, std::string_view key) {
  auto semicolon = headerValue.find(';');
  while (semicolon != std::string_view::npos) {
    headerValue.remove_prefix(semicolon + 1);
    semicolon = headerValue.find(';');
    const std::string_view token = headerValue.substr(0, semicolon);
    const auto eq = token.find('=');
    if (eq != std::string_view::npos && CaseInsensitiveEqual(TrimOws(token.substr(0, eq)), key)) {
      return StripQuotes(TrimOws(token.substr(eq + 1)));
    }
  }
  return std::nullopt;
}

}  // namespace

bool IsMultipartFormData(std::string_view contentTypeHeader) {
  return CaseInsensitiveEqual(MediaType(contentTypeHeader), ContentTypeMultipartFormData);
}

const MultipartFormData::Part* MultipartFormData::part(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_parts, [name](const Part& part) { return part.name == name; });
  return it == _parts.end() ? nullptr : &*it;
}

MultipartFormData::MultipartFormData(std::string_view contentTypeHeader, std::string_view body,
                                     MultipartFormDataOptions options) {
  if (!IsMultipartFormData(contentTypeHeader)) {
    _invalidReason = "not a multipart/form-data content type";
    return;
  }
  const auto boundaryParam = HeaderParam(contentTypeHeader, "boundary");
  // RFC 2046: 1 to 70 characters
  if (!boundaryParam || boundaryParam->empty() || boundaryParam->size() > 70) {
    _invalidReason = "multipart/form-data boundary missing";
    return;
  }
  const std::string_view boundary = *boundaryParam;

  // Preamble is allowed before the first delimiter.
  std::size_t pos = 0;
  while (true) {
    pos = body.find(kDoubleDash, pos);
    if (pos == std::string_view::npos) {
      _invalidReason = "multipart body missing starting boundary";
      return;
    }
    if ((pos == 0 || (pos >= 2 && body.substr(pos - 2, 2) == CRLF)) && body.substr(pos + 2).starts_with(boundary)) {
      break;
    }
    pos += kDoubleDash.size();
  }
  body.remove_prefix(pos + kDoubleDash.size() + boundary.size());

  while (true) {
    // After a delimiter: "--" ends the body, CRLF starts a part.
    if (body.starts_with(kDoubleDash)) {
      break;
    }
    if (!body.starts_with(CRLF)) {
      _invalidReason = "multipart boundary not followed by CRLF";
      return;
    }
    body.remove_prefix(CRLF.size());

    if (options.maxParts != 0 && _parts.size() >= options.maxParts) {
      _invalidReason = "multipart exceeds part limit";
      return;
    }

    Part& part = _parts.emplace_back();
    bool hasDisposition = false;
    std::size_t nbHeaders = 0;
    while (true) {
      const auto lineEnd = body.find(CRLF);
      if (lineEnd == std::string_view::npos) {
        _invalidReason = "multipart part missing header terminator";
        return;
      }
      const std::string_view line = body.substr(0, lineEnd);
      body.remove_prefix(lineEnd + CRLF.size());
      if (line.empty()) {
        break;
      }
      if (options.maxHeadersPerPart != 0 && ++nbHeaders > options.maxHeadersPerPart) {
        _invalidReason = "multipart part exceeds header limit";
        return;
      }
      const auto colon = line.find(':');
      if (colon == std::string_view::npos) {
        _invalidReason = "multipart part header missing colon";
        return;
      }
      const std::string_view name = TrimOws(line.substr(0, colon));
      const std::string_view value = TrimOws(line.substr(colon + 1));
      if (CaseInsensitiveEqual(name, ContentDisposition)) {
        if (!CaseInsensitiveEqual(MediaType(value), "form-data")) {
          _invalidReason = "multipart part must have Content-Disposition: form-data";
          return;
        }
        const auto fieldName = HeaderParam(value, "name");
        if (!fieldName || fieldName->empty()) {
          _invalidReason = "multipart part missing name parameter";
          return;
        }
        part.name = *fieldName;
        part.filename = HeaderParam(value, "filename");
        hasDisposition = true;
      } else if (CaseInsensitiveEqual(name, ContentType)) {
        part.contentType = value;
      }
    }
    if (!hasDisposition) {
      _invalidReason = "multipart part missing Content-Disposition header";
      return;
    }

    // Part content ends at the next CRLF "--" boundary.
    std::size_t end = 0;
    while (true) {
      end = body.find("\r\n--", end);
      if (end == std::string_view::npos) {
        _invalidReason = "multipart part missing closing boundary";
        return;
      }
      if (body.substr(end + 4).starts_with(boundary)) {
        break;
      }
      end += 4;
    }
    part.value = body.substr(0, end);
    body.remove_prefix(end + 4 + boundary.size());
  }
}

}  // namespace corvid::http
