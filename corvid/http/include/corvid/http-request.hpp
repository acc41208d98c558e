#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "corvid/cookies.hpp"
#include "corvid/header-map.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-version.hpp"
#include "corvid/query-params.hpp"

namespace corvid {

class HttpRequest;
class RequestParser;

namespace http {

enum class UploadError : uint8_t { None, MaxSizeExceeded };

// A file field of a multipart/form-data request.
struct UploadedFile {
  std::string fieldName;
  // As sent by the client, possibly empty.
  std::string filename;
  // Part Content-Type, else guessed from the filename extension, else application/octet-stream.
  std::string contentType;
  // Received size, also when it exceeded the upload limit.
  std::size_t size{0};
  UploadError error{UploadError::None};
  // Path of the spooled copy when the server has an upload directory, empty otherwise.
  // The file is removed once the response is produced.
  std::string tempPath;

  bool operator==(const UploadedFile&) const = default;

 private:
  friend class corvid::HttpRequest;
  friend class corvid::RequestParser;

  std::size_t bodyOffset{0};
};

}  // namespace http

// A fully parsed inbound request. Built incrementally by RequestParser; read-only for handlers.
class HttpRequest {
 public:
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Request target as received (a leading '/' is prepended if it was missing).
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Percent-decoded path, without the query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string (without '?'), empty if absent.
  [[nodiscard]] std::string_view queryString() const noexcept { return _queryString; }

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  [[nodiscard]] const http::HeaderMap& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const {
    return http::FindHeader(_headers, name);
  }

  [[nodiscard]] const http::CookieMap& cookies() const noexcept { return _cookies; }

  [[nodiscard]] std::optional<std::string_view> cookie(std::string_view name) const;

  // Decoded query string parameters, followed by the fields of an urlencoded or multipart form body.
  [[nodiscard]] const http::QueryParams& queryParams() const noexcept { return _queryParams; }

  // Body bytes, de-chunked if the request used chunked transfer coding.
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // File fields of a multipart/form-data body, in order of appearance.
  [[nodiscard]] const std::vector<http::UploadedFile>& uploads() const noexcept { return _uploads; }

  // First upload of given field, nullptr if none.
  [[nodiscard]] const http::UploadedFile* upload(std::string_view fieldName) const noexcept;

  // Content of an upload of this request. Empty if it exceeded the upload limit.
  [[nodiscard]] std::string_view uploadContent(const http::UploadedFile& upload) const noexcept;

  [[nodiscard]] std::optional<std::size_t> declaredContentLength() const noexcept { return _contentLength; }

  [[nodiscard]] bool isChunked() const noexcept { return _chunked; }

  // Persistence requested by the client: HTTP/1.1 unless "Connection: close",
  // HTTP/1.0 only with "Connection: keep-alive".
  [[nodiscard]] bool wantsKeepAlive() const;

  bool operator==(const HttpRequest&) const = default;

 private:
  friend class RequestParser;
  friend class UploadSpool;

  http::Method _method{http::Method::GET};
  http::Version _version{http::HTTP_1_1};
  bool _chunked{false};
  std::optional<std::size_t> _contentLength;
  std::string _target;
  std::string _path;
  std::string _queryString;
  http::HeaderMap _headers;
  http::CookieMap _cookies;
  http::QueryParams _queryParams;
  std::string _body;
  std::vector<http::UploadedFile> _uploads;
};

}  // namespace corvid
