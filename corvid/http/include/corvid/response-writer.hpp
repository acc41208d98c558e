#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "corvid/cookies.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"

namespace corvid::http {

using HeaderPair = std::pair<std::string, std::string>;

// Serializes one response into a connection outbound buffer.
//
// Usage: set status / headers / cookies, call composeHeaders() once, then write() any number of times,
// and finally finish(). Body framing is decided in composeHeaders():
//  - no body for 1xx, 204 and 304,
//  - identity with the Content-Length header if the caller set one,
//  - chunked for HTTP/1.1 (each non empty write() is a chunk, finish() appends the last chunk),
//  - close-delimited for HTTP/1.0 (persistence is then cleared).
// Body bytes are never emitted for a HEAD request.
class ResponseWriter {
 public:
  ResponseWriter(std::string& out, Version version, bool headRequest, bool keepAlive);

  void setStatus(StatusCode status, std::string_view reason = {});

  [[nodiscard]] StatusCode status() const noexcept { return _status; }

  // Replace (or add) a header. Throws std::logic_error once headers are composed.
  // Setting "Connection: close" clears persistence.
  void setHeader(std::string_view name, std::string_view value);

  void setContentType(std::string_view contentType) { _contentType.assign(contentType); }

  void setCookie(ResponseCookie cookie);

  // Emit the status line and the header block. Throws std::logic_error if called twice.
  // globalHeaders are added unless a header with the same name was set explicitly.
  void composeHeaders(std::span<const HeaderPair> globalHeaders = {});

  // Append body bytes. Throws std::logic_error if headers were not composed yet, after finish(),
  // or if the body would exceed the Content-Length set by the caller.
  void write(std::string_view data);

  // Terminate the body. Idempotent.
  // Throws std::logic_error if fewer bytes than the Content-Length set by the caller were written
  // (not checked for HEAD responses, which carry no body).
  void finish();

  // Convenience for short complete responses: sets Content-Length, composes, writes and finishes.
  void writeSimple(StatusCode status, std::string_view body, std::string_view contentType,
                   std::span<const HeaderPair> globalHeaders = {});

  [[nodiscard]] bool headersComposed() const noexcept { return _headersComposed; }
  [[nodiscard]] bool finished() const noexcept { return _finished; }

  // Whether the connection may serve another request once this response is flushed.
  [[nodiscard]] bool keepAlive() const noexcept { return _keepAlive; }

  [[nodiscard]] std::size_t bodyBytesWritten() const noexcept { return _bodyBytes; }

 private:
  enum class Framing : uint8_t { None, ContentLength, Chunked, CloseDelimited };

  [[nodiscard]] bool hasHeader(std::string_view name) const;

  std::string& _out;
  Version _version;
  bool _headRequest;
  bool _keepAlive;
  bool _headersComposed{false};
  bool _finished{false};
  Framing _framing{Framing::None};
  StatusCode _status{StatusCodeOK};
  std::size_t _bodyBytes{0};
  std::size_t _declaredLength{0};
  std::string _reason;
  std::string _contentType;
  std::vector<HeaderPair> _headers;
  std::vector<ResponseCookie> _cookies;
};

}  // namespace corvid::http
