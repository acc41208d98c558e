#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "corvid/chunked-decoder.hpp"
#include "corvid/http-request.hpp"
#include "corvid/http-status-code.hpp"

namespace corvid {

// Returned by RequestParser::parse while the current request is incomplete.
inline constexpr http::StatusCode kStatusNeedMoreData = 0;

enum class ParserState : uint8_t { AwaitingRequestLine, ParsingHeaders, AwaitingBody, ReadyToDispatch, Failed };

struct ParserLimits {
  std::size_t maxRequestLineBytes{8UL * 1024};
  std::size_t maxHeaderBytes{16UL * 1024};
  std::size_t maxBodyBytes{10UL * 1024 * 1024};
  // Larger uploads are kept in the request with UploadError::MaxSizeExceeded and no content. 0 means unlimited.
  std::size_t maxUploadBytes{0};
  std::size_t maxMultipartParts{128};
};

// Incremental HTTP/1.x request parser.
//
// The result does not depend on how the input is split: parse() may be called after each read with
// whatever bytes arrived, the parser keeps its state between calls and only ever consumes complete lines
// (request line, header lines, chunk size lines) or body bytes.
class RequestParser {
 public:
  explicit RequestParser(ParserLimits limits = {}) : _limits(limits) {}

  // Consume as much of 'input' as possible. Consumed bytes are erased from the front of 'input';
  // bytes belonging to a following pipelined request are left in place.
  // Returns:
  //  - kStatusNeedMoreData while the request is incomplete,
  //  - StatusCodeOK once a request is complete (state ReadyToDispatch),
  //  - an error status (4xx / 5xx) on a protocol error (state Failed). The parser must be reset before reuse.
  http::StatusCode parse(std::string& input);

  [[nodiscard]] ParserState state() const noexcept { return _state; }

  [[nodiscard]] const HttpRequest& request() const noexcept { return _request; }
  [[nodiscard]] HttpRequest& request() noexcept { return _request; }

  // Status of the last failure, StatusCodeOK if none.
  [[nodiscard]] http::StatusCode errorStatus() const noexcept { return _errorStatus; }

  // Drop the current request and wait for the next request line.
  void reset();

 private:
  http::StatusCode parseRequestLine(std::string_view line);
  http::StatusCode parseHeaderLine(std::string_view line);
  http::StatusCode onHeadersComplete();
  http::StatusCode finalize();
  http::StatusCode parseMultipartBody(std::string_view contentType);
  http::StatusCode fail(http::StatusCode status);

  ParserLimits _limits;
  ParserState _state{ParserState::AwaitingRequestLine};
  http::StatusCode _errorStatus{http::StatusCodeOK};
  std::size_t _headerBytes{0};
  std::size_t _remainingBody{0};
  http::ChunkedDecoder _chunkedDecoder;
  HttpRequest _request;
};

}  // namespace corvid
