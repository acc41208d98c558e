#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "corvid/chunked-decoder.hpp"
#include "corvid/client-response.hpp"

namespace corvid {

// Incremental HTTP/1.x response parser filling a ClientResponse.
class ResponseParser {
 public:
  enum class Status : uint8_t { NeedMoreData, Complete, Error };

  ResponseParser(ClientResponse& response, bool headRequest, std::size_t maxResponseBytes)
      : _response(response), _maxResponseBytes(maxResponseBytes), _headRequest(headRequest) {}

  // Consume as much of 'input' as possible, erasing consumed bytes from its front.
  Status parse(std::string& input);

  // Signal that the peer closed the connection. Completes a close-delimited body, errors otherwise.
  Status onEof();

  // Description of the failure when parse() or onEof() returned Error.
  [[nodiscard]] std::string_view errorMessage() const noexcept { return _errorMessage; }

 private:
  enum class State : uint8_t { StatusLine, Headers, ContentLengthBody, ChunkedBody, UntilCloseBody, Complete, Failed };

  Status parseStatusLine(std::string_view line);
  Status parseHeaderLine(std::string_view line);
  Status onHeadersComplete();
  Status complete();
  Status fail(std::string_view message);

  ClientResponse& _response;
  std::size_t _maxResponseBytes;
  std::size_t _headBytes{0};
  std::size_t _remainingBody{0};
  bool _headRequest;
  State _state{State::StatusLine};
  http::ChunkedDecoder _chunkedDecoder;
  std::string _errorMessage;
};

}  // namespace corvid
