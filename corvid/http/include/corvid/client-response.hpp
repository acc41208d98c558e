#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "corvid/cookies.hpp"
#include "corvid/header-map.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"

namespace corvid {

enum class ClientError : uint8_t {
  None,
  ResolveOrConnect,  // name resolution or TCP connect failed
  ConnectionReset,   // peer reset or closed the connection before the response was complete
  Protocol,          // malformed or oversized response
  Timeout,           // request did not complete within ClientConfig::requestTimeout
  Cancelled          // cancelled by the issuing code
};

std::string_view ClientErrorToStr(ClientError error);

// Terminal result of an outbound request, delivered once to the completion callback.
struct ClientResponse {
  [[nodiscard]] bool ok() const noexcept { return error == ClientError::None; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const {
    return http::FindHeader(headers, name);
  }

  ClientError error{ClientError::None};
  std::string errorMessage;

  http::Version version{http::HTTP_1_1};
  http::StatusCode status{0};
  std::string reason;
  http::HeaderMap headers;
  std::map<std::string, http::ClientCookie, std::less<>> cookies;

  // Media type of Content-Type without parameters, and its charset parameter.
  std::string contentType;
  std::string charset;
  // Value of the Content-Encoding header, empty if absent.
  std::string contentEncoding;

  // Whether the server allows reusing the connection.
  bool keepAlive{false};

  std::string body;
};

}  // namespace corvid
