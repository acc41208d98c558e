#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace corvid {

struct ClientConfig {
  // Total time allowed from open() to the complete response. 0 disables the timeout.
  std::chrono::milliseconds requestTimeout{std::chrono::seconds{30}};

  // Responses with a larger body fail with ClientError::Protocol.
  std::size_t maxResponseBytes{64UL * 1024 * 1024};

  // Value of the User-Agent header. Empty to not send it.
  std::string userAgent{"corvid-client"};

  ClientConfig& withRequestTimeout(std::chrono::milliseconds timeout);

  ClientConfig& withMaxResponseBytes(std::size_t maxResponseBytes);

  ClientConfig& withUserAgent(std::string_view userAgent);

  // Throws std::invalid_argument if the config is not valid.
  void validate() const;

  bool operator==(const ClientConfig&) const = default;
};

}  // namespace corvid
