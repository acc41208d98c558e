#include "corvid/client-config.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace corvid {

ClientConfig& ClientConfig::withRequestTimeout(std::chrono::milliseconds timeout) {
  this->requestTimeout = timeout;
  return *this;
}

ClientConfig& ClientConfig::withMaxResponseBytes(std::size_t maxResponseBytes) {
  this->maxResponseBytes = maxResponseBytes;
  return *this;
}

ClientConfig& ClientConfig::withUserAgent(std::string_view userAgent) {
  this->userAgent.assign(userAgent);
  return *this;
}

void ClientConfig::validate() const {
  if (requestTimeout.count() < 0) {
    throw std::invalid_argument("requestTimeout must be non-negative");
  }
  if (maxResponseBytes == 0) {
    throw std::invalid_argument("maxResponseBytes must be > 0");
  }
  if (userAgent.find_first_of("\r\n") != std::string::npos) {
    throw std::invalid_argument("userAgent cannot contain line breaks");
  }
}

}  // namespace corvid
