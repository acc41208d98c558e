#include "corvid/server-config.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "corvid/log.hpp"
#include "corvid/response-writer.hpp"

namespace corvid {

namespace {

bool IsValidHeaderName(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  for (char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (uch <= 0x20 || uch >= 0x7F || ch == ':') {
      return false;
    }
  }
  return true;
}

bool IsValidHeaderValue(std::string_view value) {
  return value.find_first_of("\r\n") == std::string_view::npos;
}

}  // namespace

ServerConfig& ServerConfig::withListener(std::string_view host, uint16_t port) {
  listeners.push_back(ListenAddress{std::string(host), port});
  return *this;
}

ServerConfig& ServerConfig::withListeners(std::span<const ListenAddress> listenAddresses) {
  listeners.assign(listenAddresses.begin(), listenAddresses.end());
  return *this;
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  listeners.assign(1, ListenAddress{std::string(), port});
  return *this;
}

ServerConfig& ServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

ServerConfig& ServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

ServerConfig& ServerConfig::withBacklog(int backlog) {
  this->backlog = backlog;
  return *this;
}

ServerConfig& ServerConfig::withMaxRequestLineBytes(std::size_t maxRequestLineBytes) {
  this->maxRequestLineBytes = maxRequestLineBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxUploadBytes(std::size_t maxUploadBytes) {
  this->maxUploadBytes = maxUploadBytes;
  return *this;
}

ServerConfig& ServerConfig::withUploadDir(std::string_view uploadDir) {
  this->uploadDir = uploadDir;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

ServerConfig& ServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  this->maxRequestsPerConnection = maxRequests;
  return *this;
}

ServerConfig& ServerConfig::withMaxOutboundBufferBytes(std::size_t maxOutbound) {
  this->maxOutboundBufferBytes = maxOutbound;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withHeaderReadTimeout(std::chrono::milliseconds timeout) {
  this->headerReadTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withBodyReadTimeout(std::chrono::milliseconds timeout) {
  this->bodyReadTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withInitialReadChunkBytes(std::size_t bytes) {
  this->initialReadChunkBytes = bytes;
  return *this;
}

ServerConfig& ServerConfig::withGlobalHeaders(std::vector<http::HeaderPair> headers) {
  this->globalHeaders = std::move(headers);
  return *this;
}

ServerConfig& ServerConfig::addGlobalHeader(std::string_view name, std::string_view value) {
  globalHeaders.emplace_back(std::string(name), std::string(value));
  return *this;
}

ServerConfig& ServerConfig::withLogLevel(std::string_view level) {
  this->logLevel.assign(level);
  return *this;
}

void ServerConfig::validate() const {
  if (listeners.empty()) {
    throw std::invalid_argument("at least one listener is required");
  }
  if (backlog <= 0) {
    throw std::invalid_argument("backlog must be > 0");
  }
  if (maxRequestLineBytes < 16) {
    throw std::invalid_argument("maxRequestLineBytes must be >= 16");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (!uploadDir.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(uploadDir, ec)) {
      throw std::invalid_argument(fmt::format("uploadDir '{}' is not a directory", uploadDir));
    }
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (maxOutboundBufferBytes < 1024) {
    throw std::invalid_argument("maxOutboundBufferBytes must be >= 1024");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (headerReadTimeout.count() < 0) {
    throw std::invalid_argument("headerReadTimeout must be non-negative");
  }
  if (bodyReadTimeout.count() < 0) {
    throw std::invalid_argument("bodyReadTimeout must be non-negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (pollInterval.count() > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (initialReadChunkBytes == 0) {
    throw std::invalid_argument("initialReadChunkBytes must be > 0");
  }
  for (const auto& [name, value] : globalHeaders) {
    if (!IsValidHeaderName(name)) {
      throw std::invalid_argument(fmt::format("header has invalid name: '{}'", name));
    }
    if (!IsValidHeaderValue(value)) {
      throw std::invalid_argument(fmt::format("header has invalid value: '{}'", value));
    }
  }
  if (!logLevel.empty() && !LogLevelFromName(logLevel)) {
    throw std::invalid_argument(fmt::format("unknown log level '{}'", logLevel));
  }
}

}  // namespace corvid
