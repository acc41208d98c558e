#pragma once

#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "corvid/request-parser.hpp"
#include "corvid/response-writer.hpp"

namespace corvid {

struct ListenAddress {
  // Host name or address to bind. Empty or "*" binds all IPv4 interfaces.
  std::string host;
  // 0 lets the OS pick an ephemeral port (only meaningful without pre-forked workers sharing by SO_REUSEPORT).
  uint16_t port{0};

  bool operator==(const ListenAddress&) const = default;
};

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // Ordered list of (host, port) pairs to bind. Default: a single ephemeral port on all interfaces.
  std::vector<ListenAddress> listeners{ListenAddress{}};

  // If true, listening sockets are created with SO_REUSEPORT so that several processes can bind the same port,
  // the kernel then distributes incoming connections between them.
  bool reusePort{false};

  // Disable the Nagle algorithm on accepted connections.
  bool tcpNoDelay{false};

  // listen() backlog.
  int backlog{SOMAXCONN};

  // ============================
  // Request parsing limits
  // ============================
  // Exceeding them is a protocol error answered with 414, 431 or 413 respectively, then the connection is closed.
  std::size_t maxRequestLineBytes{8UL * 1024};
  std::size_t maxHeaderBytes{16UL * 1024};
  std::size_t maxBodyBytes{10UL * 1024 * 1024};

  // ============================
  // multipart/form-data uploads
  // ============================
  // Uploaded files larger than this are reported to the action with UploadError::MaxSizeExceeded and no content.
  // 0 means no limit other than maxBodyBytes.
  std::size_t maxUploadBytes{0};

  // Existing directory where uploaded files are written for the time of their request (see UploadedFile::tempPath).
  // Empty keeps uploads in memory only.
  std::string uploadDir;

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // When false, the server closes each connection after its first response.
  bool enableKeepAlive{true};

  // Maximum number of requests served over one persistent connection before forcing close.
  uint32_t maxRequestsPerConnection{100};

  // Once more response bytes than this are waiting for the peer, the connection stops reading and dispatching
  // (pipelined requests stay buffered) until enough of them are sent.
  std::size_t maxOutboundBufferBytes{4UL << 20};

  // Idle time allowed between two requests on a persistent connection.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::seconds{5}};

  // Maximum time to receive a complete request head once its first byte arrived (408 then close). 0 disables it.
  std::chrono::milliseconds headerReadTimeout{std::chrono::seconds{10}};

  // Maximum time to receive a complete body once the head was parsed (408 then close). 0 disables it.
  std::chrono::milliseconds bodyReadTimeout{std::chrono::seconds{30}};

  // ===========================================
  // Event loop tuning
  // ===========================================
  // Maintenance tick period (timeouts sweeping, stop request checks).
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{100}};

  // Size of each read from a socket.
  std::size_t initialReadChunkBytes{4096};

  // Headers added to every response unless the action sets the same header.
  std::vector<http::HeaderPair> globalHeaders{{"Server", "corvid"}};

  // spdlog level name (trace, debug, info, warn, error, critical, off). Empty keeps the current level.
  std::string logLevel;

  ServerConfig& withListener(std::string_view host, uint16_t port);

  // Replaces all listeners.
  ServerConfig& withListeners(std::span<const ListenAddress> listenAddresses);

  // Shortcut replacing the listeners by a single one on all interfaces.
  ServerConfig& withPort(uint16_t port);

  ServerConfig& withReusePort(bool on = true);

  ServerConfig& withTcpNoDelay(bool on = true);

  ServerConfig& withBacklog(int backlog);

  ServerConfig& withMaxRequestLineBytes(std::size_t maxRequestLineBytes);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  ServerConfig& withMaxUploadBytes(std::size_t maxUploadBytes);

  ServerConfig& withUploadDir(std::string_view uploadDir);

  ServerConfig& withKeepAliveMode(bool on = true);

  ServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  ServerConfig& withMaxOutboundBufferBytes(std::size_t maxOutbound);

  ServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withHeaderReadTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withBodyReadTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  ServerConfig& withInitialReadChunkBytes(std::size_t bytes);

  // Replaces all global headers.
  ServerConfig& withGlobalHeaders(std::vector<http::HeaderPair> headers);

  ServerConfig& addGlobalHeader(std::string_view name, std::string_view value);

  ServerConfig& withLogLevel(std::string_view level);

  [[nodiscard]] ParserLimits parserLimits() const noexcept {
    ParserLimits limits;
    limits.maxRequestLineBytes = maxRequestLineBytes;
    limits.maxHeaderBytes = maxHeaderBytes;
    limits.maxBodyBytes = maxBodyBytes;
    limits.maxUploadBytes = maxUploadBytes;
    return limits;
  }

  // Throws std::invalid_argument if the config is not valid.
  void validate() const;

  bool operator==(const ServerConfig&) const = default;
};

}  // namespace corvid
