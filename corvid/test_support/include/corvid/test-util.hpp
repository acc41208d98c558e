#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "corvid/base-fd.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/socket.hpp"
#include "corvid/timedef.hpp"

namespace corvid::test {
using namespace std::chrono_literals;

// Blocking loopback client socket, connected in the constructor (retrying until timeout).
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  bool chunked{false};
  std::string reason;
  std::map<std::string, std::string> headers;  // case-sensitive keys (sufficient for tests)
  std::string body;                            // de-chunked if Transfer-Encoding: chunked
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string connection{"close"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;  // additional headers
};

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads until a complete HTTP response (by Content-Length, last chunk or peer close) or timeout.
std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

std::string recvUntilClosed(int fd);

// Connects, sends raw and reads until the server closes the connection.
std::string sendAndCollect(uint16_t port, std::string_view raw);

bool setRecvTimeout(int fd, SysDuration timeout);

std::string buildRequest(const RequestOptions& opt);

// Sends one request built from opt and returns the raw response, read until the server closes.
std::string requestOrThrow(uint16_t port, const RequestOptions& opt = {});

std::string simpleGet(uint16_t port, std::string_view target);

// Very small HTTP/1.x response parser (not resilient to all malformed cases, just for test consumption).
std::optional<ParsedResponse> parseResponse(std::string_view raw);

ParsedResponse parseResponseOrThrow(std::string_view raw);

int countOccurrences(std::string_view haystack, std::string_view needle);

// Returns true if the peer closed the connection (or reset it) within timeout.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

// One shot TCP peer on loopback playing a scripted role against an outbound client.
// The exchange runs in a background thread started by the constructor.
class ScriptedPeer {
 public:
  enum class Behavior : uint8_t {
    Respond,           // read the request, send the response, close
    ResetAfterRequest,  // read the request, reset the connection (RST)
    Silent             // read the request, never answer until destroyed
  };

  explicit ScriptedPeer(Behavior behavior, std::string response = {});

  ScriptedPeer(const ScriptedPeer&) = delete;
  ScriptedPeer(ScriptedPeer&&) = delete;
  ScriptedPeer& operator=(const ScriptedPeer&) = delete;
  ScriptedPeer& operator=(ScriptedPeer&&) = delete;

  ~ScriptedPeer();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Request bytes received so far.
  [[nodiscard]] std::string receivedRequest() const;

 private:
  void serve();

  Behavior _behavior;
  std::string _response;
  uint16_t _port{0};
  Socket _listenSocket;
  mutable std::mutex _mutex;
  std::string _request;
  std::atomic<bool> _stop{false};
  std::jthread _thread;
};

}  // namespace corvid::test
