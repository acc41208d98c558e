#include "corvid/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "corvid/http-constants.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/log.hpp"
#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/stringconv.hpp"
#include "corvid/timedef.hpp"

namespace corvid::test {

namespace {

constexpr std::size_t kRecvChunkSize = 16UL * 1024UL;

// Appends what is immediately available (flags may include MSG_DONTWAIT).
// Returns the number of bytes read, 0 on close, -1 on error (errno set).
ssize_t RecvAppend(int fd, std::string& out, int flags) {
  const std::size_t oldSize = out.size();
  ssize_t recvBytes = 0;
  out.resize_and_overwrite(oldSize + kRecvChunkSize, [&](char* data, [[maybe_unused]] std::size_t newCap) {
    recvBytes = ::recv(fd, data + oldSize, kRecvChunkSize, flags);
    return recvBytes > 0 ? oldSize + static_cast<std::size_t>(recvBytes) : oldSize;
  });
  return recvBytes;
}

std::optional<std::size_t> ContentLengthOf(std::string_view head) {
  std::size_t lineStart = head.find(http::CRLF);
  while (lineStart != std::string_view::npos && lineStart < head.size()) {
    lineStart += http::CRLF.size();
    const auto lineEnd = head.find(http::CRLF, lineStart);
    const auto line = head.substr(lineStart, lineEnd == std::string_view::npos ? head.size() - lineStart
                                                                                : lineEnd - lineStart);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && CaseInsensitiveEqual(line.substr(0, colon), http::ContentLength)) {
      auto value = line.substr(colon + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      return StringToIntegral<std::size_t>(value);
    }
    lineStart = lineEnd;
  }
  return std::nullopt;
}

// Returns true when raw holds one complete response (or request) framed by Content-Length or a last chunk.
bool IsCompleteMessage(std::string_view raw) {
  const auto headEnd = raw.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return false;
  }
  const auto head = raw.substr(0, headEnd);
  const auto bodyStart = headEnd + http::DoubleCRLF.size();
  if (ToLower(head).find("transfer-encoding: chunked") != std::string::npos) {
    return raw.find("0\r\n\r\n", bodyStart) != std::string_view::npos;
  }
  const auto contentLength = ContentLengthOf(head);
  return raw.size() >= bodyStart + contentLength.value_or(0);
}

std::string Dechunk(std::string_view raw) {
  std::string out;
  std::size_t cursor = 0;
  while (cursor < raw.size()) {
    const auto lineEnd = raw.find(http::CRLF, cursor);
    if (lineEnd == std::string_view::npos) {
      break;
    }
    auto sizeLine = raw.substr(cursor, lineEnd - cursor);
    sizeLine = sizeLine.substr(0, sizeLine.find(';'));
    cursor = lineEnd + http::CRLF.size();
    const auto chunkLen = StringToIntegral<std::size_t>(sizeLine, 16);
    if (!chunkLen || *chunkLen == 0 || cursor + *chunkLen > raw.size()) {
      break;
    }
    out.append(raw.substr(cursor, *chunkLen));
    cursor += *chunkLen + http::CRLF.size();
  }
  return out;
}

void ConnectLoop(int fd, uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  for (const auto deadline = SteadyClock::now() + timeout; SteadyClock::now() < deadline;
       std::this_thread::sleep_for(std::chrono::milliseconds{1})) {
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0) {
      return;
    }
    log::debug("connect failed for fd # {}: {}", fd, std::strerror(errno));
  }
  log::error("Unable to connect to 127.0.0.1:{} within {} ms", port, timeout.count());
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _baseFd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_baseFd) {
    throw std::runtime_error("Unable to create client socket");
  }
  ConnectLoop(_baseFd.fd(), port, timeout);
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const auto deadline = SteadyClock::now() + totalTimeout;
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent <= 0) {
      if (SteadyClock::now() >= deadline) {
        log::error("sendAll timed out after {} ms: {}", totalTimeout.count(), std::strerror(errno));
        return false;
      }
      if (sent < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        log::error("sendAll failed with error {}", std::strerror(errno));
        return false;
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto deadline = SteadyClock::now() + totalTimeout;
  while (SteadyClock::now() < deadline) {
    const auto recvBytes = RecvAppend(fd, out, MSG_DONTWAIT);
    if (recvBytes > 0) {
      continue;
    }
    if (recvBytes == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
      break;
    }
    if (IsCompleteMessage(out)) {
      break;
    }
    std::this_thread::sleep_for(1ms);
  }
  return out;
}

std::string recvUntilClosed(int fd) {
  std::string out;
  while (RecvAppend(fd, out, 0) > 0) {
  }
  return out;
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  ClientConnection clientConnection(port);
  const int fd = clientConnection.fd();
  setRecvTimeout(fd, std::chrono::seconds{5});
  if (!sendAll(fd, raw)) {
    return {};
  }
  return recvUntilClosed(fd);
}

bool setRecvTimeout(int fd, SysDuration timeout) {
  const auto timeoutUs = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
  timeval tv{static_cast<time_t>(timeoutUs / 1000000), static_cast<suseconds_t>(timeoutUs % 1000000)};
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.reserve(128 + opt.body.size());
  req.append(opt.method).append(" ").append(opt.target).append(" HTTP/1.1").append(http::CRLF);
  req.append(http::Host).append(": ").append(opt.host).append(http::CRLF);
  if (!opt.connection.empty()) {
    req.append(http::Connection).append(": ").append(opt.connection).append(http::CRLF);
  }
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(": ").append(value).append(http::CRLF);
  }
  if (!opt.body.empty()) {
    req.append(http::ContentLength).append(": ").append(std::to_string(opt.body.size())).append(http::CRLF);
  }
  req.append(http::CRLF);
  req.append(opt.body);
  return req;
}

std::string requestOrThrow(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  setRecvTimeout(cnx.fd(), std::chrono::seconds{5});
  if (!sendAll(cnx.fd(), buildRequest(opt))) {
    throw std::runtime_error("requestOrThrow: unable to send request");
  }
  auto raw = opt.connection == http::close ? recvUntilClosed(cnx.fd()) : recvWithTimeout(cnx.fd());
  if (raw.empty()) {
    throw std::runtime_error("requestOrThrow: empty response");
  }
  return raw;
}

std::string simpleGet(uint16_t port, std::string_view target) {
  RequestOptions opt;
  opt.target = std::string(target);
  return requestOrThrow(port, opt);
}

std::optional<ParsedResponse> parseResponse(std::string_view raw) {
  const auto statusLineEnd = raw.find(http::CRLF);
  const auto headEnd = raw.find(http::DoubleCRLF);
  if (statusLineEnd == std::string_view::npos || headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  // HTTP/1.x <code> <reason>
  const auto statusLine = raw.substr(0, statusLineEnd);
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos) {
    return std::nullopt;
  }
  const auto secondSpace = statusLine.find(' ', firstSpace + 1);
  const auto codeStr = statusLine.substr(firstSpace + 1, secondSpace == std::string_view::npos
                                                             ? std::string_view::npos
                                                             : secondSpace - firstSpace - 1);
  const auto code = StringToIntegral<http::StatusCode>(codeStr);
  if (!code) {
    return std::nullopt;
  }
  ParsedResponse pr;
  pr.statusCode = *code;
  if (secondSpace != std::string_view::npos) {
    pr.reason = std::string(statusLine.substr(secondSpace + 1));
  }
  std::size_t cursor = statusLineEnd + http::CRLF.size();
  while (cursor < headEnd) {
    const auto lineEnd = raw.find(http::CRLF, cursor);
    const auto line = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    auto value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    pr.headers[std::string(line.substr(0, colon))] = std::string(value);
  }
  const auto bodyRaw = raw.substr(headEnd + http::DoubleCRLF.size());
  const auto teIt = pr.headers.find(std::string(http::TransferEncoding));
  pr.chunked = teIt != pr.headers.end() && ToLower(teIt->second).find(http::chunked) != std::string::npos;
  pr.body = pr.chunked ? Dechunk(bodyRaw) : std::string(bodyRaw);
  return pr;
}

ParsedResponse parseResponseOrThrow(std::string_view raw) {
  auto parsed = parseResponse(raw);
  if (!parsed) {
    throw std::runtime_error("parseResponseOrThrow: malformed response '" + std::string(raw.substr(0, 64)) + "'");
  }
  return std::move(*parsed);
}

int countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  for (auto pos = haystack.find(needle); pos != std::string_view::npos; pos = haystack.find(needle, pos)) {
    ++count;
    pos += needle.size();
  }
  return count;
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = SteadyClock::now() + timeout;
  std::string sink;
  while (SteadyClock::now() < deadline) {
    const auto recvBytes = RecvAppend(fd, sink, MSG_DONTWAIT);
    if (recvBytes == 0) {
      return true;
    }
    if (recvBytes < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      // ECONNRESET and friends
      return true;
    }
    if (recvBytes < 0) {
      std::this_thread::sleep_for(1ms);
    }
  }
  return false;
}

ScriptedPeer::ScriptedPeer(Behavior behavior, std::string response)
    : _behavior(behavior), _response(std::move(response)) {
  _listenSocket.bindAndListen("127.0.0.1", _port, false, 4);
  _thread = std::jthread([this] { serve(); });
}

ScriptedPeer::~ScriptedPeer() {
  _stop.store(true);
  if (_thread.joinable()) {
    _thread.join();
  }
}

std::string ScriptedPeer::receivedRequest() const {
  std::scoped_lock lock(_mutex);
  return _request;
}

void ScriptedPeer::serve() {
  static constexpr int kPollSliceMs = 5;

  pollfd pfd{_listenSocket.fd(), POLLIN, 0};
  int pollRet = 0;
  while (!_stop.load() && (pollRet = ::poll(&pfd, 1, kPollSliceMs)) == 0) {
  }
  if (pollRet <= 0) {
    return;
  }
  // accepted sockets do not inherit O_NONBLOCK from the listener
  BaseFd cnx(::accept(_listenSocket.fd(), nullptr, nullptr));
  if (!cnx) {
    log::error("ScriptedPeer accept failed: {}", std::strerror(errno));
    return;
  }
  setRecvTimeout(cnx.fd(), std::chrono::milliseconds{kPollSliceMs});

  std::string received;
  while (!_stop.load() && !IsCompleteMessage(received)) {
    const auto recvBytes = RecvAppend(cnx.fd(), received, 0);
    if (recvBytes == 0 || (recvBytes < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
      break;
    }
  }
  {
    std::scoped_lock lock(_mutex);
    _request = received;
  }

  switch (_behavior) {
    case Behavior::Respond:
      if (!sendAll(cnx.fd(), _response, 2000ms)) {
        log::error("ScriptedPeer failed to send its response");
      }
      break;
    case Behavior::ResetAfterRequest: {
      // zero linger turns close() into a RST
      linger lin{1, 0};
      if (::setsockopt(cnx.fd(), SOL_SOCKET, SO_LINGER, &lin, sizeof(lin)) != 0) {
        log::error("ScriptedPeer setsockopt(SO_LINGER) failed: {}", std::strerror(errno));
      }
      break;
    }
    case Behavior::Silent:
      while (!_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{kPollSliceMs});
      }
      break;
  }
}

}  // namespace corvid::test
