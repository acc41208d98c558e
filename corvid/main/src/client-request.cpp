#include "corvid/client-request.hpp"

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/client-config.hpp"
#include "corvid/client-response.hpp"
#include "corvid/connection.hpp"
#include "corvid/event-handler.hpp"
#include "corvid/event.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-method.hpp"
#include "corvid/log.hpp"
#include "corvid/reactor.hpp"
#include "corvid/response-parser.hpp"
#include "corvid/socket-ops.hpp"
#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/tcp-connector.hpp"
#include "corvid/timedef.hpp"
#include "corvid/url-encode.hpp"

namespace corvid {

namespace {

constexpr std::size_t kReadChunkBytes = 16UL * 1024;

bool SendsParametersInQuery(http::Method method) {
  return method == http::Method::GET || method == http::Method::HEAD || method == http::Method::DELETE;
}

bool ExpectsBody(http::Method method) {
  return method == http::Method::POST || method == http::Method::PUT || method == http::Method::PATCH;
}

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name).append(": ").append(value).append(http::CRLF);
}

}  // namespace

// Connection and parsing state of an opened request. Shared between the ClientRequest and the deferred
// completion callback, so that it outlives the ClientRequest until the callback ran.
class ClientRequest::Exchange : public EventHandler, public std::enable_shared_from_this<Exchange> {
 public:
  Exchange(Reactor& reactor, const ClientConfig& config, bool headRequest, Callback callback)
      : _reactor(reactor),
        _parser(_response, headRequest, config.maxResponseBytes),
        _callback(std::move(callback)),
        _timeout(config.requestTimeout) {}

  ~Exchange() override { teardown(); }

  void start(const std::string& host, uint16_t port, std::string request);

  void onEvent(int fd, EventBmp events) override;

  void onTick(SteadyTimePoint now) override;

  void cancel() {
    if (!_done) {
      complete(ClientError::Cancelled, "request cancelled");
    }
  }

  // The owning ClientRequest is gone: stop everything, never call back.
  void detach() {
    _callback = nullptr;
    _done = true;
    teardown();
  }

  [[nodiscard]] bool done() const noexcept { return _done; }

 private:
  void flush();
  void readAvailable();
  void complete(ClientError error, std::string message);
  void deliver();
  void teardown();

  Reactor& _reactor;
  Connection _cnx;
  ClientResponse _response;
  ResponseParser _parser;
  Callback _callback;
  std::chrono::milliseconds _timeout;
  SteadyTimePoint _deadline;
  std::string _out;
  std::size_t _outOffset{0};
  std::string _in;
  bool _connectPending{false};
  bool _registered{false};
  bool _subscribedTicks{false};
  bool _done{false};
};

void ClientRequest::Exchange::start(const std::string& host, uint16_t port, std::string request) {
  _out = std::move(request);
  if (_timeout.count() > 0) {
    _deadline = SteadyClock::now() + _timeout;
    _reactor.subscribeTicks(*this);
    _subscribedTicks = true;
  }

  ConnectResult connectResult = ConnectTCP(host, port);
  if (connectResult.failure) {
    complete(ClientError::ResolveOrConnect, fmt::format("unable to connect to {}:{}", host, port));
    return;
  }
  _cnx = std::move(connectResult.cnx);
  _connectPending = connectResult.connectPending;
  if (!_reactor.add(_cnx.fd(), EventIn | EventOut | EventRdHup | EventEt, *this)) {
    complete(ClientError::ResolveOrConnect, fmt::format("unable to watch connection fd # {}", _cnx.fd()));
    return;
  }
  _registered = true;
  log::debug("Outbound connection fd # {} to {}:{}{}", _cnx.fd(), host, port,
             _connectPending ? " (connect pending)" : "");
}

void ClientRequest::Exchange::onEvent(int fd, EventBmp events) {
  if (_done) {
    return;
  }
  if (_connectPending) {
    if ((events & EventOut) == 0 && !IsTerminalEvent(events)) {
      return;
    }
    const int err = GetSocketError(fd);
    if (err != 0) {
      complete(ClientError::ResolveOrConnect, fmt::format("connect failed: {}", std::strerror(err)));
      return;
    }
    _connectPending = false;
  }
  if ((events & EventOut) != 0) {
    flush();
    if (_done) {
      return;
    }
  }
  if ((events & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
    readAvailable();
  }
}

void ClientRequest::Exchange::onTick(SteadyTimePoint now) {
  if (!_done && now >= _deadline) {
    complete(ClientError::Timeout, fmt::format("no complete response within {} ms", _timeout.count()));
  }
}

void ClientRequest::Exchange::flush() {
  while (_outOffset < _out.size()) {
    const auto written = SafeSend(_cnx.fd(), std::string_view(_out).substr(_outOffset));
    if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      complete(ClientError::ConnectionReset, fmt::format("send failed: {}", std::strerror(errno)));
      return;
    }
    if (written <= 0) {
      // Resumed on the next writable edge.
      return;
    }
    _outOffset += static_cast<std::size_t>(written);
  }
}

void ClientRequest::Exchange::readAvailable() {
  while (true) {
    const std::size_t oldSize = _in.size();
    _in.resize(oldSize + kReadChunkBytes);
    const auto count = SafeRecv(_cnx.fd(), _in.data() + oldSize, kReadChunkBytes);
    if (count < 0) {
      _in.resize(oldSize);
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return;
      }
      complete(ClientError::ConnectionReset, fmt::format("recv failed: {}", std::strerror(errno)));
      return;
    }
    if (count == 0) {
      _in.resize(oldSize);
      if (_parser.onEof() == ResponseParser::Status::Complete) {
        complete(ClientError::None, {});
      } else {
        complete(ClientError::ConnectionReset, std::string(_parser.errorMessage()));
      }
      return;
    }
    _in.resize(oldSize + static_cast<std::size_t>(count));
    switch (_parser.parse(_in)) {
      case ResponseParser::Status::Complete:
        complete(ClientError::None, {});
        return;
      case ResponseParser::Status::Error:
        complete(ClientError::Protocol, std::string(_parser.errorMessage()));
        return;
      default:
        break;
    }
  }
}

void ClientRequest::Exchange::complete(ClientError error, std::string message) {
  _done = true;
  _response.error = error;
  _response.errorMessage = std::move(message);
  if (error == ClientError::None) {
    log::debug("Outbound request completed with status {}", _response.status);
  } else {
    log::warn("Outbound request failed ({}): {}", ClientErrorToStr(error), _response.errorMessage);
  }
  teardown();
  _reactor.defer([self = shared_from_this()] { self->deliver(); });
}

void ClientRequest::Exchange::deliver() {
  if (_callback) {
    auto callback = std::exchange(_callback, nullptr);
    callback(std::move(_response));
  }
}

void ClientRequest::Exchange::teardown() {
  if (_registered) {
    _reactor.remove(_cnx.fd());
    _registered = false;
  }
  if (_subscribedTicks) {
    _reactor.unsubscribeTicks(*this);
    _subscribedTicks = false;
  }
  _cnx.close();
}

ClientRequest::ClientRequest(Reactor& reactor, std::string host, uint16_t port, ClientConfig config)
    : _reactor(reactor), _host(std::move(host)), _port(port), _config(std::move(config)) {
  if (_host.empty()) {
    throw std::invalid_argument("ClientRequest needs a host");
  }
  _config.validate();
}

ClientRequest::~ClientRequest() {
  if (_exchange) {
    _exchange->detach();
  }
}

ClientRequest& ClientRequest::setMethod(http::Method method) {
  _method = method;
  return *this;
}

ClientRequest& ClientRequest::setParameter(std::string_view name, std::string_view value) {
  _parameters.emplace_back(name, value);
  return *this;
}

ClientRequest& ClientRequest::setHeader(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

ClientRequest& ClientRequest::setCookie(std::string_view name, std::string_view value) {
  _cookies.emplace_back(name, value);
  return *this;
}

ClientRequest& ClientRequest::setBody(std::string body, std::string_view contentType) {
  _body = std::move(body);
  _contentType.assign(contentType);
  return *this;
}

bool ClientRequest::pending() const noexcept { return _exchange && !_exchange->done(); }

bool ClientRequest::hasHeader(std::string_view name) const {
  for (const auto& [headerName, value] : _headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return true;
    }
  }
  return false;
}

std::string ClientRequest::buildRequest(std::string_view path) const {
  std::string target(path);
  if (target.empty() || target.front() != '/') {
    target.insert(target.begin(), '/');
  }

  std::string encodedParameters;
  for (const auto& [name, value] : _parameters) {
    url::AppendFormPair(encodedParameters, name, value);
  }

  std::string_view body = _body;
  std::string_view contentType = _contentType;
  const bool parametersInQuery = SendsParametersInQuery(_method) || !_body.empty();
  if (!encodedParameters.empty()) {
    if (parametersInQuery) {
      target.push_back(target.find('?') == std::string::npos ? '?' : '&');
      target.append(encodedParameters);
    } else {
      body = encodedParameters;
      contentType = http::ContentTypeFormUrlEncoded;
    }
  }

  std::string out;
  out.reserve(256 + target.size() + body.size());
  out.append(http::MethodToStr(_method)).append(" ").append(target).append(" HTTP/1.1").append(http::CRLF);
  if (!hasHeader(http::Host)) {
    AppendHeader(out, http::Host, _port == 80 ? _host : fmt::format("{}:{}", _host, _port));
  }
  if (!_config.userAgent.empty() && !hasHeader(http::UserAgent)) {
    AppendHeader(out, http::UserAgent, _config.userAgent);
  }
  if (!_cookies.empty()) {
    std::string cookieValue;
    for (const auto& [name, value] : _cookies) {
      if (!cookieValue.empty()) {
        cookieValue.append("; ");
      }
      cookieValue.append(name).append("=").append(value);
    }
    AppendHeader(out, http::Cookie, cookieValue);
  }
  for (const auto& [name, value] : _headers) {
    AppendHeader(out, name, value);
  }
  if (!hasHeader(http::Connection)) {
    AppendHeader(out, http::Connection, http::close);
  }
  if (!body.empty() && !contentType.empty()) {
    AppendHeader(out, http::ContentType, contentType);
  }
  if (!body.empty() || ExpectsBody(_method)) {
    AppendHeader(out, http::ContentLength, std::to_string(body.size()));
  }
  out.append(http::CRLF);
  out.append(body);
  return out;
}

void ClientRequest::open(std::string_view path, Callback callback) {
  if (_exchange) {
    throw std::logic_error("ClientRequest can only be opened once");
  }
  if (!callback) {
    throw std::invalid_argument("ClientRequest needs a completion callback");
  }
  std::string request = buildRequest(path);
  log::debug("Opening {} {}:{}{}", http::MethodToStr(_method), _host, _port, path);
  _exchange = std::make_shared<Exchange>(_reactor, _config, _method == http::Method::HEAD, std::move(callback));
  _exchange->start(_host, _port, std::move(request));
}

void ClientRequest::cancel() {
  if (_exchange) {
    _exchange->cancel();
  }
}

}  // namespace corvid
