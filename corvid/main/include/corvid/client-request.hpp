#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "corvid/client-config.hpp"
#include "corvid/client-response.hpp"
#include "corvid/http-method.hpp"
#include "corvid/response-writer.hpp"

namespace corvid {

class Reactor;

// Asynchronous outbound HTTP/1.1 request, driven by the Reactor of the calling thread.
//
// Configure the request, then open() it once. The completion callback is invoked exactly once, from the
// deferred queue of the Reactor (never from within open()), with either the parsed response or an error:
// connection failure or reset, malformed response, timeout, or cancel(). No retry is attempted.
// Destroying a request that has not completed yet cancels it silently: the callback is not invoked.
// A ClientRequest must not outlive its Reactor.
class ClientRequest {
 public:
  using Callback = std::function<void(ClientResponse)>;

  // Throws std::invalid_argument if host is empty or config is invalid.
  ClientRequest(Reactor& reactor, std::string host, uint16_t port, ClientConfig config = {});

  ClientRequest(const ClientRequest&) = delete;
  ClientRequest(ClientRequest&&) = delete;
  ClientRequest& operator=(const ClientRequest&) = delete;
  ClientRequest& operator=(ClientRequest&&) = delete;

  ~ClientRequest();

  ClientRequest& setMethod(http::Method method);

  // Adds a parameter, sent in the query string for GET, HEAD and DELETE, as an urlencoded body otherwise.
  ClientRequest& setParameter(std::string_view name, std::string_view value);

  // Adds a header. A header named like one of the default ones (Host, User-Agent, Connection) replaces it.
  ClientRequest& setHeader(std::string_view name, std::string_view value);

  // Adds a cookie to the Cookie header.
  ClientRequest& setCookie(std::string_view name, std::string_view value);

  // Explicit body. Parameters are then sent in the query string whatever the method.
  ClientRequest& setBody(std::string body, std::string_view contentType);

  // Starts connecting and sending the request for path.
  // Throws std::logic_error if the request was already opened, std::invalid_argument if callback is empty.
  void open(std::string_view path, Callback callback);

  // Completes a pending request with ClientError::Cancelled. No-op otherwise.
  void cancel();

  [[nodiscard]] bool opened() const noexcept { return static_cast<bool>(_exchange); }

  // Opened and not completed yet.
  [[nodiscard]] bool pending() const noexcept;

  // Serialized request as open(path) sends it.
  [[nodiscard]] std::string buildRequest(std::string_view path) const;

 private:
  class Exchange;

  [[nodiscard]] bool hasHeader(std::string_view name) const;

  Reactor& _reactor;
  std::string _host;
  uint16_t _port;
  ClientConfig _config;
  http::Method _method{http::Method::GET};
  std::vector<http::HeaderPair> _parameters;
  std::vector<http::HeaderPair> _headers;
  std::vector<http::HeaderPair> _cookies;
  std::string _body;
  std::string _contentType;
  std::shared_ptr<Exchange> _exchange;
};

}  // namespace corvid
