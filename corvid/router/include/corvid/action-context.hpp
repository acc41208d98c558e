#pragma once

#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/cookies.hpp"
#include "corvid/http-request.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/param-value.hpp"
#include "corvid/response-writer.hpp"

namespace corvid {

class Reactor;

// Thrown by ActionContext::raiseError. The dispatcher answers with the error response of status instead.
class HttpError : public std::runtime_error {
 public:
  explicit HttpError(http::StatusCode status);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

 private:
  http::StatusCode _status;
};

// Everything an Action sees of the request it serves, and its only way to produce a response.
// Lives for the duration of one dispatch.
class ActionContext {
 public:
  ActionContext(const HttpRequest& request, const Params& params, const RouteArgs& args, http::ResponseWriter& writer,
                std::span<const http::HeaderPair> globalHeaders = {}, Reactor* pReactor = nullptr,
                std::string_view peerAddress = {})
      : _request(request),
        _params(params),
        _args(args),
        _writer(writer),
        _globalHeaders(globalHeaders),
        _pReactor(pReactor),
        _peerAddress(peerAddress) {}

  [[nodiscard]] const HttpRequest& request() const noexcept { return _request; }

  // Typed values captured from the path.
  [[nodiscard]] const Params& params() const noexcept { return _params; }

  // Arguments declared on the matched route.
  [[nodiscard]] const RouteArgs& args() const noexcept { return _args; }

  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const {
    return _request.headerValue(name);
  }

  [[nodiscard]] std::optional<std::string_view> cookie(std::string_view name) const { return _request.cookie(name); }

  // Last value of a query string or form body parameter.
  [[nodiscard]] std::optional<std::string_view> argument(std::string_view name) const {
    return _request.queryParams().get(name);
  }

  // "ip:port" of the client, empty if unknown.
  [[nodiscard]] std::string_view peerAddress() const noexcept { return _peerAddress; }

  void setStatus(http::StatusCode status, std::string_view reason = {}) { _writer.setStatus(status, reason); }

  [[nodiscard]] http::StatusCode status() const noexcept { return _writer.status(); }

  void setHeader(std::string_view name, std::string_view value) { _writer.setHeader(name, value); }

  void setContentType(std::string_view contentType) { _writer.setContentType(contentType); }

  void setCookie(http::ResponseCookie cookie) { _writer.setCookie(std::move(cookie)); }

  // Emits the status line and headers. Must be called once, before any write().
  void composeHeaders() { _writer.composeHeaders(_globalHeaders); }

  [[nodiscard]] bool headersComposed() const noexcept { return _writer.headersComposed(); }

  // Appends body bytes to the connection outbound buffer, in call order.
  // Throws std::logic_error if composeHeaders() was not called.
  void write(std::string_view data) { _writer.write(data); }

  // Sets status and content type, composes headers and writes the whole body at once (with Content-Length).
  void respond(http::StatusCode status, std::string_view body, std::string_view contentType);

  // Answers with status and a Location header pointing to url, without body.
  // Throws std::invalid_argument if status is not a 3xx code.
  void redirect(std::string_view url, http::StatusCode status = http::StatusCodeTemporaryRedirect);

  // Abandons the response produced so far and answers with the error response of status
  // (the error action registered for it if any).
  [[noreturn]] void raiseError(http::StatusCode status) const { throw HttpError(status); }

  // Reactor serving this request, to issue outbound requests from an action.
  // Throws std::logic_error when the action is not run by a Reactor.
  [[nodiscard]] Reactor& reactor() const;

 private:
  const HttpRequest& _request;
  const Params& _params;
  const RouteArgs& _args;
  http::ResponseWriter& _writer;
  std::span<const http::HeaderPair> _globalHeaders;
  Reactor* _pReactor;
  std::string_view _peerAddress;
};

}  // namespace corvid
