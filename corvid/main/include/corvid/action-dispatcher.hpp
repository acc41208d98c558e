#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "corvid/action-registry.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-request.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"
#include "corvid/param-value.hpp"
#include "corvid/response-writer.hpp"
#include "corvid/router.hpp"

namespace corvid {

class Reactor;

// Turns a complete request into response bytes appended to a connection outbound buffer.
//
// A matched route gets a fresh Action from its factory, and the member function named after the verb is
// called. Exceptions thrown by actions never escape: they are logged, the partial output is discarded and a
// 500 response is written instead, after which the connection must be closed.
// An action may also abandon its response with ActionContext::raiseError, which is answered like a routing error.
// Error responses (404, 500, protocol errors...) use the error action registered for their status if any,
// a short plain text body otherwise.
class ActionDispatcher {
 public:
  struct Outcome {
    http::StatusCode status{http::StatusCodeOK};
    // Whether the connection may serve another request.
    bool keepAlive{false};
    // The action (or its factory) threw, or its handler identifier could not be resolved.
    bool handlerFault{false};
  };

  ActionDispatcher(const Router& router, std::span<const http::HeaderPair> globalHeaders,
                   Reactor* pReactor = nullptr)
      : _router(router), _globalHeaders(globalHeaders), _pReactor(pReactor) {}

  // keepAlive is the persistence allowed for this request. The action may only clear it.
  Outcome dispatch(const HttpRequest& request, bool keepAlive, std::string& out,
                   std::string_view peerAddress = {}) const;

  // Writes the error response for status. pRequest is the request being answered, if it was parsed.
  Outcome respondError(http::StatusCode status, http::Version version, bool headRequest, bool keepAlive,
                       std::string& out, const HttpRequest* pRequest = nullptr) const;

 private:
  // Returns std::nullopt if the action threw (out is then restored).
  std::optional<Outcome> runAction(const ActionFactory& factory, const RouteArgs& args, const Params& params,
                                   const HttpRequest& request, http::Method method,
                                   std::optional<http::StatusCode> presetStatus, bool keepAlive, std::string& out,
                                   std::string_view peerAddress) const;

  const Router& _router;
  std::span<const http::HeaderPair> _globalHeaders;
  Reactor* _pReactor;
};

}  // namespace corvid
