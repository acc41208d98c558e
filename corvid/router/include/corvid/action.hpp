#pragma once

#include "corvid/action-context.hpp"
#include "corvid/http-method.hpp"

namespace corvid {

// Per-request handler. An instance is created for each matched request with the arguments of its route,
// and the member function named after the request verb is invoked.
// Every verb defaults to a 405 "Method Not Supported" response, except head() which runs get()
// (no body bytes are sent for HEAD requests).
class Action {
 public:
  Action() noexcept = default;

  Action(const Action&) = delete;
  Action(Action&&) = delete;
  Action& operator=(const Action&) = delete;
  Action& operator=(Action&&) = delete;

  virtual ~Action() = default;

  virtual void get(ActionContext& ctx);
  virtual void head(ActionContext& ctx);
  virtual void post(ActionContext& ctx);
  virtual void put(ActionContext& ctx);
  virtual void del(ActionContext& ctx);
  virtual void options(ActionContext& ctx);
  virtual void trace(ActionContext& ctx);
  virtual void connect(ActionContext& ctx);
  virtual void patch(ActionContext& ctx);
};

// Calls the member function of action matching method.
void InvokeVerb(Action& action, http::Method method, ActionContext& ctx);

// Writes the 405 response used by the default verb implementations.
void RespondMethodNotSupported(ActionContext& ctx);

}  // namespace corvid
