#include "corvid/action.hpp"

#include "corvid/action-context.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-status-code.hpp"

namespace corvid {

void RespondMethodNotSupported(ActionContext& ctx) {
  ctx.respond(http::StatusCodeMethodNotAllowed, "Method Not Supported", http::ContentTypeTextPlain);
}

void Action::get(ActionContext& ctx) { RespondMethodNotSupported(ctx); }
void Action::head(ActionContext& ctx) { get(ctx); }
void Action::post(ActionContext& ctx) { RespondMethodNotSupported(ctx); }
void Action::put(ActionContext& ctx) { RespondMethodNotSupported(ctx); }
void Action::del(ActionContext& ctx) { RespondMethodNotSupported(ctx); }
void Action::options(ActionContext& ctx) { RespondMethodNotSupported(ctx); }
void Action::trace(ActionContext& ctx) { RespondMethodNotSupported(ctx); }
void Action::connect(ActionContext& ctx) { RespondMethodNotSupported(ctx); }
void Action::patch(ActionContext& ctx) { RespondMethodNotSupported(ctx); }

void InvokeVerb(Action& action, http::Method method, ActionContext& ctx) {
  switch (method) {
    case http::Method::GET:
      action.get(ctx);
      break;
    case http::Method::HEAD:
      action.head(ctx);
      break;
    case http::Method::POST:
      action.post(ctx);
      break;
    case http::Method::PUT:
      action.put(ctx);
      break;
    case http::Method::DELETE:
      action.del(ctx);
      break;
    case http::Method::OPTIONS:
      action.options(ctx);
      break;
    case http::Method::TRACE:
      action.trace(ctx);
      break;
    case http::Method::CONNECT:
      action.connect(ctx);
      break;
    case http::Method::PATCH:
      action.patch(ctx);
      break;
    default:
      RespondMethodNotSupported(ctx);
      break;
  }
}

}  // namespace corvid
