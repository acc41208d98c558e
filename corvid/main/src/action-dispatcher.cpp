#include "corvid/action-dispatcher.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "corvid/action-context.hpp"
#include "corvid/action-registry.hpp"
#include "corvid/action.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-request.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"
#include "corvid/log.hpp"
#include "corvid/param-value.hpp"
#include "corvid/response-writer.hpp"
#include "corvid/router.hpp"

namespace corvid {

namespace {

const HttpRequest& EmptyRequest() {
  static const HttpRequest kEmptyRequest;
  return kEmptyRequest;
}

}  // namespace

ActionDispatcher::Outcome ActionDispatcher::dispatch(const HttpRequest& request, bool keepAlive, std::string& out,
                                                     std::string_view peerAddress) const {
  const bool headRequest = request.method() == http::Method::HEAD;
  const auto result = _router.resolve(request.method(), request.path());
  switch (result.status) {
    case Router::RoutingResult::Status::NotFound:
      return respondError(http::StatusCodeNotFound, request.version(), headRequest, keepAlive, out, &request);
    case Router::RoutingResult::Status::UnresolvedHandler: {
      Outcome outcome =
          respondError(http::StatusCodeInternalServerError, request.version(), headRequest, false, out, &request);
      outcome.handlerFault = true;
      return outcome;
    }
    default:
      break;
  }

  auto outcome = runAction(*result.pFactory, *result.pArgs, result.params, request, request.method(), std::nullopt,
                           keepAlive, out, peerAddress);
  if (outcome) {
    return *outcome;
  }
  Outcome faultOutcome =
      respondError(http::StatusCodeInternalServerError, request.version(), headRequest, false, out, &request);
  faultOutcome.handlerFault = true;
  return faultOutcome;
}

ActionDispatcher::Outcome ActionDispatcher::respondError(http::StatusCode status, http::Version version,
                                                         bool headRequest, bool keepAlive, std::string& out,
                                                         const HttpRequest* pRequest) const {
  const HttpRequest& request = pRequest == nullptr ? EmptyRequest() : *pRequest;
  const auto result = _router.resolveError(status);
  if (result.found()) {
    static const Params kNoParams;
    auto outcome = runAction(*result.pFactory, *result.pArgs, kNoParams, request,
                             headRequest ? http::Method::HEAD : http::Method::GET, status, keepAlive, out, {});
    if (outcome) {
      return *outcome;
    }
    keepAlive = false;
  }

  http::ResponseWriter writer(out, version, headRequest, keepAlive);
  writer.writeSimple(status, http::ReasonPhraseFor(status), http::ContentTypeTextPlain, _globalHeaders);
  return Outcome{status, writer.keepAlive(), false};
}

std::optional<ActionDispatcher::Outcome> ActionDispatcher::runAction(
    const ActionFactory& factory, const RouteArgs& args, const Params& params, const HttpRequest& request,
    http::Method method, std::optional<http::StatusCode> presetStatus, bool keepAlive, std::string& out,
    std::string_view peerAddress) const {
  const auto mark = out.size();
  try {
    http::ResponseWriter writer(out, request.version(), method == http::Method::HEAD, keepAlive);
    if (presetStatus) {
      writer.setStatus(*presetStatus);
    }
    ActionContext ctx(request, params, args, writer, _globalHeaders, _pReactor, peerAddress);

    std::unique_ptr<Action> action = factory(args);
    if (!action) {
      throw std::runtime_error("action factory returned no action");
    }
    if (presetStatus) {
      // Error actions answer with their get() whatever the verb of the failed request.
      if (method == http::Method::HEAD) {
        action->head(ctx);
      } else {
        action->get(ctx);
      }
    } else {
      InvokeVerb(*action, method, ctx);
    }

    if (!writer.headersComposed()) {
      writer.composeHeaders(_globalHeaders);
    }
    writer.finish();
    return Outcome{writer.status(), writer.keepAlive(), false};
  } catch (const HttpError& err) {
    if (!presetStatus) {
      log::debug("Action for {} '{}' raised {}", http::MethodToStr(method), request.path(), err.status());
      out.resize(mark);
      return respondError(err.status(), request.version(), method == http::Method::HEAD, keepAlive, out, &request);
    }
    log::error("Error action for {} raised {}", *presetStatus, err.status());
  } catch (const std::exception& ex) {
    log::error("Exception in action for {} '{}': {}", http::MethodToStr(method), request.path(), ex.what());
  } catch (...) {
    log::error("Unknown exception in action for {} '{}'", http::MethodToStr(method), request.path());
  }
  out.resize(mark);
  return std::nullopt;
}

}  // namespace corvid
