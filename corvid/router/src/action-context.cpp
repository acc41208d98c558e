#include "corvid/action-context.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include "corvid/http-constants.hpp"
#include "corvid/http-status-code.hpp"

namespace corvid {

HttpError::HttpError(http::StatusCode status)
    : std::runtime_error("HTTP error " + std::to_string(status)), _status(status) {}

void ActionContext::respond(http::StatusCode status, std::string_view body, std::string_view contentType) {
  setStatus(status);
  setContentType(contentType);
  setHeader(http::ContentLength, std::to_string(body.size()));
  composeHeaders();
  write(body);
}

void ActionContext::redirect(std::string_view url, http::StatusCode status) {
  if (status < 300 || status >= 400) {
    throw std::invalid_argument("redirect status must be a 3xx code");
  }
  setStatus(status);
  setHeader(http::Location, url);
  setHeader(http::ContentLength, "0");
  composeHeaders();
}

Reactor& ActionContext::reactor() const {
  if (_pReactor == nullptr) {
    throw std::logic_error("no Reactor attached to this action context");
  }
  return *_pReactor;
}

}  // namespace corvid
