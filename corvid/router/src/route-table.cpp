#include "corvid/route-table.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/log.hpp"
#include "corvid/param-value.hpp"
#include "corvid/route-pattern.hpp"

namespace corvid {

namespace {

void CheckLiteral(std::string_view literal) {
  if (literal.empty() || literal.front() != '/') {
    throw std::invalid_argument(std::string("Literal route '").append(literal).append("' must begin with '/'"));
  }
}

}  // namespace

RouteTable& RouteTable::add(std::string_view pattern, HandlerRef handler, RouteArgs args) {
  _routes.push_back(Route{Kind::Regex, {}, RoutePattern(pattern), std::move(handler), std::move(args), nullptr});
  log::debug("Registered regex route '{}'", pattern);
  return *this;
}

RouteTable& RouteTable::addLiteral(std::string_view path, HandlerRef handler, RouteArgs args) {
  CheckLiteral(path);
  _routes.push_back(Route{Kind::Literal, std::string(path), std::nullopt, std::move(handler), std::move(args), nullptr});
  log::debug("Registered literal route '{}'", path);
  return *this;
}

RouteTable& RouteTable::addLiteral(std::string_view prefix, std::string_view remainderPattern, HandlerRef handler,
                                   RouteArgs args) {
  CheckLiteral(prefix);
  _routes.push_back(Route{Kind::LiteralPrefix, std::string(prefix), RoutePattern(remainderPattern), std::move(handler),
                          std::move(args), nullptr});
  log::debug("Registered literal prefix route '{}' + '{}'", prefix, remainderPattern);
  return *this;
}

RouteTable& RouteTable::addSubRoutes(std::string_view prefixPattern, RouteTable children) {
  const std::size_t nbChildren = children.size();
  _routes.push_back(Route{Kind::SubRoutes, {}, RoutePattern(prefixPattern), std::nullopt, {},
                          std::make_shared<const RouteTable>(std::move(children))});
  log::debug("Registered sub routes '{}' with {} route(s)", prefixPattern, nbChildren);
  return *this;
}

RouteTable& RouteTable::setErrorAction(http::StatusCode status, HandlerRef handler, RouteArgs args) {
  _errorRoutes.insert_or_assign(status, ErrorRoute{std::move(handler), std::move(args)});
  return *this;
}

std::optional<RouteTable::Match> RouteTable::match(std::string_view path) const {
  for (const Route& route : _routes) {
    Params params;
    switch (route.kind) {
      case Kind::Regex:
        if (route.pattern->fullMatch(path, params)) {
          return Match{Entry{&*route.handler, &route.args}, std::move(params)};
        }
        break;
      case Kind::Literal:
        if (path == route.literal) {
          return Match{Entry{&*route.handler, &route.args}, std::move(params)};
        }
        break;
      case Kind::LiteralPrefix:
        if (path.starts_with(route.literal) && route.pattern->fullMatch(path.substr(route.literal.size()), params)) {
          return Match{Entry{&*route.handler, &route.args}, std::move(params)};
        }
        break;
      case Kind::SubRoutes: {
        const auto prefixLen = route.pattern->prefixMatch(path, params);
        if (!prefixLen) {
          break;
        }
        auto childMatch = route.children->match(path.substr(*prefixLen));
        if (childMatch) {
          params.merge(childMatch->params);
          childMatch->params = std::move(params);
          return childMatch;
        }
        break;
      }
      default:
        break;
    }
  }
  return std::nullopt;
}

std::optional<RouteTable::Entry> RouteTable::errorAction(http::StatusCode status) const {
  auto it = _errorRoutes.find(status);
  if (it == _errorRoutes.end()) {
    return std::nullopt;
  }
  return Entry{&it->second.handler, &it->second.args};
}

}  // namespace corvid
