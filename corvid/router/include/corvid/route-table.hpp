#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "corvid/action-registry.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/param-value.hpp"
#include "corvid/route-pattern.hpp"

namespace corvid {

// Ordered list of routes. Routes are tried in insertion order and the first one matching the path wins.
//
// Route kinds:
//  - regex:          the typed pattern must match the whole path.
//  - literal:        the path must be equal to the literal.
//  - literal prefix: the path must start with the literal, and the typed pattern must match the whole remainder.
//  - sub routes:     the typed pattern must match a prefix of the path, the remainder is resolved
//                    against a child table. Child params override the parent ones.
//
// A table is built once then published to a Router, which never mutates it.
class RouteTable {
 public:
  struct Entry {
    const HandlerRef* pHandler{nullptr};
    const RouteArgs* pArgs{nullptr};
  };

  struct Match {
    Entry entry;
    Params params;
  };

  // Throws std::invalid_argument if pattern is invalid (see RoutePattern).
  RouteTable& add(std::string_view pattern, HandlerRef handler, RouteArgs args = {});

  // Throws std::invalid_argument if path does not begin with '/'.
  RouteTable& addLiteral(std::string_view path, HandlerRef handler, RouteArgs args = {});

  // Throws std::invalid_argument if prefix does not begin with '/' or if remainderPattern is invalid.
  RouteTable& addLiteral(std::string_view prefix, std::string_view remainderPattern, HandlerRef handler,
                         RouteArgs args = {});

  // Throws std::invalid_argument if prefixPattern is invalid.
  RouteTable& addSubRoutes(std::string_view prefixPattern, RouteTable children);

  // Action invoked (with get()) to render responses of the given error status instead of the default body.
  RouteTable& setErrorAction(http::StatusCode status, HandlerRef handler, RouteArgs args = {});

  [[nodiscard]] std::optional<Match> match(std::string_view path) const;

  [[nodiscard]] std::optional<Entry> errorAction(http::StatusCode status) const;

  [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }

  [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }

 private:
  enum class Kind : uint8_t { Regex, Literal, LiteralPrefix, SubRoutes };

  struct Route {
    Kind kind;
    std::string literal;
    std::optional<RoutePattern> pattern;
    std::optional<HandlerRef> handler;
    RouteArgs args;
    std::shared_ptr<const RouteTable> children;
  };

  struct ErrorRoute {
    HandlerRef handler;
    RouteArgs args;
  };

  std::vector<Route> _routes;
  std::map<http::StatusCode, ErrorRoute> _errorRoutes;
};

}  // namespace corvid
