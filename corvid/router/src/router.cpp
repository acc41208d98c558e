#include "corvid/router.hpp"

#include <memory>
#include <string_view>
#include <utility>

#include "corvid/action-registry.hpp"
#include "corvid/http-method.hpp"
#include "corvid/log.hpp"
#include "corvid/route-table.hpp"

namespace corvid {

Router::Router() : Router(RouteTable{}) {}

Router::Router(RouteTable table, ActionRegistry registry)
    : _table(std::make_shared<const RouteTable>(std::move(table))),
      _registry(std::make_shared<const ActionRegistry>(std::move(registry))) {}

void Router::publish(RouteTable table) {
  const std::size_t nbRoutes = table.size();
  _table.store(std::make_shared<const RouteTable>(std::move(table)));
  log::info("Published route table with {} route(s)", nbRoutes);
}

void Router::reload(ActionRegistry registry) {
  const std::size_t nbActions = registry.size();
  _registry.store(std::make_shared<const ActionRegistry>(std::move(registry)));
  log::info("Reloaded action registry with {} action(s)", nbActions);
}

void Router::setErrorAction(http::StatusCode status, HandlerRef handler, RouteArgs args) {
  RouteTable table(*_table.load());
  table.setErrorAction(status, std::move(handler), std::move(args));
  _table.store(std::make_shared<const RouteTable>(std::move(table)));
}

Router::RoutingResult Router::finish(RoutingResult result, const RouteTable::Entry& entry) const {
  result.pArgs = entry.pArgs;
  result.handlerId = entry.pHandler->identifier();
  result.pFactory = entry.pHandler->resolve(*result.registry);
  if (result.pFactory == nullptr) {
    log::error("No action registered under '{}'", result.handlerId);
    result.status = RoutingResult::Status::UnresolvedHandler;
  } else {
    result.status = RoutingResult::Status::Found;
  }
  return result;
}

Router::RoutingResult Router::resolve(http::Method method, std::string_view path) const {
  RoutingResult result;
  result.method = method;
  result.table = _table.load();
  result.registry = _registry.load();

  auto match = result.table->match(path);
  if (!match) {
    log::debug("No route for {} {}", http::MethodToStr(method), path);
    return result;
  }
  result.params = std::move(match->params);
  return finish(std::move(result), match->entry);
}

Router::RoutingResult Router::resolveError(http::StatusCode status) const {
  RoutingResult result;
  result.table = _table.load();
  result.registry = _registry.load();

  const auto entry = result.table->errorAction(status);
  if (!entry) {
    return result;
  }
  return finish(std::move(result), *entry);
}

}  // namespace corvid
