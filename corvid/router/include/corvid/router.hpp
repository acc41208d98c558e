#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "corvid/action-registry.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/param-value.hpp"
#include "corvid/route-table.hpp"

namespace corvid {

// Resolves request paths to action factories.
//
// The Router holds immutable snapshots of a RouteTable and of an ActionRegistry. publish() and reload()
// replace a snapshot atomically: a resolution in progress keeps using the snapshots it started with
// (RoutingResult holds them), and never observes a partially updated table.
class Router {
 public:
  struct RoutingResult {
    enum class Status : uint8_t {
      Found,             // factory is set
      NotFound,          // no route matches the path
      UnresolvedHandler  // a route matched but its identifier is absent from the registry
    };

    [[nodiscard]] bool found() const noexcept { return status == Status::Found; }

    Status status{Status::NotFound};
    http::Method method{http::Method::GET};
    const ActionFactory* pFactory{nullptr};
    const RouteArgs* pArgs{nullptr};
    Params params;
    // Identifier of the handler reference, empty for direct factories.
    std::string_view handlerId;

    // Snapshots keeping pFactory, pArgs and handlerId alive.
    std::shared_ptr<const RouteTable> table;
    std::shared_ptr<const ActionRegistry> registry;
  };

  Router();

  explicit Router(RouteTable table, ActionRegistry registry = {});

  Router(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) = delete;

  ~Router() = default;

  // Atomically replaces the route table.
  void publish(RouteTable table);

  // Atomically replaces the registry used to resolve handler identifiers.
  void reload(ActionRegistry registry);

  // Publishes a copy of the current table with an error action set for status.
  void setErrorAction(http::StatusCode status, HandlerRef handler, RouteArgs args = {});

  [[nodiscard]] std::shared_ptr<const RouteTable> table() const { return _table.load(); }

  [[nodiscard]] std::shared_ptr<const ActionRegistry> registry() const { return _registry.load(); }

  // Walks the table in order and returns the first matching route with its coerced parameters.
  // The method is carried along for the dispatcher, it does not take part in matching.
  [[nodiscard]] RoutingResult resolve(http::Method method, std::string_view path) const;

  // Resolves the error action registered for status. Status NotFound if there is none.
  [[nodiscard]] RoutingResult resolveError(http::StatusCode status) const;

 private:
  RoutingResult finish(RoutingResult result, const RouteTable::Entry& entry) const;

  std::atomic<std::shared_ptr<const RouteTable>> _table;
  std::atomic<std::shared_ptr<const ActionRegistry>> _registry;
};

}  // namespace corvid
