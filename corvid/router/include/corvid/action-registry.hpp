#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "corvid/action.hpp"
#include "corvid/param-value.hpp"

namespace corvid {

// Creates a fresh Action for one request from the arguments of its route.
using ActionFactory = std::function<std::unique_ptr<Action>(const RouteArgs&)>;

// Factory for an Action type, constructed from the route arguments if it accepts them.
template <class ActionT>
  requires std::derived_from<ActionT, Action>
ActionFactory MakeActionFactory() {
  return [](const RouteArgs& args) -> std::unique_ptr<Action> {
    if constexpr (std::is_constructible_v<ActionT, const RouteArgs&>) {
      return std::make_unique<ActionT>(args);
    } else {
      return std::make_unique<ActionT>();
    }
  };
}

// Maps stable identifiers (for instance "app.handlers.Greeter") to factories.
// A registry is immutable once handed to a Router, which swaps it as a whole on reload.
class ActionRegistry {
 public:
  // Throws std::invalid_argument if id is empty, already registered, or factory is empty.
  ActionRegistry& add(std::string id, ActionFactory factory);

  template <class ActionT>
  ActionRegistry& add(std::string id) {
    return add(std::move(id), MakeActionFactory<ActionT>());
  }

  // Returns nullptr if id is unknown.
  [[nodiscard]] const ActionFactory* find(std::string_view id) const noexcept;

  [[nodiscard]] bool contains(std::string_view id) const noexcept { return find(id) != nullptr; }

  [[nodiscard]] std::size_t size() const noexcept { return _factories.size(); }

 private:
  std::map<std::string, ActionFactory, std::less<>> _factories;
};

// Reference to the handler of a route: either a factory held directly, or the identifier of a factory
// looked up in the current ActionRegistry each time the route matches.
class HandlerRef {
 public:
  // Throws std::invalid_argument if factory is empty.
  HandlerRef(ActionFactory factory);  // NOLINT(google-explicit-constructor)

  template <class Func>
    requires(!std::same_as<std::remove_cvref_t<Func>, ActionFactory> &&
             std::is_invocable_r_v<std::unique_ptr<Action>, Func&, const RouteArgs&>)
  HandlerRef(Func func)  // NOLINT(google-explicit-constructor)
      : HandlerRef(ActionFactory(std::move(func))) {}

  // Throws std::invalid_argument if id is empty.
  HandlerRef(std::string id);  // NOLINT(google-explicit-constructor)

  HandlerRef(const char* id) : HandlerRef(std::string(id)) {}  // NOLINT(google-explicit-constructor)

  template <class ActionT>
  static HandlerRef Of() {
    return HandlerRef(MakeActionFactory<ActionT>());
  }

  [[nodiscard]] bool isIdentifier() const noexcept { return std::holds_alternative<std::string>(_ref); }

  // Identifier, empty for a direct factory.
  [[nodiscard]] std::string_view identifier() const noexcept;

  // Direct factory, or the factory registered under the identifier in registry (nullptr if absent).
  [[nodiscard]] const ActionFactory* resolve(const ActionRegistry& registry) const noexcept;

 private:
  std::variant<ActionFactory, std::string> _ref;
};

}  // namespace corvid
