#include "corvid/action-registry.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "corvid/log.hpp"

namespace corvid {

ActionRegistry& ActionRegistry::add(std::string id, ActionFactory factory) {
  if (id.empty()) {
    throw std::invalid_argument("Action identifier cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Cannot register an empty action factory");
  }
  auto [it, inserted] = _factories.emplace(std::move(id), std::move(factory));
  if (!inserted) {
    throw std::invalid_argument(std::string("Action '").append(it->first).append("' is already registered"));
  }
  log::debug("Registered action '{}'", it->first);
  return *this;
}

const ActionFactory* ActionRegistry::find(std::string_view id) const noexcept {
  auto it = _factories.find(id);
  return it == _factories.end() ? nullptr : &it->second;
}

HandlerRef::HandlerRef(ActionFactory factory) : _ref(std::move(factory)) {
  if (!std::get<ActionFactory>(_ref)) {
    throw std::invalid_argument("Cannot set empty action factory");
  }
}

HandlerRef::HandlerRef(std::string id) : _ref(std::move(id)) {
  if (std::get<std::string>(_ref).empty()) {
    throw std::invalid_argument("Action identifier cannot be empty");
  }
}

std::string_view HandlerRef::identifier() const noexcept {
  const auto* pId = std::get_if<std::string>(&_ref);
  return pId == nullptr ? std::string_view{} : std::string_view(*pId);
}

const ActionFactory* HandlerRef::resolve(const ActionRegistry& registry) const noexcept {
  if (const auto* pFactory = std::get_if<ActionFactory>(&_ref)) {
    return pFactory;
  }
  return registry.find(std::get<std::string>(_ref));
}

}  // namespace corvid
