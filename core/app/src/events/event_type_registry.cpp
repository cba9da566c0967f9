#include "evcore/events/event_type_registry.hpp"
#include "evcore/errors/dispatch_error.hpp"

namespace evcore {

EventTypeRegistry::EventTypeRegistry() {
  registerBuiltin(BuiltinEventType::Timer, "Timer");
}

void EventTypeRegistry::registerBuiltin(BuiltinEventType type,
                                        const std::string& name) {
  names_.emplace(toTypeId(type), name);
  ids_by_name_.emplace(name, toTypeId(type));
}

// -----------------------------------------------------------------------------
// registerEventType(): monotonic allocation in the user range
// -----------------------------------------------------------------------------
TypeId EventTypeRegistry::registerEventType(const std::string& name) {
  if (next_user_type_ > kMaxUserType) {
    throw DispatchError(ErrorKind::EventTypesExhausted,
                        "cannot register '" + name + "', all " +
                            std::to_string(kMaxUserType - kFirstUserType + 1) +
                            " user event types are in use");
  }

  TypeId id = next_user_type_++;
  names_.emplace(id, name);
  // emplace keeps the first registration when a name is reused.
  ids_by_name_.emplace(name, id);
  return id;
}

bool EventTypeRegistry::isRegistered(TypeId type) const {
  return names_.count(type) != 0;
}

std::string EventTypeRegistry::nameOf(TypeId type) const {
  auto it = names_.find(type);
  if (it == names_.end()) {
    return "<unregistered:" + std::to_string(type) + ">";
  }
  return it->second;
}

std::optional<TypeId> EventTypeRegistry::findByName(
    const std::string& name) const {
  auto it = ids_by_name_.find(name);
  if (it == ids_by_name_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace evcore
