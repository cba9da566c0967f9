#pragma once

#include "evcore/events/event.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace evcore {

// -----------------------------------------------------------------------------
// EventTypeRegistry - runtime allocator for event kinds
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique TypeIds on demand and remembers which ids are
//         valid, so EventLoop::post() can reject unknown kinds at the call
//         site.
//
// @details
// Built-in kinds (BuiltinEventType) are registered by the constructor and
// occupy ids below kFirstUserType. registerEventType() returns ids starting
// at kFirstUserType and increasing by one per call; ids are never reused.
// Once kMaxUserType has been handed out, further registrations throw
// DispatchError(EventTypesExhausted).
//
// Why not a process-wide static:
//   The registry is owned by the EventLoop (one per loop) and reached through
//   EventLoop::eventTypes(). Every component that posts already holds the
//   loop, so nothing needs a hidden global, and tests get a fresh id space
//   per fixture.
//
// Thread model:
//   Single execution context; no locking. The counter is only ever touched
//   by the thread that runs the loop.
// -----------------------------------------------------------------------------
class EventTypeRegistry {
 public:
  static constexpr TypeId kFirstUserType = 1000;
  static constexpr TypeId kMaxUserType = 65535;

  EventTypeRegistry();

  EventTypeRegistry(const EventTypeRegistry&) = delete;
  EventTypeRegistry& operator=(const EventTypeRegistry&) = delete;

  // -------------------------------------------------------------------------
  // registerEventType(name)
  // -------------------------------------------------------------------------
  // @brief  Allocates the next user TypeId and records its display name.
  //
  // @param  name  Label used in logs and by findByName(). Names need not be
  //               unique; findByName() resolves to the first registration.
  // @return The new TypeId (>= kFirstUserType).
  // @throws DispatchError(EventTypesExhausted) when the user range is used up.
  // -------------------------------------------------------------------------
  TypeId registerEventType(const std::string& name);

  bool isRegistered(TypeId type) const;

  // Display name, or "<unregistered:N>" for ids nobody allocated.
  std::string nameOf(TypeId type) const;

  std::optional<TypeId> findByName(const std::string& name) const;

  // Number of user kinds handed out so far.
  std::size_t userTypeCount() const { return next_user_type_ - kFirstUserType; }

 private:
  void registerBuiltin(BuiltinEventType type, const std::string& name);

  TypeId next_user_type_{kFirstUserType};
  std::unordered_map<TypeId, std::string> names_;
  std::unordered_map<std::string, TypeId> ids_by_name_;
};

}  // namespace evcore
