#pragma once

#include <any>
#include <cstdint>
#include <memory>
#include <utility>

namespace evcore {

class IEventHandler;

// -----------------------------------------------------------------------------
// TypeId
// -----------------------------------------------------------------------------
// Numeric event kind. Built-in kinds live below
// EventTypeRegistry::kFirstUserType; user kinds are handed out by
// EventTypeRegistry::registerEventType() above it, so the two ranges never
// collide.
// -----------------------------------------------------------------------------
using TypeId = std::uint32_t;

// Kinds the runtime itself produces. Values are stable; hosts may compare
// against them directly (e.g. an event spy that only logs timer expiries).
enum class BuiltinEventType : TypeId {
  None = 0,
  Timer = 1,
};

constexpr TypeId toTypeId(BuiltinEventType type) {
  return static_cast<TypeId>(type);
}

// -----------------------------------------------------------------------------
// TargetRef
// -----------------------------------------------------------------------------
// Weak reference to whoever should receive an event. The host owns its
// handlers through std::shared_ptr; the loop only ever holds weak references,
// so a target destroyed between post() and delivery is detected at delivery
// time (lock() fails) and the event is dropped instead of dereferencing freed
// memory.
// -----------------------------------------------------------------------------
using TargetRef = std::weak_ptr<IEventHandler>;

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Responsibility: One typed, addressed unit of work flowing through the loop.
//
// Immutable once constructed: there are no setters, and filters and handlers
// only ever see `const Event&`. The payload is opaque to the runtime
// (std::any) because user kinds are registered at runtime and cannot be
// enumerated in a closed std::variant.
//
// sequence_id is assigned by the loop at post time and is strictly increasing
// per loop, which gives every event a total order for tracing and tests.
// -----------------------------------------------------------------------------
class Event {
 public:
  Event(TypeId type, std::any payload, TargetRef target,
        std::uint64_t sequence_id)
      : type_(type),
        payload_(std::move(payload)),
        target_(std::move(target)),
        sequence_id_(sequence_id) {}

  TypeId type() const { return type_; }

  bool is(BuiltinEventType type) const { return type_ == toTypeId(type); }

  const std::any& payload() const { return payload_; }

  // Typed view of the payload. Returns nullptr when the payload is empty or
  // holds a different type, so handlers can probe without exceptions.
  template <typename T>
  const T* payloadAs() const {
    return std::any_cast<T>(&payload_);
  }

  const TargetRef& target() const { return target_; }

  std::uint64_t sequenceId() const { return sequence_id_; }

 private:
  TypeId type_;
  std::any payload_;
  TargetRef target_;
  std::uint64_t sequence_id_;
};

}  // namespace evcore
