#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace evcore {

// Arguments of one emission. Slots that expect a concrete type use
// SignalBus::connect<Arg>() instead of probing the std::any themselves.
using SignalArgs = std::any;

// -----------------------------------------------------------------------------
// SignalBus
// -----------------------------------------------------------------------------
// Responsibility: Signal/slot dispatch table. Observers connect a slot to an
// (emitter, signal) pair; emit() invokes every connected slot synchronously,
// in connection order, on the caller's stack, before returning.
//
// Why in architecture: Handlers announce things ("finished", "aboutToQuit")
// without knowing who listens. The bus is the only coupling between them.
// Emission never goes through the EventQueue and never re-enters the loop, so
// a slot that asks the loop to quit only sets a flag; the handler that emitted
// keeps running to the end.
//
// Emitter identity is an address (any object can emit by passing `this`);
// signal ids are strings. Args travel as std::any, with a typed connect<Arg>()
// for slots that expect a concrete type.
//
// A raw address says nothing about lifetime. An emitter owned by a
// shared_ptr should connect through the weak_ptr overload: its connections
// die with it, and a later object allocated at the same address never
// inherits them. An emitter connected by address must call disconnectAll()
// from its destructor instead.
//
// Reentrancy: emit() copies the matching connections first and then invokes
// the copy, so slots may connect, disconnect or emit (recursively) freely.
//   - A connection made during an emission is not reached by it.
//   - A connection removed during an emission is skipped if the emission has
//     not reached it yet, and is never invoked again.
//   - A slot that disconnects itself finishes its current invocation.
//
// Thread model: Single execution context; no mutex. All slots run on the
// thread that calls emit().
// -----------------------------------------------------------------------------
class SignalBus {
 public:
  using EmitterId = const void*;
  using SignalId = std::string;
  using SignalArgs = evcore::SignalArgs;
  using Slot = std::function<void(const SignalArgs&)>;

  // Opaque id returned by connect(); pass to disconnect() to remove.
  using ConnectionId = std::uint64_t;

  SignalBus() = default;

  // Non-copyable: copies would share connection ids with the original.
  SignalBus(const SignalBus&) = delete;
  SignalBus& operator=(const SignalBus&) = delete;

  // -------------------------------------------------------------------------
  // connect(emitter, signal, slot)
  // -------------------------------------------------------------------------
  // What: Appends a connection. The slot will be invoked by every later
  // emit(emitter, signal, ...).
  // Output: ConnectionId for disconnect().
  // -------------------------------------------------------------------------
  ConnectionId connect(EmitterId emitter, SignalId signal, Slot slot);

  // -------------------------------------------------------------------------
  // connect(emitter, signal, observer, slot)
  // -------------------------------------------------------------------------
  // Same as above, but the connection dies with `observer`: once the last
  // shared_ptr to it is gone the slot is never invoked again and the
  // connection is dropped at the next emission that reaches it.
  // -------------------------------------------------------------------------
  ConnectionId connect(EmitterId emitter, SignalId signal,
                       std::weak_ptr<void> observer, Slot slot);

  // -------------------------------------------------------------------------
  // connect(emitter_owner, signal, slot)
  // -------------------------------------------------------------------------
  // Lifetime-tracked emitter. The emitter address is taken from the owner;
  // emit(address, signal) reaches the slot only while the owner is alive.
  // Once the last shared_ptr to the emitter is gone the connection is never
  // invoked again and is dropped at the next connect() or emission.
  // Output: ConnectionId, or 0 if the emitter is already gone.
  // -------------------------------------------------------------------------
  ConnectionId connect(std::weak_ptr<void> emitter_owner, SignalId signal,
                       Slot slot);

  // Typed slot: invoked only when the emitted args hold an Arg.
  template <typename Arg>
  ConnectionId connect(EmitterId emitter, SignalId signal,
                       std::function<void(const Arg&)> slot);

  // Returns false for an unknown or already-removed id.
  bool disconnect(ConnectionId id);

  // Drops every connection of `emitter` (all signals). Call from the
  // destructor of an emitter connected by address. Output: number of
  // connections removed.
  std::size_t disconnectAll(EmitterId emitter);

  // -------------------------------------------------------------------------
  // emit(emitter, signal, args)
  // -------------------------------------------------------------------------
  // What: Invokes every slot connected to (emitter, signal) at the moment of
  // the call, in connection order, synchronously. Exceptions thrown by a slot
  // propagate out of emit(); later slots of this emission are not invoked.
  // Output: number of slots invoked.
  // -------------------------------------------------------------------------
  std::size_t emit(EmitterId emitter, const SignalId& signal,
                   const SignalArgs& args = {});

  std::size_t connectionCount(EmitterId emitter, const SignalId& signal) const;

  std::size_t connectionCount() const { return connections_.size(); }

 private:
  struct Connection {
    ConnectionId id{0};
    EmitterId emitter{nullptr};
    SignalId signal;
    bool tracks_emitter{false};
    std::weak_ptr<void> emitter_owner;
    bool tracks_observer{false};
    std::weak_ptr<void> observer;
    Slot slot;
    // Cleared on disconnect; checked by emissions holding a snapshot.
    bool connected{true};

    bool expired() const {
      return (tracks_emitter && emitter_owner.expired()) ||
             (tracks_observer && observer.expired());
    }
  };

  std::shared_ptr<Connection> add(EmitterId emitter, SignalId signal,
                                  Slot slot);

  // Removes connections whose emitter or observer is gone.
  void pruneExpired();

  ConnectionId next_id_{1};
  std::vector<std::shared_ptr<Connection>> connections_;
};

// -----------------------------------------------------------------------------
// Template implementation: typed connect
// -----------------------------------------------------------------------------
// Wraps the typed slot in a generic one that probes the std::any with
// any_cast on a pointer (no exception on mismatch). Emissions carrying other
// argument types are ignored by this slot.
// -----------------------------------------------------------------------------
template <typename Arg>
SignalBus::ConnectionId SignalBus::connect(
    EmitterId emitter, SignalId signal, std::function<void(const Arg&)> slot) {
  Slot wrapped = [fn = std::move(slot)](const SignalArgs& args) {
    if (const auto* value = std::any_cast<Arg>(&args)) {
      fn(*value);
    }
  };
  return connect(emitter, std::move(signal), std::move(wrapped));
}

}  // namespace evcore
