#include "evcore/signal/signal_bus.hpp"

#include <algorithm>

namespace evcore {

// -----------------------------------------------------------------------------
// connect() overloads
// -----------------------------------------------------------------------------
SignalBus::ConnectionId SignalBus::connect(EmitterId emitter, SignalId signal,
                                           Slot slot) {
  return add(emitter, std::move(signal), std::move(slot))->id;
}

SignalBus::ConnectionId SignalBus::connect(EmitterId emitter, SignalId signal,
                                           std::weak_ptr<void> observer,
                                           Slot slot) {
  auto connection = add(emitter, std::move(signal), std::move(slot));
  connection->tracks_observer = true;
  connection->observer = std::move(observer);
  return connection->id;
}

SignalBus::ConnectionId SignalBus::connect(std::weak_ptr<void> emitter_owner,
                                           SignalId signal, Slot slot) {
  std::shared_ptr<void> owner = emitter_owner.lock();
  if (!owner) {
    return 0;
  }
  auto connection = add(owner.get(), std::move(signal), std::move(slot));
  connection->tracks_emitter = true;
  connection->emitter_owner = std::move(emitter_owner);
  return connection->id;
}

std::shared_ptr<SignalBus::Connection> SignalBus::add(EmitterId emitter,
                                                      SignalId signal,
                                                      Slot slot) {
  pruneExpired();

  auto connection = std::make_shared<Connection>();
  connection->id = next_id_++;
  connection->emitter = emitter;
  connection->signal = std::move(signal);
  connection->slot = std::move(slot);

  connections_.push_back(connection);
  return connection;
}

void SignalBus::pruneExpired() {
  connections_.erase(
      std::remove_if(connections_.begin(), connections_.end(),
                     [](const std::shared_ptr<Connection>& c) {
                       if (!c->expired()) {
                         return false;
                       }
                       c->connected = false;
                       return true;
                     }),
      connections_.end());
}

// -----------------------------------------------------------------------------
// disconnect(id)
// -----------------------------------------------------------------------------
bool SignalBus::disconnect(ConnectionId id) {
  auto it = std::find_if(
      connections_.begin(), connections_.end(),
      [id](const std::shared_ptr<Connection>& c) { return c->id == id; });
  if (it == connections_.end()) {
    return false;
  }
  // Flag first: an emission in progress holds this Connection through its
  // snapshot and must see it as gone.
  (*it)->connected = false;
  connections_.erase(it);
  return true;
}

// -----------------------------------------------------------------------------
// disconnectAll(emitter)
// -----------------------------------------------------------------------------
std::size_t SignalBus::disconnectAll(EmitterId emitter) {
  std::size_t before = connections_.size();
  connections_.erase(
      std::remove_if(connections_.begin(), connections_.end(),
                     [emitter](const std::shared_ptr<Connection>& c) {
                       if (c->emitter != emitter) {
                         return false;
                       }
                       c->connected = false;
                       return true;
                     }),
      connections_.end());
  return before - connections_.size();
}

// -----------------------------------------------------------------------------
// emit()
// -----------------------------------------------------------------------------
std::size_t SignalBus::emit(EmitterId emitter, const SignalId& signal,
                            const SignalArgs& args) {
  // Snapshot the matching connections. The shared_ptrs keep each Connection
  // (and its slot) alive even if a slot disconnects it mid-emission.
  std::vector<std::shared_ptr<Connection>> snapshot;
  for (const auto& c : connections_) {
    if (c->emitter == emitter && c->signal == signal) {
      snapshot.push_back(c);
    }
  }

  std::size_t invoked = 0;
  for (const auto& c : snapshot) {
    if (!c->connected) {
      continue;
    }
    if (c->expired()) {
      disconnect(c->id);
      continue;
    }
    c->slot(args);
    ++invoked;
  }
  return invoked;
}

std::size_t SignalBus::connectionCount(EmitterId emitter,
                                       const SignalId& signal) const {
  return static_cast<std::size_t>(std::count_if(
      connections_.begin(), connections_.end(),
      [emitter, &signal](const std::shared_ptr<Connection>& c) {
        return c->emitter == emitter && c->signal == signal;
      }));
}

}  // namespace evcore
