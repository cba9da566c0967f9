#pragma once

#include "evcore/events/event.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace evcore {

enum class FilterResult { Pass, Consumed };

using FilterId = std::uint64_t;

// -----------------------------------------------------------------------------
// FilterScope
// -----------------------------------------------------------------------------
// What an interceptor watches: either every event the loop delivers
// (application scope) or only events addressed to one target. A target scope
// whose target has been destroyed matches nothing.
// -----------------------------------------------------------------------------
class FilterScope {
 public:
  static FilterScope application() { return FilterScope(true, TargetRef{}); }

  static FilterScope target(TargetRef watched) {
    return FilterScope(false, std::move(watched));
  }

  bool isApplication() const { return application_; }

  bool expired() const { return !application_ && watched_.expired(); }

  bool matches(const Event& event) const;

 private:
  FilterScope(bool application, TargetRef watched)
      : application_(application), watched_(std::move(watched)) {}

  bool application_;
  TargetRef watched_;
};

// -----------------------------------------------------------------------------
// FilterChain - ordered interceptors consulted before delivery
// -----------------------------------------------------------------------------
//
// @brief  Holds interceptors in install order and runs the ones whose scope
//         matches an event until one of them consumes it.
//
// @details
// Interceptors only observe: they receive `const Event&` and answer Pass or
// Consumed. The first Consumed stops the chain; the loop then skips the
// target entirely.
//
// Reentrancy:
//   run() iterates a snapshot of the chain taken on entry, so an interceptor
//   may install or remove filters (including itself) while running. A filter
//   installed during run() is not consulted for the current event. A filter
//   removed during run() is skipped if it has not been reached yet.
//
// Thread model: Single execution context; no locking.
// -----------------------------------------------------------------------------
class FilterChain {
 public:
  using Interceptor = std::function<FilterResult(const Event&)>;

  FilterChain() = default;

  FilterChain(const FilterChain&) = delete;
  FilterChain& operator=(const FilterChain&) = delete;

  FilterId install(FilterScope scope, Interceptor interceptor);

  // Returns false for an unknown or already-removed id.
  bool remove(FilterId id);

  // Runs matching interceptors in install order. Exceptions thrown by an
  // interceptor propagate to the caller unchanged.
  FilterResult run(const Event& event);

  std::size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    FilterId id{0};
    FilterScope scope;
    Interceptor interceptor;
    bool installed{true};
  };

  void pruneExpiredScopes();

  std::vector<std::shared_ptr<Entry>> entries_;
  FilterId next_id_{1};
};

}  // namespace evcore
