#include "evcore/filter/filter_chain.hpp"

#include <algorithm>

namespace evcore {

bool FilterScope::matches(const Event& event) const {
  if (application_) {
    return true;
  }
  auto watched = watched_.lock();
  return watched != nullptr && watched == event.target().lock();
}

// -----------------------------------------------------------------------------
// install()
// -----------------------------------------------------------------------------
FilterId FilterChain::install(FilterScope scope, Interceptor interceptor) {
  pruneExpiredScopes();

  auto entry = std::make_shared<Entry>(
      Entry{next_id_++, std::move(scope), std::move(interceptor), true});
  entries_.push_back(entry);
  return entry->id;
}

// -----------------------------------------------------------------------------
// remove()
// -----------------------------------------------------------------------------
bool FilterChain::remove(FilterId id) {
  auto it = std::find_if(
      entries_.begin(), entries_.end(),
      [id](const std::shared_ptr<Entry>& e) { return e->id == id; });
  if (it == entries_.end()) {
    return false;
  }
  // A run() in progress may still hold this entry in its snapshot; the flag
  // tells it to skip.
  (*it)->installed = false;
  entries_.erase(it);
  return true;
}

// -----------------------------------------------------------------------------
// run(): snapshot, then first Consumed wins
// -----------------------------------------------------------------------------
FilterResult FilterChain::run(const Event& event) {
  if (entries_.empty()) {
    return FilterResult::Pass;
  }

  const std::vector<std::shared_ptr<Entry>> snapshot = entries_;

  for (const auto& entry : snapshot) {
    if (!entry->installed || !entry->scope.matches(event)) {
      continue;
    }
    if (entry->interceptor(event) == FilterResult::Consumed) {
      return FilterResult::Consumed;
    }
  }
  return FilterResult::Pass;
}

void FilterChain::pruneExpiredScopes() {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [](const std::shared_ptr<Entry>& e) {
                                  if (!e->scope.expired()) {
                                    return false;
                                  }
                                  e->installed = false;
                                  return true;
                                }),
                 entries_.end());
}

}  // namespace evcore
