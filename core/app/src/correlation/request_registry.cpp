#include "twsgate/correlation/request_registry.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace twsgate {

const char* toString(RequestKind kind) {
  using K = RequestKind;
  switch (kind) {
    case K::HistoricalData: return "HistoricalData";
    case K::Snapshot:       return "Snapshot";
    case K::AccountSummary: return "AccountSummary";
    case K::Positions:      return "Positions";
    case K::Portfolio:      return "Portfolio";
    case K::Executions:     return "Executions";
    case K::ContractSearch: return "ContractSearch";
    case K::SymbolSearch:   return "SymbolSearch";
    case K::OpenOrders:     return "OpenOrders";
  }
  return "Unknown";
}

RequestRegistry::RequestRegistry(RequestIdAllocator& ids) : ids_(ids) {}

// -----------------------------------------------------------------------------
// issue()
// -----------------------------------------------------------------------------
domain::RequestId RequestRegistry::issue(RequestKind kind) {
  auto entry = std::make_shared<PendingRequest>();
  entry->kind = kind;

  std::lock_guard lock(mutex_);
  domain::RequestId id = ids_.next();
  // A rewound allocator could collide with an entry nobody awaited.
  while (pending_.count(id) != 0) {
    id = ids_.next();
  }
  entry->sequence = ++sequence_;
  pending_.emplace(id, std::move(entry));
  return id;
}

// -----------------------------------------------------------------------------
// await()
// -----------------------------------------------------------------------------
domain::Result<RequestRegistry::Fragments> RequestRegistry::await(
    domain::RequestId id, std::chrono::milliseconds timeout) {
  using R = domain::Result<Fragments>;

  std::unique_lock lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return R::failure(domain::ErrorKind::RequestFailed,
                      "unknown request id " + std::to_string(id));
  }

  // Hold our own reference: the map entry is erased below regardless of
  // how the wait ends.
  std::shared_ptr<PendingRequest> entry = it->second;
  const bool signalled =
      entry->cv.wait_for(lock, timeout, [&entry] { return entry->done; });

  auto current = pending_.find(id);
  if (current != pending_.end() && current->second == entry) {
    pending_.erase(current);
  }

  if (!signalled) {
    return R::failure(domain::ErrorKind::Timeout,
                      std::string(toString(entry->kind)) + " request " +
                          std::to_string(id) + " timed out");
  }
  if (entry->error) {
    return R::failure(std::move(*entry->error));
  }
  return R::success(std::move(entry->fragments));
}

// -----------------------------------------------------------------------------
// I/O-side signalling
// -----------------------------------------------------------------------------
bool RequestRegistry::completeStreaming(domain::RequestId id,
                                        Fragment fragment) {
  std::lock_guard lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end() || it->second->done) {
    return false;
  }
  it->second->fragments.push_back(std::move(fragment));
  return true;
}

bool RequestRegistry::complete(domain::RequestId id) {
  std::shared_ptr<PendingRequest> entry;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end() || it->second->done) {
      return false;
    }
    entry = it->second;
    entry->done = true;
  }
  entry->cv.notify_all();
  return true;
}

bool RequestRegistry::fail(domain::RequestId id, domain::SessionError error) {
  std::shared_ptr<PendingRequest> entry;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end() || it->second->done) {
      return false;
    }
    entry = it->second;
    entry->error = std::move(error);
    entry->fragments.clear();
    entry->done = true;
  }
  entry->cv.notify_all();
  return true;
}

void RequestRegistry::cancel(domain::RequestId id) {
  std::shared_ptr<PendingRequest> entry;
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      return;
    }
    entry = std::move(it->second);
    pending_.erase(it);
    if (!entry->done) {
      entry->error = domain::SessionError{domain::ErrorKind::RequestFailed, 0,
                                          "request cancelled"};
      entry->done = true;
    }
  }
  // A waiter that raced cancel() would find its id gone after waking; the
  // notify just gets it out of wait_for early.
  entry->cv.notify_all();
}

std::size_t RequestRegistry::failAll(const domain::SessionError& error) {
  std::vector<std::shared_ptr<PendingRequest>> woken;
  {
    std::lock_guard lock(mutex_);
    for (auto& [id, entry] : pending_) {
      if (entry->done) {
        continue;
      }
      entry->error = error;
      entry->fragments.clear();
      entry->done = true;
      woken.push_back(entry);
    }
  }
  for (auto& entry : woken) {
    entry->cv.notify_all();
  }
  if (!woken.empty()) {
    std::cerr << "[RequestRegistry] failed " << woken.size()
              << " pending request(s): " << error.message << "\n";
  }
  return woken.size();
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::RequestId> RequestRegistry::latestOf(
    RequestKind kind) const {
  std::lock_guard lock(mutex_);
  std::optional<domain::RequestId> best;
  std::uint64_t best_seq = 0;
  for (const auto& [id, entry] : pending_) {
    if (entry->kind == kind && !entry->done && entry->sequence > best_seq) {
      best = id;
      best_seq = entry->sequence;
    }
  }
  return best;
}

std::optional<RequestKind> RequestRegistry::kindOf(domain::RequestId id) const {
  std::lock_guard lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second->kind;
}

bool RequestRegistry::contains(domain::RequestId id) const {
  std::lock_guard lock(mutex_);
  return pending_.count(id) != 0;
}

std::size_t RequestRegistry::size() const {
  std::lock_guard lock(mutex_);
  return pending_.size();
}

}  // namespace twsgate
