#include "twsgate/marketdata/market_data_cache.hpp"

#include "twsgate/time/time_utils.hpp"

#include <algorithm>
#include <iostream>

namespace twsgate {

MarketDataCache::MarketDataCache(const Clock& clock) : clock_(clock) {}

domain::MarketDataHandle MarketDataCache::open(domain::RequestId id,
                                               const std::string& symbol,
                                               domain::MarketDataType type) {
  auto entry = std::make_shared<Entry>();
  entry->tick.symbol = symbol;
  entry->tick.data_type = type;
  entry->last_update = std::chrono::steady_clock::now();

  std::lock_guard lock(mutex_);
  entry->serial = next_serial_++;
  auto [it, inserted] = entries_.emplace(id, entry);
  if (!inserted) {
    std::cerr << "[MarketDataCache] WARNING: id " << id
              << " already open. Keeping existing entry.\n";
  }
  return domain::MarketDataHandle{id, it->second->tick.symbol,
                                  it->second->serial};
}

std::shared_ptr<MarketDataCache::Entry> MarketDataCache::findLocked(
    domain::RequestId id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<MarketDataCache::Entry> MarketDataCache::findLocked(
    const domain::MarketDataHandle& handle) const {
  auto entry = findLocked(handle.id);
  if (!entry || entry->serial != handle.serial) {
    return nullptr;
  }
  return entry;
}

void MarketDataCache::touchLocked(Entry& entry) {
  entry.tick.updated_at = clock_.now();
  entry.last_update = std::chrono::steady_clock::now();
  if (entry.tick.hasPrice()) {
    entry.seen_price = true;
  }
}

// -----------------------------------------------------------------------------
// I/O-side updates
// -----------------------------------------------------------------------------
bool MarketDataCache::onTickPrice(domain::RequestId id, int tick_type,
                                  double price) {
  const auto field = domain::tickFieldFromCode(tick_type);

  std::shared_ptr<Entry> entry;
  {
    std::lock_guard lock(mutex_);
    entry = findLocked(id);
    if (!entry) {
      return false;
    }
    if (!field) {
      return true;
    }

    auto& tick = entry->tick;
    using F = domain::TickField;
    switch (*field) {
      case F::Bid:   tick.bid = price;   break;
      case F::Ask:   tick.ask = price;   break;
      case F::Last:  tick.last = price;  break;
      case F::High:  tick.high = price;  break;
      case F::Low:   tick.low = price;   break;
      case F::Close: tick.close = price; break;
      case F::Open:  tick.open = price;  break;
      default:
        return true;
    }
    touchLocked(*entry);
  }
  entry->cv.notify_all();
  return true;
}

bool MarketDataCache::onTickSize(domain::RequestId id, int tick_type,
                                 double size) {
  const auto field = domain::tickFieldFromCode(tick_type);

  std::lock_guard lock(mutex_);
  auto entry = findLocked(id);
  if (!entry) {
    return false;
  }
  if (!field) {
    return true;
  }

  auto& tick = entry->tick;
  using F = domain::TickField;
  switch (*field) {
    case F::BidSize:  tick.bid_size = size;  break;
    case F::AskSize:  tick.ask_size = size;  break;
    case F::LastSize: tick.last_size = size; break;
    case F::Volume:   tick.volume = size;    break;
    default:
      return true;
  }
  touchLocked(*entry);
  return true;
}

bool MarketDataCache::onTickString(domain::RequestId id, int tick_type,
                                   const std::string& value) {
  const auto field = domain::tickFieldFromCode(tick_type);

  std::lock_guard lock(mutex_);
  auto entry = findLocked(id);
  if (!entry) {
    return false;
  }
  if (field && *field == domain::TickField::LastTimestamp) {
    if (auto parsed = parseWireTimestamp(value)) {
      entry->tick.last_trade_time = *parsed;
      touchLocked(*entry);
    }
  }
  return true;
}

bool MarketDataCache::onSnapshotEnd(domain::RequestId id) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard lock(mutex_);
    entry = findLocked(id);
    if (!entry) {
      return false;
    }
    entry->done = true;
  }
  entry->cv.notify_all();
  return true;
}

bool MarketDataCache::onMarketDataType(domain::RequestId id, int data_type) {
  std::lock_guard lock(mutex_);
  auto entry = findLocked(id);
  if (!entry) {
    return false;
  }
  if (data_type >= 1 && data_type <= 4) {
    entry->tick.data_type = static_cast<domain::MarketDataType>(data_type);
  }
  return true;
}

bool MarketDataCache::fail(domain::RequestId id,
                           const domain::SessionError& error) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard lock(mutex_);
    entry = findLocked(id);
    if (!entry) {
      return false;
    }
    if (!entry->done) {
      entry->error = error;
      entry->done = true;
    }
  }
  entry->cv.notify_all();
  return true;
}

std::size_t MarketDataCache::failAll(const domain::SessionError& error) {
  std::vector<std::shared_ptr<Entry>> woken;
  {
    std::lock_guard lock(mutex_);
    for (auto& [id, entry] : entries_) {
      if (!entry->done) {
        entry->error = error;
        entry->done = true;
        woken.push_back(entry);
      }
    }
  }
  for (auto& entry : woken) {
    entry->cv.notify_all();
  }
  return woken.size();
}

// -----------------------------------------------------------------------------
// Caller-side
// -----------------------------------------------------------------------------
std::optional<domain::MarketDataTick> MarketDataCache::latest(
    domain::RequestId id) const {
  std::lock_guard lock(mutex_);
  auto entry = findLocked(id);
  if (!entry) {
    return std::nullopt;
  }
  return entry->tick;
}

std::optional<domain::MarketDataTick> MarketDataCache::latest(
    const domain::MarketDataHandle& handle) const {
  std::lock_guard lock(mutex_);
  auto entry = findLocked(handle);
  if (!entry) {
    return std::nullopt;
  }
  return entry->tick;
}

domain::Result<domain::MarketDataTick> MarketDataCache::waitSnapshot(
    domain::RequestId id, std::chrono::milliseconds timeout,
    std::chrono::milliseconds quiet) {
  using Result = domain::Result<domain::MarketDataTick>;
  using steady = std::chrono::steady_clock;

  std::unique_lock lock(mutex_);
  auto entry = findLocked(id);
  if (!entry) {
    return Result::failure(domain::ErrorKind::RequestFailed,
                           "unknown market data id " + std::to_string(id));
  }

  const auto deadline = steady::now() + timeout;
  while (!entry->done) {
    const auto now = steady::now();
    if (now >= deadline) {
      break;
    }
    auto wake = deadline;
    if (entry->seen_price) {
      const auto quiet_end = entry->last_update + quiet;
      if (now >= quiet_end) {
        break;
      }
      wake = std::min(wake, quiet_end);
    }
    entry->cv.wait_until(lock, wake);
  }

  if (entry->error) {
    return Result::failure(*entry->error);
  }
  if (entry->tick.hasPrice()) {
    return Result::success(entry->tick);
  }
  if (entry->done) {
    return Result::failure(domain::ErrorKind::RequestFailed,
                           "snapshot for " + entry->tick.symbol +
                               " ended without a price");
  }
  return Result::failure(domain::ErrorKind::Timeout,
                         "no price for " + entry->tick.symbol + " within " +
                             std::to_string(timeout.count()) + " ms");
}

bool MarketDataCache::close(domain::RequestId id) {
  std::lock_guard lock(mutex_);
  return entries_.erase(id) != 0;
}

bool MarketDataCache::close(const domain::MarketDataHandle& handle) {
  std::lock_guard lock(mutex_);
  if (!findLocked(handle)) {
    return false;
  }
  return entries_.erase(handle.id) != 0;
}

void MarketDataCache::clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

std::vector<domain::RequestId> MarketDataCache::activeIds() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::RequestId> ids;
  ids.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::optional<std::string> MarketDataCache::symbolFor(
    domain::RequestId id) const {
  std::lock_guard lock(mutex_);
  auto entry = findLocked(id);
  if (!entry) {
    return std::nullopt;
  }
  return entry->tick.symbol;
}

bool MarketDataCache::contains(domain::RequestId id) const {
  std::lock_guard lock(mutex_);
  return entries_.count(id) != 0;
}

std::size_t MarketDataCache::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

void MarketDataCache::markPermissionDenied(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  if (permission_errors_.insert(symbol).second) {
    std::cerr << "[MarketDataCache] WARNING: no market data permission for "
              << symbol << ". Live snapshots will fail fast.\n";
  }
}

bool MarketDataCache::hasPermissionError(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  return permission_errors_.count(symbol) != 0;
}

}  // namespace twsgate
