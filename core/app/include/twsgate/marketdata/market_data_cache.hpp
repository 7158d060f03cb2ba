#pragma once

#include "twsgate/domain/session_error.hpp"
#include "twsgate/domain/tick.hpp"
#include "twsgate/domain/types.hpp"
#include "twsgate/time/clock.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace twsgate {

// -----------------------------------------------------------------------------
// MarketDataCache: latest tick per market-data request id
// -----------------------------------------------------------------------------
//
// @brief  One entry per live reqMktData id, for both one-shot snapshots and
//         standing subscriptions, plus the sticky set of symbols that lack
//         a market data entitlement.
//
// @details
// Snapshots do not go through the RequestRegistry. The gateway has no
// reliable terminating callback for them (tickSnapshotEnd is skipped for
// some contracts and for delayed data), so each entry carries its own
// condition variable and waitSnapshot() resolves on the first of:
//
//   - tickSnapshotEnd (onSnapshotEnd)
//   - an error routed to the id (fail)
//   - a quiet period with no tick after at least one price was seen
//   - the caller's deadline
//
// The quiet period runs on std::chrono::steady_clock. The injected Clock is
// used only to stamp MarketDataTick::updated_at.
//
// Entries are removed only by close() (or clear() on teardown). The facade
// always closes a snapshot entry after waiting on it.
//
// open() stamps each entry with a serial from a counter that clear() does
// not rewind. The handle overloads of latest() and close() only match the
// entry they opened, so a handle kept across a reconnect cannot reach a
// new subscription that was given the same request id.
//
// Permission set:
//   markPermissionDenied() records a symbol forever (for this session
//   object). A later live snapshot of that symbol fails fast.
//
// Thread model:
//   Tick callbacks on the I/O thread, everything else on caller threads.
//   One mutex guards the map and the permission set; per-entry condition
//   variables wait on it.
// -----------------------------------------------------------------------------
class MarketDataCache {
 public:
  explicit MarketDataCache(const Clock& clock);

  MarketDataCache(const MarketDataCache&) = delete;
  MarketDataCache& operator=(const MarketDataCache&) = delete;

  domain::MarketDataHandle open(domain::RequestId id,
                                const std::string& symbol,
                                domain::MarketDataType type);

  // I/O-side. Return false for ids with no entry.
  bool onTickPrice(domain::RequestId id, int tick_type, double price);
  bool onTickSize(domain::RequestId id, int tick_type, double size);
  bool onTickString(domain::RequestId id, int tick_type,
                    const std::string& value);
  bool onSnapshotEnd(domain::RequestId id);
  bool onMarketDataType(domain::RequestId id, int data_type);
  bool fail(domain::RequestId id, const domain::SessionError& error);

  // Fails every entry that is still waiting. Returns how many were woken.
  std::size_t failAll(const domain::SessionError& error);

  std::optional<domain::MarketDataTick> latest(domain::RequestId id) const;
  std::optional<domain::MarketDataTick> latest(
      const domain::MarketDataHandle& handle) const;

  // -------------------------------------------------------------------------
  // waitSnapshot(id, timeout, quiet)
  // -------------------------------------------------------------------------
  // @return The tick once resolved with a price. The error passed to fail()
  //         if one arrived. Timeout if no price was seen by the deadline.
  //         RequestFailed if the snapshot ended without any price, or the
  //         id is unknown.
  //
  // Does not remove the entry.
  // -------------------------------------------------------------------------
  domain::Result<domain::MarketDataTick> waitSnapshot(
      domain::RequestId id, std::chrono::milliseconds timeout,
      std::chrono::milliseconds quiet);

  bool close(domain::RequestId id);
  // False, and nothing removed, unless the entry is the one handle opened.
  bool close(const domain::MarketDataHandle& handle);
  void clear();

  std::vector<domain::RequestId> activeIds() const;
  std::optional<std::string> symbolFor(domain::RequestId id) const;
  bool contains(domain::RequestId id) const;
  std::size_t size() const;

  void markPermissionDenied(const std::string& symbol);
  bool hasPermissionError(const std::string& symbol) const;

 private:
  struct Entry {
    std::uint64_t serial{0};
    domain::MarketDataTick tick;
    bool done{false};
    std::optional<domain::SessionError> error;
    bool seen_price{false};
    std::chrono::steady_clock::time_point last_update{};
    std::condition_variable cv;
  };

  std::shared_ptr<Entry> findLocked(domain::RequestId id) const;
  std::shared_ptr<Entry> findLocked(
      const domain::MarketDataHandle& handle) const;
  void touchLocked(Entry& entry);

  const Clock& clock_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::RequestId, std::shared_ptr<Entry>> entries_;
  std::set<std::string> permission_errors_;
  std::uint64_t next_serial_{1};
};

}  // namespace twsgate
