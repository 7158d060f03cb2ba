#pragma once

#include "twsgate/domain/contract.hpp"
#include "twsgate/domain/execution.hpp"
#include "twsgate/domain/position.hpp"
#include "twsgate/domain/types.hpp"
#include "twsgate/eventbus/event_bus.hpp"
#include "twsgate/time/clock.hpp"
#include "twsgate/wire/wire_records.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace twsgate {

// -----------------------------------------------------------------------------
// PositionTracker: position list and portfolio cache
// -----------------------------------------------------------------------------
//
// @brief  Holds the two views of holdings the gateway can produce.
//
// @details
// Two independent stores:
//
//   1. Position list. Filled by position() callbacks after reqPositions.
//      Cleared by beginPositionSnapshot() at the start of each request, so
//      it always reflects exactly one positionEnd-terminated cycle. Rows
//      are kept in arrival order, zero quantities included.
//
//   2. Portfolio cache. Filled by updatePortfolio() callbacks, keyed by
//      symbol, and carried across requests. Each row carries a synthesized
//      entry_time: the clock's now() at the first update that showed a
//      nonzero quantity. Later updates keep that time. An update with zero
//      quantity drops the row AND forgets the time, so a re-entry starts a
//      fresh one.
//
// withExecutionEntryTimes() overlays the time of the most recent execution
// on the opening side (BOT for longs, SLD for shorts) onto a copy of the
// portfolio. The cache keeps its synthesized times, so portfolio() stays
// stable for an unchanged position whatever the execution history says.
//
// Every portfolio update publishes a PositionUpdateEvent.
//
// Thread model:
//   Written on the I/O thread, read from caller threads. One mutex guards
//   both stores; events are published after it is released.
// -----------------------------------------------------------------------------
class PositionTracker {
 public:
  PositionTracker(EventBus& bus, const Clock& clock);

  PositionTracker(const PositionTracker&) = delete;
  PositionTracker& operator=(const PositionTracker&) = delete;

  // --- Position list -------------------------------------------------------
  void beginPositionSnapshot();
  void onPosition(const std::string& account,
                  const domain::ContractSpec& contract, double quantity,
                  double average_cost);
  std::vector<domain::Position> positionSnapshot() const;

  // --- Portfolio cache -----------------------------------------------------
  void onPortfolioUpdate(const wire::PortfolioRecord& record);

  // Open rows, ascending by symbol.
  std::vector<domain::Position> portfolio() const;
  std::optional<domain::Position> portfolioPosition(
      const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // withExecutionEntryTimes(executions)
  // -------------------------------------------------------------------------
  // @brief  The portfolio, with entry_time replaced on every row that has a
  //         matching opening-side execution with a parsed time.
  //
  // Does not modify the cache.
  // -------------------------------------------------------------------------
  std::vector<domain::Position> withExecutionEntryTimes(
      const std::vector<domain::Execution>& executions) const;

 private:
  EventBus& bus_;
  const Clock& clock_;

  mutable std::mutex mutex_;
  std::vector<domain::Position> positions_;
  std::map<std::string, domain::Position> portfolio_;
};

}  // namespace twsgate
