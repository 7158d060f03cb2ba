#include "twsgate/tracking/position_tracker.hpp"

#include "twsgate/events/event_types.hpp"

namespace twsgate {

PositionTracker::PositionTracker(EventBus& bus, const Clock& clock)
    : bus_(bus), clock_(clock) {}

// -----------------------------------------------------------------------------
// Position list
// -----------------------------------------------------------------------------
void PositionTracker::beginPositionSnapshot() {
  std::lock_guard lock(mutex_);
  positions_.clear();
}

void PositionTracker::onPosition(const std::string& account,
                                 const domain::ContractSpec& contract,
                                 double quantity, double average_cost) {
  domain::Position position;
  position.account = account;
  position.symbol = contract.symbol;
  position.sec_type = contract.sec_type;
  position.quantity = quantity;
  position.average_cost = average_cost;

  std::lock_guard lock(mutex_);
  positions_.push_back(std::move(position));
}

std::vector<domain::Position> PositionTracker::positionSnapshot() const {
  std::lock_guard lock(mutex_);
  return positions_;
}

// -----------------------------------------------------------------------------
// Portfolio cache
// -----------------------------------------------------------------------------
void PositionTracker::onPortfolioUpdate(const wire::PortfolioRecord& record) {
  PositionUpdateEvent event;
  event.timestamp = clock_.now();
  {
    std::lock_guard lock(mutex_);
    const std::string& symbol = record.contract.symbol;

    if (record.position == 0.0) {
      auto it = portfolio_.find(symbol);
      if (it != portfolio_.end()) {
        event.position = it->second;
        portfolio_.erase(it);
      } else {
        event.position.symbol = symbol;
        event.position.account = record.account;
      }
      event.position.quantity = 0.0;
      event.position.entry_time.reset();
      event.closed = true;
    } else {
      domain::Position& row = portfolio_[symbol];
      if (!row.entry_time) {
        row.entry_time = event.timestamp;
      }
      row.account = record.account;
      row.symbol = symbol;
      row.sec_type = record.contract.sec_type;
      row.quantity = record.position;
      row.average_cost = record.average_cost;
      row.market_price = record.market_price;
      row.market_value = record.market_value;
      row.unrealized_pnl = record.unrealized_pnl;
      row.realized_pnl = record.realized_pnl;
      event.position = row;
    }
  }

  bus_.publish(Event{event});
}

std::vector<domain::Position> PositionTracker::portfolio() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> out;
  out.reserve(portfolio_.size());
  for (const auto& [symbol, row] : portfolio_) {
    out.push_back(row);
  }
  return out;
}

std::optional<domain::Position> PositionTracker::portfolioPosition(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = portfolio_.find(symbol);
  if (it == portfolio_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> PositionTracker::withExecutionEntryTimes(
    const std::vector<domain::Execution>& executions) const {
  std::vector<domain::Position> out = portfolio();

  for (auto& row : out) {
    const domain::Side opening =
        row.quantity > 0.0 ? domain::Side::Buy : domain::Side::Sell;

    std::optional<domain::Timestamp> latest;
    for (const auto& execution : executions) {
      if (execution.symbol != row.symbol || execution.side != opening ||
          !execution.time) {
        continue;
      }
      if (!latest || *execution.time > *latest) {
        latest = execution.time;
      }
    }

    if (latest) {
      row.entry_time = latest;
    }
  }
  return out;
}

}  // namespace twsgate
