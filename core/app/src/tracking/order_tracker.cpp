#include "twsgate/tracking/order_tracker.hpp"

#include "twsgate/errors/error_classifier.hpp"
#include "twsgate/events/event_types.hpp"

#include <iostream>

namespace twsgate {

OrderTracker::OrderTracker(EventBus& bus, const Clock& clock)
    : bus_(bus), clock_(clock) {}

// -----------------------------------------------------------------------------
// transitionAllowed: order state machine
// -----------------------------------------------------------------------------
bool OrderTracker::transitionAllowed(domain::OrderStatus current,
                                     domain::OrderStatus next) {
  using S = domain::OrderStatus;

  if (domain::isTerminal(current)) {
    return false;
  }
  if (current == next) {
    return true;
  }

  switch (current) {
    case S::Pending:
      return true;

    case S::Submitted:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Cancelled ||
             next == S::Rejected ||
             next == S::Inactive;

    case S::PartiallyFilled:
      return next == S::Filled ||
             next == S::Cancelled ||
             next == S::Rejected ||
             next == S::Inactive;

    case S::Inactive:
      return next != S::Pending;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// track: local creation before the wire send
// -----------------------------------------------------------------------------
domain::Order OrderTracker::track(domain::OrderId id,
                                  const domain::OrderRequest& request) {
  domain::Order order;
  order.id = id;
  order.symbol = request.symbol;
  order.side = request.side;
  order.quantity = request.quantity;
  order.type = request.type;
  order.limit_price = request.limit_price;
  order.stop_price = request.stop_price;
  order.tif = request.tif;
  order.status = domain::OrderStatus::Pending;
  order.submitted_at = clock_.now();

  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = orders_.emplace(id, order);
    if (!inserted) {
      std::cerr << "[OrderTracker] WARNING: order " << id
                << " already tracked. Keeping existing record.\n";
      return it->second;
    }
  }

  publish(order, domain::OrderStatus::Pending, false);
  return order;
}

// -----------------------------------------------------------------------------
// onOrderStatus: merge an orderStatus callback
// -----------------------------------------------------------------------------
bool OrderTracker::onOrderStatus(const wire::OrderStatusRecord& record) {
  const auto next = domain::orderStatusFromWire(record.status, record.filled,
                                                record.remaining);
  if (!next) {
    std::cerr << "[OrderTracker] WARNING: unrecognised status '"
              << record.status << "' for order " << record.order_id
              << ". Ignored.\n";
    return false;
  }

  domain::Order updated;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(record.order_id);
    if (it == orders_.end()) {
      std::cerr << "[OrderTracker] WARNING: status " << record.status
                << " for unknown order " << record.order_id << ". Ignored.\n";
      return false;
    }

    domain::Order& order = it->second;
    previous = order.status;

    if (domain::isTerminal(previous)) {
      if (*next != previous) {
        std::cout << "[OrderTracker] order " << order.id << " is "
                  << domain::toString(previous) << "; stale "
                  << record.status << " ignored.\n";
      }
      return false;
    }

    if (!transitionAllowed(previous, *next)) {
      std::cerr << "[OrderTracker] WARNING: rejected transition "
                << domain::toString(previous) << " -> "
                << domain::toString(*next) << " for order " << order.id
                << ".\n";
      return false;
    }

    bool changed = order.status != *next;
    order.status = *next;

    if (record.filled > order.filled_quantity) {
      order.filled_quantity = record.filled;
      changed = true;
    }
    if (record.average_fill_price > 0.0 &&
        record.average_fill_price != order.average_fill_price) {
      order.average_fill_price = record.average_fill_price;
      changed = true;
    }

    if (!changed) {
      return false;
    }
    updated = order;
  }

  publish(updated, previous, false);
  return true;
}

// -----------------------------------------------------------------------------
// onOpenOrder: discovery or merge
// -----------------------------------------------------------------------------
domain::Order OrderTracker::onOpenOrder(const wire::OpenOrderRecord& record) {
  const auto reported = domain::orderStatusFromWire(record.status, 0.0,
                                                    record.total_quantity);

  domain::Order result;
  domain::OrderStatus previous = domain::OrderStatus::Pending;
  bool discovered = false;
  bool changed = false;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(record.order_id);

    if (it == orders_.end()) {
      domain::Order order;
      order.id = record.order_id;
      order.symbol = record.contract.symbol;
      order.side = domain::sideFromWire(record.action).value_or(
          domain::Side::Buy);
      order.quantity = record.total_quantity;
      order.type = domain::orderTypeFromWire(record.order_type)
                       .value_or(domain::OrderType::Market);
      if (record.limit_price > 0.0) {
        order.limit_price = record.limit_price;
      }
      if (record.aux_price > 0.0) {
        order.stop_price = record.aux_price;
      }
      order.tif = domain::timeInForceFromWire(record.tif)
                      .value_or(domain::TimeInForce::Day);
      order.status = reported.value_or(domain::OrderStatus::Submitted);
      order.submitted_at = clock_.now();

      previous = order.status;
      orders_.emplace(order.id, order);
      result = order;
      discovered = true;
      changed = true;
    } else {
      domain::Order& order = it->second;
      previous = order.status;
      if (reported && *reported != order.status &&
          transitionAllowed(order.status, *reported)) {
        order.status = *reported;
        changed = true;
      }
      result = order;
    }
  }

  if (discovered) {
    std::cout << "[OrderTracker] discovered order " << result.id << " "
              << result.symbol << " " << domain::toString(result.status)
              << "\n";
  }
  if (changed) {
    publish(result, previous, discovered);
  }
  return result;
}

// -----------------------------------------------------------------------------
// onOrderError: order-scoped error codes
// -----------------------------------------------------------------------------
bool OrderTracker::onOrderError(domain::OrderId id, int code,
                                const std::string& message) {
  domain::Order updated;
  domain::OrderStatus previous;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(id);
    if (it == orders_.end()) {
      return false;
    }

    domain::Order& order = it->second;
    previous = order.status;
    if (domain::isTerminal(previous)) {
      return true;
    }

    order.last_error = std::to_string(code) + ": " + message;

    if (ErrorClassifier::isOrderRejection(code)) {
      order.status = domain::OrderStatus::Rejected;
    } else if (ErrorClassifier::isOrderCancellation(code)) {
      order.status = domain::OrderStatus::Cancelled;
    }
    updated = order;
  }

  std::cerr << "[OrderTracker] order " << id << " error " << code << ": "
            << message << " (" << domain::toString(updated.status) << ")\n";
  publish(updated, previous, false);
  return true;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Order> OrderTracker::find(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool OrderTracker::contains(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  return orders_.count(id) != 0;
}

bool OrderTracker::isWorking(domain::OrderId id) const {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(id);
  return it != orders_.end() && !domain::isTerminal(it->second.status);
}

std::vector<domain::Order> OrderTracker::snapshot() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> out;
  out.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    out.push_back(order);
  }
  return out;
}

std::vector<domain::Order> OrderTracker::openOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> out;
  for (const auto& [id, order] : orders_) {
    if (!domain::isTerminal(order.status)) {
      out.push_back(order);
    }
  }
  return out;
}

void OrderTracker::publish(const domain::Order& order,
                           domain::OrderStatus previous, bool discovered) {
  OrderUpdateEvent event;
  event.order = order;
  event.previous_status = previous;
  event.discovered = discovered;
  event.timestamp = clock_.now();
  bus_.publish(Event{event});
}

}  // namespace twsgate
