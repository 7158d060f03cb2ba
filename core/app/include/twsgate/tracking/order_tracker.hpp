#pragma once

#include "twsgate/domain/order.hpp"
#include "twsgate/domain/order_status.hpp"
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
// OrderTracker: per-order state machine fed by gateway callbacks
// -----------------------------------------------------------------------------
//
// @brief  Authoritative record of every order this session placed or
//         discovered, merged from orderStatus, openOrder and order-scoped
//         error callbacks.
//
// @details
// Records are created two ways:
//
//   1. track(): by placeOrder, as Pending, BEFORE the wire send. A status
//      callback can therefore never arrive for an id the tracker does not
//      know about.
//   2. onOpenOrder(): an open-orders report naming an unknown id (placed by
//      another client or a previous run) inserts the record with the
//      reported status and publishes it with discovered = true.
//
// Records are never erased. Terminal orders stay queryable forever; the
// state machine simply refuses to move them.
//
// Transitions:
//   Every status change passes transitionAllowed(). Rejected transitions
//   are logged and leave the record untouched. Filled quantity only ever
//   grows; the submitted timestamp is never overwritten.
//
// Thread model:
//   Mutated on the I/O thread (callbacks) and caller threads (track).
//   One mutex guards the map. OrderUpdateEvent is published after the
//   lock is released.
//
// Ownership:
//   Owned by GatewaySession. Borrows the session's EventBus and Clock.
// -----------------------------------------------------------------------------
class OrderTracker {
 public:
  OrderTracker(EventBus& bus, const Clock& clock);

  OrderTracker(const OrderTracker&) = delete;
  OrderTracker& operator=(const OrderTracker&) = delete;
  OrderTracker(OrderTracker&&) = delete;
  OrderTracker& operator=(OrderTracker&&) = delete;

  // Inserts a Pending record stamped with the clock's now().
  domain::Order track(domain::OrderId id, const domain::OrderRequest& request);

  // -------------------------------------------------------------------------
  // onOrderStatus(record)
  // -------------------------------------------------------------------------
  // @brief  Merges an orderStatus callback: status, filled quantity and
  //         average fill price.
  //
  // @return true if the record changed.
  //
  // @details
  // Unknown ids and unrecognised wire status strings are logged and
  // ignored. A terminal record ignores everything.
  // -------------------------------------------------------------------------
  bool onOrderStatus(const wire::OrderStatusRecord& record);

  // Inserts (discovery) or merges an openOrder callback. Returns the record
  // after the merge.
  domain::Order onOpenOrder(const wire::OpenOrderRecord& record);

  // -------------------------------------------------------------------------
  // onOrderError(id, code, message)
  // -------------------------------------------------------------------------
  // @brief  Applies an order-scoped error code.
  //
  // @return true if `id` names a tracked order (whether or not its status
  //         moved).
  //
  // @details
  //   201, 203  -> Rejected
  //   202       -> Cancelled
  //   other     -> stored in last_error, status unchanged
  // A terminal record is left exactly as it is.
  // -------------------------------------------------------------------------
  bool onOrderError(domain::OrderId id, int code, const std::string& message);

  std::optional<domain::Order> find(domain::OrderId id) const;
  bool contains(domain::OrderId id) const;
  // Tracked and not yet terminal.
  bool isWorking(domain::OrderId id) const;

  // Every record, ascending by id.
  std::vector<domain::Order> snapshot() const;

  // Non-terminal records, ascending by id.
  std::vector<domain::Order> openOrders() const;

  // -------------------------------------------------------------------------
  // transitionAllowed(current, next)
  // -------------------------------------------------------------------------
  // @details
  //   Filled, Cancelled,
  //   Rejected           -> nothing, not even themselves
  //   current == next    -> allowed (fill-only merge)
  //   Pending            -> anything
  //   Submitted          -> PartiallyFilled, Filled, Cancelled, Rejected,
  //                         Inactive
  //   PartiallyFilled    -> Filled, Cancelled, Rejected, Inactive
  //   Inactive           -> Submitted, PartiallyFilled, Filled, Cancelled,
  //                         Rejected
  // Pure function.
  // -------------------------------------------------------------------------
  static bool transitionAllowed(domain::OrderStatus current,
                                domain::OrderStatus next);

 private:
  void publish(const domain::Order& order, domain::OrderStatus previous,
               bool discovered);

  EventBus& bus_;
  const Clock& clock_;

  mutable std::mutex mutex_;
  std::map<domain::OrderId, domain::Order> orders_;
};

}  // namespace twsgate
