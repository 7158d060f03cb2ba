#pragma once

#include "twsgate/domain/connection_state.hpp"
#include "twsgate/domain/order.hpp"
#include "twsgate/domain/order_status.hpp"
#include "twsgate/domain/position.hpp"
#include "twsgate/domain/types.hpp"
#include "twsgate/errors/error_classifier.hpp"

#include <cstdint>
#include <string>

namespace twsgate {

using domain::Timestamp;

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
// Published by the OrderTracker for every applied transition and for every
// order first seen through an open-orders report. `order` is the record
// after the change; previous_status is what it was before (equal to
// order.status for fill-only merges and discoveries).
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  bool discovered{false};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Published by the PositionTracker on every portfolio update. `closed` is
// true when the update took the quantity to zero and the row was dropped.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  bool closed{false};
  Timestamp timestamp{};
};

struct ConnectionStateEvent {
  domain::ConnectionState previous{domain::ConnectionState::Disconnected};
  domain::ConnectionState current{domain::ConnectionState::Disconnected};
  std::string reason;
  Timestamp timestamp{};
};

// Every non-informational error() callback.
struct GatewayErrorEvent {
  std::int64_t id{-1};
  int code{0};
  std::string message;
  ErrorClass classification{ErrorClass::Unknown};
  Timestamp timestamp{};
};

}  // namespace twsgate
