#pragma once

#include "twsgate/events/event_types.hpp"

#include <variant>

namespace twsgate {

// Envelope for everything the session publishes on its EventBus.
using Event = std::variant<
    OrderUpdateEvent,
    PositionUpdateEvent,
    ConnectionStateEvent,
    GatewayErrorEvent>;

// Short name of the held alternative, for log lines.
inline const char* eventName(const Event& event) {
  if (std::holds_alternative<OrderUpdateEvent>(event)) {
    return "OrderUpdate";
  }
  if (std::holds_alternative<PositionUpdateEvent>(event)) {
    return "PositionUpdate";
  }
  if (std::holds_alternative<ConnectionStateEvent>(event)) {
    return "ConnectionState";
  }
  return "GatewayError";
}

}  // namespace twsgate
