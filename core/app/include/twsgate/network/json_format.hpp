#pragma once

#include "twsgate/domain/account_value.hpp"
#include "twsgate/domain/bar.hpp"
#include "twsgate/domain/order.hpp"
#include "twsgate/domain/position.hpp"
#include "twsgate/domain/tick.hpp"
#include "twsgate/events/event_types.hpp"

#include <nlohmann/json.hpp>

namespace twsgate {

// JSON shapes shared by the IPC telemetry stream and the command replies.
// Timestamps are ISO-8601 UTC strings; absent optionals are null.

nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::AccountValues& values);
nlohmann::json toJson(const domain::MarketDataTick& tick);
nlohmann::json toJson(const domain::Bar& bar);

nlohmann::json toJson(const OrderUpdateEvent& e);
nlohmann::json toJson(const PositionUpdateEvent& e);
nlohmann::json toJson(const ConnectionStateEvent& e);
nlohmann::json toJson(const GatewayErrorEvent& e);

}  // namespace twsgate
