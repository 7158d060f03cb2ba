#include "twsgate/network/json_format.hpp"

#include "twsgate/time/time_utils.hpp"

namespace twsgate {

namespace {

nlohmann::json optionalNumber(const std::optional<double>& v) {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json optionalTime(const std::optional<domain::Timestamp>& t) {
  return t ? nlohmann::json(formatIso8601(*t)) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json j;
  j["order_id"] = order.id;
  j["symbol"] = order.symbol;
  j["side"] = domain::toString(order.side);
  j["quantity"] = order.quantity;
  j["order_type"] = domain::toWire(order.type);
  j["limit_price"] = optionalNumber(order.limit_price);
  j["stop_price"] = optionalNumber(order.stop_price);
  j["tif"] = domain::toWire(order.tif);
  j["status"] = domain::toString(order.status);
  j["filled_quantity"] = order.filled_quantity;
  j["average_fill_price"] = order.average_fill_price;
  j["submitted_at"] = formatIso8601(order.submitted_at);
  j["last_error"] = order.last_error;
  return j;
}

nlohmann::json toJson(const domain::Position& position) {
  nlohmann::json j;
  j["account"] = position.account;
  j["symbol"] = position.symbol;
  j["sec_type"] = position.sec_type;
  j["quantity"] = position.quantity;
  j["average_cost"] = position.average_cost;
  j["market_price"] = position.market_price;
  j["market_value"] = position.market_value;
  j["unrealized_pnl"] = position.unrealized_pnl;
  j["realized_pnl"] = position.realized_pnl;
  j["entry_time"] = optionalTime(position.entry_time);
  return j;
}

nlohmann::json toJson(const domain::AccountValues& values) {
  nlohmann::json rows = nlohmann::json::array();
  for (const auto& [key, row] : values) {
    rows.push_back({{"account", row.account},
                    {"tag", row.tag},
                    {"value", row.value},
                    {"currency", row.currency}});
  }
  return rows;
}

nlohmann::json toJson(const domain::MarketDataTick& tick) {
  nlohmann::json j;
  j["symbol"] = tick.symbol;
  j["bid"] = optionalNumber(tick.bid);
  j["ask"] = optionalNumber(tick.ask);
  j["last"] = optionalNumber(tick.last);
  j["high"] = optionalNumber(tick.high);
  j["low"] = optionalNumber(tick.low);
  j["close"] = optionalNumber(tick.close);
  j["open"] = optionalNumber(tick.open);
  j["volume"] = optionalNumber(tick.volume);
  j["last_trade_time"] = optionalTime(tick.last_trade_time);
  j["updated_at"] = formatIso8601(tick.updated_at);
  j["data_type"] = static_cast<int>(tick.data_type);
  return j;
}

nlohmann::json toJson(const domain::Bar& bar) {
  nlohmann::json j;
  j["time"] = formatIso8601(bar.timestamp);
  j["open"] = bar.open;
  j["high"] = bar.high;
  j["low"] = bar.low;
  j["close"] = bar.close;
  j["volume"] = bar.volume;
  j["wap"] = bar.wap;
  j["bar_count"] = bar.bar_count;
  return j;
}

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------
nlohmann::json toJson(const OrderUpdateEvent& e) {
  nlohmann::json j = toJson(e.order);
  j["type"] = "order_update";
  j["previous_status"] = domain::toString(e.previous_status);
  j["discovered"] = e.discovered;
  j["timestamp"] = formatIso8601(e.timestamp);
  return j;
}

nlohmann::json toJson(const PositionUpdateEvent& e) {
  nlohmann::json j = toJson(e.position);
  j["type"] = "position_update";
  j["closed"] = e.closed;
  j["timestamp"] = formatIso8601(e.timestamp);
  return j;
}

nlohmann::json toJson(const ConnectionStateEvent& e) {
  nlohmann::json j;
  j["type"] = "connection_state";
  j["previous"] = domain::toString(e.previous);
  j["current"] = domain::toString(e.current);
  j["reason"] = e.reason;
  j["timestamp"] = formatIso8601(e.timestamp);
  return j;
}

nlohmann::json toJson(const GatewayErrorEvent& e) {
  nlohmann::json j;
  j["type"] = "gateway_error";
  j["id"] = e.id;
  j["code"] = e.code;
  j["message"] = e.message;
  j["classification"] = toString(e.classification);
  j["timestamp"] = formatIso8601(e.timestamp);
  return j;
}

}  // namespace twsgate
