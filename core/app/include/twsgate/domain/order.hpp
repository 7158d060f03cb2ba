#pragma once

#include "twsgate/domain/types.hpp"
#include "twsgate/domain/order_status.hpp"

#include <optional>
#include <string>

namespace twsgate {
namespace domain {

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,     // MKT
  Limit,      // LMT: limit_price
  Stop,       // STP: stop_price (auxPrice on the wire)
  StopLimit,  // STP LMT: both
};

enum class TimeInForce {
  Day,
  Gtc,
  Ioc,
  Fok,
};

const char* toString(Side side);
const char* toWire(Side side);            // "BUY" / "SELL"
const char* toWire(OrderType type);       // "MKT", "LMT", "STP", "STP LMT"
const char* toWire(TimeInForce tif);      // "DAY", "GTC", "IOC", "FOK"
std::optional<Side> sideFromWire(const std::string& action);
std::optional<OrderType> orderTypeFromWire(const std::string& type);
std::optional<TimeInForce> timeInForceFromWire(const std::string& tif);

// What a caller asks for. Validated by validateOrderRequest() before an id
// is allocated.
struct OrderRequest {
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  OrderType type{OrderType::Market};
  std::optional<double> limit_price;
  std::optional<double> stop_price;
  TimeInForce tif{TimeInForce::Day};
  std::string account;  // Empty: gateway default account
};

// -----------------------------------------------------------------------------
// validateOrderRequest(request)
// -----------------------------------------------------------------------------
// @return Empty string when the request is well formed, otherwise a short
//         reason suitable for a SessionError message.
// -----------------------------------------------------------------------------
std::string validateOrderRequest(const OrderRequest& request);

// Tracker record. Keyed by id, never deleted.
struct Order {
  OrderId id{0};
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  OrderType type{OrderType::Market};
  std::optional<double> limit_price;
  std::optional<double> stop_price;
  TimeInForce tif{TimeInForce::Day};
  OrderStatus status{OrderStatus::Pending};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  Timestamp submitted_at{};
  std::string last_error;
};

}  // namespace domain
}  // namespace twsgate
