#include "twsgate/domain/order.hpp"
#include "twsgate/domain/order_status.hpp"

namespace twsgate {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Pending:         return "Pending";
    case S::Submitted:       return "Submitted";
    case S::PartiallyFilled: return "PartiallyFilled";
    case S::Filled:          return "Filled";
    case S::Cancelled:       return "Cancelled";
    case S::Rejected:        return "Rejected";
    case S::Inactive:        return "Inactive";
  }
  return "Unknown";
}

std::optional<OrderStatus> orderStatusFromWire(const std::string& status,
                                               double filled,
                                               double remaining) {
  if (status == "ApiPending" || status == "PendingSubmit") {
    return OrderStatus::Pending;
  }
  if (status == "PreSubmitted" || status == "Submitted" ||
      status == "PendingCancel") {
    if (filled > 0.0 && remaining > 0.0) {
      return OrderStatus::PartiallyFilled;
    }
    return OrderStatus::Submitted;
  }
  if (status == "Filled") {
    return OrderStatus::Filled;
  }
  if (status == "Cancelled" || status == "ApiCancelled") {
    return OrderStatus::Cancelled;
  }
  if (status == "Inactive") {
    return OrderStatus::Inactive;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Side / OrderType / TimeInForce
// -----------------------------------------------------------------------------
const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

const char* toWire(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

const char* toWire(OrderType type) {
  switch (type) {
    case OrderType::Market:    return "MKT";
    case OrderType::Limit:     return "LMT";
    case OrderType::Stop:      return "STP";
    case OrderType::StopLimit: return "STP LMT";
  }
  return "MKT";
}

const char* toWire(TimeInForce tif) {
  switch (tif) {
    case TimeInForce::Day: return "DAY";
    case TimeInForce::Gtc: return "GTC";
    case TimeInForce::Ioc: return "IOC";
    case TimeInForce::Fok: return "FOK";
  }
  return "DAY";
}

std::optional<Side> sideFromWire(const std::string& action) {
  if (action == "BUY" || action == "BOT") {
    return Side::Buy;
  }
  if (action == "SELL" || action == "SLD" || action == "SSHORT") {
    return Side::Sell;
  }
  return std::nullopt;
}

std::optional<OrderType> orderTypeFromWire(const std::string& type) {
  if (type == "MKT") return OrderType::Market;
  if (type == "LMT") return OrderType::Limit;
  if (type == "STP") return OrderType::Stop;
  if (type == "STP LMT") return OrderType::StopLimit;
  return std::nullopt;
}

std::optional<TimeInForce> timeInForceFromWire(const std::string& tif) {
  if (tif == "DAY") return TimeInForce::Day;
  if (tif == "GTC") return TimeInForce::Gtc;
  if (tif == "IOC") return TimeInForce::Ioc;
  if (tif == "FOK") return TimeInForce::Fok;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// validateOrderRequest()
// -----------------------------------------------------------------------------
std::string validateOrderRequest(const OrderRequest& request) {
  if (request.symbol.empty()) {
    return "symbol is empty";
  }
  if (!(request.quantity > 0.0)) {
    return "quantity must be positive";
  }

  const bool needs_limit = request.type == OrderType::Limit ||
                           request.type == OrderType::StopLimit;
  const bool needs_stop = request.type == OrderType::Stop ||
                          request.type == OrderType::StopLimit;

  if (needs_limit && (!request.limit_price || *request.limit_price <= 0.0)) {
    return std::string(toWire(request.type)) + " order requires limit_price";
  }
  if (needs_stop && (!request.stop_price || *request.stop_price <= 0.0)) {
    return std::string(toWire(request.type)) + " order requires stop_price";
  }
  return {};
}

}  // namespace domain
}  // namespace twsgate
