#pragma once

#include "twsgate/domain/order.hpp"
#include "twsgate/domain/types.hpp"

#include <optional>
#include <string>

namespace twsgate {
namespace domain {

struct Execution {
  std::string exec_id;
  OrderId order_id{0};
  std::string account;
  std::string symbol;
  Side side{Side::Buy};  // BOT -> Buy, SLD -> Sell
  double shares{0.0};
  double price{0.0};
  std::optional<Timestamp> time;
  std::string wire_time;
};

// Filter for an executions request. Empty fields match everything.
struct ExecutionFilter {
  std::optional<Timestamp> since;
  std::string account;
  std::string symbol;
};

}  // namespace domain
}  // namespace twsgate
