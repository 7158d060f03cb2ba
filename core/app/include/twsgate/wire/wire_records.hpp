#pragma once

#include "twsgate/domain/contract.hpp"
#include "twsgate/domain/types.hpp"

#include <string>

namespace twsgate {
namespace wire {

// Raw shapes of the inbound callbacks that carry more than a couple of
// scalars. The adapter fills these from vendor structs; the session turns
// them into domain records. Times stay as strings here because parsing
// them is session policy, not transport.

struct BarRecord {
  std::string time;
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  double wap{0.0};
  int count{0};
};

struct ExecutionRecord {
  std::string exec_id;
  domain::OrderId order_id{0};
  std::string account;
  std::string symbol;
  std::string side;  // "BOT" / "SLD"
  double shares{0.0};
  double price{0.0};
  std::string time;
};

struct PortfolioRecord {
  domain::ContractSpec contract;
  double position{0.0};
  double market_price{0.0};
  double market_value{0.0};
  double average_cost{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  std::string account;
};

struct OpenOrderRecord {
  domain::OrderId order_id{0};
  domain::ContractSpec contract;
  std::string action;      // "BUY" / "SELL"
  double total_quantity{0.0};
  std::string order_type;  // "MKT", "LMT", ...
  double limit_price{0.0};
  double aux_price{0.0};
  std::string tif;
  std::string status;      // OrderState::status
};

struct OrderStatusRecord {
  domain::OrderId order_id{0};
  std::string status;
  double filled{0.0};
  double remaining{0.0};
  double average_fill_price{0.0};
  double last_fill_price{0.0};
  std::string why_held;
};

}  // namespace wire
}  // namespace twsgate
