#pragma once

#include "twsgate/domain/types.hpp"

#include <optional>
#include <string>

namespace twsgate {
namespace domain {

// -----------------------------------------------------------------------------
// Position
// -----------------------------------------------------------------------------
// One row per symbol. Plain position callbacks fill account/quantity/cost;
// portfolio updates also supply market price, market value and P&L.
//
// entry_time is synthesized: the first instant a nonzero quantity was seen
// for the symbol. It is cleared (and the row dropped) when quantity returns
// to zero.
// -----------------------------------------------------------------------------
struct Position {
  std::string account;
  std::string symbol;
  std::string sec_type;
  double quantity{0.0};
  double average_cost{0.0};
  double market_price{0.0};
  double market_value{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  std::optional<Timestamp> entry_time;
};

}  // namespace domain
}  // namespace twsgate
