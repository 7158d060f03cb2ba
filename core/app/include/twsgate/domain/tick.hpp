#pragma once

#include "twsgate/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace twsgate {
namespace domain {

enum class MarketDataType {
  Live = 1,
  Frozen = 2,
  Delayed = 3,
  DelayedFrozen = 4,
};

// Cache fields. Live and delayed vendor tick codes collapse onto these.
enum class TickField {
  Bid,
  Ask,
  Last,
  High,
  Low,
  Close,
  Open,
  BidSize,
  AskSize,
  LastSize,
  Volume,
  LastTimestamp,
};

// -----------------------------------------------------------------------------
// tickFieldFromCode(code)
// -----------------------------------------------------------------------------
// @brief  Maps a vendor tick type number onto a cache field.
//
// @details
//   live    0 bid size, 1 bid, 2 ask, 3 ask size, 4 last, 5 last size,
//           6 high, 7 low, 8 volume, 9 close, 14 open, 45 last timestamp
//   delayed 66 bid, 67 ask, 68 last, 69 bid size, 70 ask size,
//           71 last size, 72 high, 73 low, 74 volume, 75 close, 76 open,
//           88 last timestamp
// Returns std::nullopt for every other code (greeks, halts, etc.).
// -----------------------------------------------------------------------------
std::optional<TickField> tickFieldFromCode(int code);

struct MarketDataTick {
  std::string symbol;
  std::optional<double> bid;
  std::optional<double> ask;
  std::optional<double> last;
  std::optional<double> high;
  std::optional<double> low;
  std::optional<double> close;
  std::optional<double> open;
  std::optional<double> bid_size;
  std::optional<double> ask_size;
  std::optional<double> last_size;
  std::optional<double> volume;
  std::optional<Timestamp> last_trade_time;
  Timestamp updated_at{};
  MarketDataType data_type{MarketDataType::Live};

  // True once any of bid/ask/last/close has a positive value.
  bool hasPrice() const;

  // last, close, bid/ask midpoint, bid, ask: first positive wins.
  std::optional<double> bestPrice() const;
};

// Handle for a standing subscription. Valid until unsubscribed or until
// the connection is torn down. Request ids restart after a reconnect, so
// the cache also matches on serial, which is never reused.
struct MarketDataHandle {
  RequestId id{0};
  std::string symbol;
  std::uint64_t serial{0};
};

}  // namespace domain
}  // namespace twsgate
