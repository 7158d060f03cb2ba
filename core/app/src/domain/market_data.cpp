#include "twsgate/domain/bar.hpp"
#include "twsgate/domain/session_error.hpp"
#include "twsgate/domain/tick.hpp"

#include <cctype>
#include <cstdlib>

namespace twsgate {
namespace domain {

// -----------------------------------------------------------------------------
// Tick codes
// -----------------------------------------------------------------------------
std::optional<TickField> tickFieldFromCode(int code) {
  using F = TickField;
  switch (code) {
    case 0:  case 69: return F::BidSize;
    case 1:  case 66: return F::Bid;
    case 2:  case 67: return F::Ask;
    case 3:  case 70: return F::AskSize;
    case 4:  case 68: return F::Last;
    case 5:  case 71: return F::LastSize;
    case 6:  case 72: return F::High;
    case 7:  case 73: return F::Low;
    case 8:  case 74: return F::Volume;
    case 9:  case 75: return F::Close;
    case 14: case 76: return F::Open;
    case 45: case 88: return F::LastTimestamp;
    default:          return std::nullopt;
  }
}

namespace {

bool positive(const std::optional<double>& v) { return v && *v > 0.0; }

}  // namespace

bool MarketDataTick::hasPrice() const {
  return positive(last) || positive(close) || positive(bid) || positive(ask);
}

std::optional<double> MarketDataTick::bestPrice() const {
  if (positive(last)) return *last;
  if (positive(close)) return *close;
  if (positive(bid) && positive(ask)) return (*bid + *ask) / 2.0;
  if (positive(bid)) return *bid;
  if (positive(ask)) return *ask;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Historical request validation
// -----------------------------------------------------------------------------
bool isValidDuration(const std::string& duration) {
  std::size_t i = 0;
  while (i < duration.size() &&
         std::isdigit(static_cast<unsigned char>(duration[i]))) {
    ++i;
  }
  if (i == 0 || i + 2 != duration.size() || duration[i] != ' ') {
    return false;
  }
  if (std::atoi(duration.substr(0, i).c_str()) <= 0) {
    return false;
  }
  const char unit = duration[i + 1];
  return unit == 'S' || unit == 'D' || unit == 'W' || unit == 'M' ||
         unit == 'Y';
}

bool isValidBarSize(const std::string& bar_size) {
  static const char* const kBarSizes[] = {
      "1 secs",  "5 secs",  "10 secs", "15 secs", "30 secs", "1 min",
      "2 mins",  "3 mins",  "5 mins",  "10 mins", "15 mins", "20 mins",
      "30 mins", "1 hour",  "2 hours", "3 hours", "4 hours", "8 hours",
      "1 day",   "1 week",  "1 month",
  };
  for (const char* candidate : kBarSizes) {
    if (bar_size == candidate) {
      return true;
    }
  }
  return false;
}

bool isValidWhatToShow(const std::string& what_to_show) {
  static const char* const kSources[] = {
      "TRADES",          "MIDPOINT",         "BID",
      "ASK",             "BID_ASK",          "ADJUSTED_LAST",
      "HISTORICAL_VOLATILITY", "OPTION_IMPLIED_VOLATILITY",
  };
  for (const char* candidate : kSources) {
    if (what_to_show == candidate) {
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
const char* toString(ErrorKind kind) {
  using K = ErrorKind;
  switch (kind) {
    case K::NotConnected:         return "NotConnected";
    case K::ConnectionLost:       return "ConnectionLost";
    case K::Timeout:              return "Timeout";
    case K::RequestFailed:        return "RequestFailed";
    case K::NoSecurityDefinition: return "NoSecurityDefinition";
    case K::PermissionDenied:     return "PermissionDenied";
    case K::InvalidArgument:      return "InvalidArgument";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace twsgate
