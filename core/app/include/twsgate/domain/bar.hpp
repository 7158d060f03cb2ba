#pragma once

#include "twsgate/domain/types.hpp"

#include <optional>
#include <string>

namespace twsgate {
namespace domain {

struct Bar {
  Timestamp timestamp{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  double wap{0.0};
  int bar_count{0};
  std::string wire_time;  // As delivered; kept for zones we do not resolve
};

// Parameters of one historical-data request. end_time empty means "now".
struct HistoricalDataQuery {
  std::string symbol;
  std::string duration{"1 D"};
  std::string bar_size{"5 mins"};
  std::optional<Timestamp> end_time;
  std::string what_to_show{"TRADES"};
  bool use_rth{true};
};

// Duration strings take the form "<positive int> <S|D|W|M|Y>".
bool isValidDuration(const std::string& duration);

// One of the vendor's accepted bar size settings ("1 secs" ... "1 month").
bool isValidBarSize(const std::string& bar_size);

bool isValidWhatToShow(const std::string& what_to_show);

}  // namespace domain
}  // namespace twsgate
