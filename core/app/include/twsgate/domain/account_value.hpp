#pragma once

#include <map>
#include <string>
#include <utility>

namespace twsgate {
namespace domain {

struct AccountValue {
  std::string account;
  std::string tag;
  std::string value;
  std::string currency;
};

// Keyed by (account, tag).
using AccountValueKey = std::pair<std::string, std::string>;
using AccountValues = std::map<AccountValueKey, AccountValue>;

}  // namespace domain
}  // namespace twsgate
