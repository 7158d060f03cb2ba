#include "twsgate/tracking/account_tracker.hpp"

#include <cstdlib>
#include <sstream>
#include <utility>

namespace twsgate {

namespace {

std::optional<double> parseNumber(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  const char* begin = text.c_str();
  char* end = nullptr;
  const double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

}  // namespace

const std::vector<std::string>& balanceStrategies() {
  static const std::vector<std::string> kStrategies = {
      "NetLiquidation",
      "TotalCashValue",
      "AvailableFunds",
      "BuyingPower",
      "EquityWithLoanValue",
  };
  return kStrategies;
}

std::optional<BalanceReading> extractBalance(
    const domain::AccountValues& values) {
  for (const auto& tag : balanceStrategies()) {
    for (const auto& [key, row] : values) {
      if (key.second != tag) {
        continue;
      }
      const auto number = parseNumber(row.value);
      if (!number || *number <= 0.0) {
        continue;
      }
      BalanceReading reading;
      reading.value = *number;
      reading.currency = row.currency;
      reading.account = row.account;
      reading.strategy = tag;
      return reading;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// AccountTracker
// -----------------------------------------------------------------------------
domain::AccountValues AccountTracker::replaceSummary(
    const std::vector<domain::AccountValue>& rows) {
  domain::AccountValues fresh;
  for (const auto& row : rows) {
    fresh[{row.account, row.tag}] = row;
  }

  std::lock_guard lock(mutex_);
  summary_ = fresh;
  return fresh;
}

domain::AccountValues AccountTracker::accountSummary() const {
  std::lock_guard lock(mutex_);
  return summary_;
}

void AccountTracker::onAccountValue(const std::string& key,
                                    const std::string& value,
                                    const std::string& currency,
                                    const std::string& account) {
  std::lock_guard lock(mutex_);
  values_[{account, key}] = domain::AccountValue{account, key, value, currency};
}

domain::AccountValues AccountTracker::accountValues() const {
  std::lock_guard lock(mutex_);
  return values_;
}

void AccountTracker::onManagedAccounts(const std::string& accounts) {
  std::vector<std::string> parsed;
  std::stringstream stream(accounts);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty()) {
      parsed.push_back(item);
    }
  }

  std::lock_guard lock(mutex_);
  managed_accounts_ = std::move(parsed);
}

std::vector<std::string> AccountTracker::managedAccounts() const {
  std::lock_guard lock(mutex_);
  return managed_accounts_;
}

}  // namespace twsgate
