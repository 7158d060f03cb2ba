#pragma once

#include "twsgate/domain/account_value.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace twsgate {

// One successful balance extraction.
struct BalanceReading {
  double value{0.0};
  std::string currency;
  std::string account;
  std::string strategy;  // Tag that produced the value
};

// Tags tried by extractBalance(), in order.
const std::vector<std::string>& balanceStrategies();

// -----------------------------------------------------------------------------
// extractBalance(values)
// -----------------------------------------------------------------------------
// @brief  Picks the account balance out of an account summary.
//
// @return The first value, walking balanceStrategies() in order
//         (NetLiquidation, TotalCashValue, AvailableFunds, BuyingPower,
//         EquityWithLoanValue), that parses completely as a number and is
//         positive. std::nullopt when no strategy yields one.
//
// @details
// Within one tag, accounts are visited in key order. Pure function.
// -----------------------------------------------------------------------------
std::optional<BalanceReading> extractBalance(const domain::AccountValues& values);

// -----------------------------------------------------------------------------
// AccountTracker
// -----------------------------------------------------------------------------
// Two caches, both keyed by (account, tag):
//
//   summary  replaced wholesale by each completed accountSummary cycle
//   values   updateAccountValue callbacks, merged key by key
//
// Plus the managed account list from the connection handshake.
//
// Thread model: written on the I/O thread and caller threads, read from
// caller threads; one mutex.
// -----------------------------------------------------------------------------
class AccountTracker {
 public:
  AccountTracker() = default;

  AccountTracker(const AccountTracker&) = delete;
  AccountTracker& operator=(const AccountTracker&) = delete;

  domain::AccountValues replaceSummary(
      const std::vector<domain::AccountValue>& rows);
  domain::AccountValues accountSummary() const;

  void onAccountValue(const std::string& key, const std::string& value,
                      const std::string& currency, const std::string& account);
  domain::AccountValues accountValues() const;

  // Comma separated list as sent by the gateway.
  void onManagedAccounts(const std::string& accounts);
  std::vector<std::string> managedAccounts() const;

 private:
  mutable std::mutex mutex_;
  domain::AccountValues summary_;
  domain::AccountValues values_;
  std::vector<std::string> managed_accounts_;
};

}  // namespace twsgate
