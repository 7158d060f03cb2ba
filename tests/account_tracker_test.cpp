// =============================================================================
// account_tracker_test.cpp
// =============================================================================
// Unit tests for twsgate::AccountTracker and extractBalance().
//
// Validates:
//   - Strategy order: NetLiquidation first, EquityWithLoanValue last
//   - Non-numeric, partially numeric and non-positive values are skipped
//   - Summary replacement is wholesale; account values merge key by key
//   - Managed account list parsing
// =============================================================================

#include "twsgate/tracking/account_tracker.hpp"

#include <gtest/gtest.h>

#include <vector>

using twsgate::domain::AccountValue;
using twsgate::domain::AccountValues;

namespace {

void put(AccountValues& values, const std::string& account,
         const std::string& tag, const std::string& value,
         const std::string& currency = "USD") {
  values[{account, tag}] = AccountValue{account, tag, value, currency};
}

}  // namespace

TEST(ExtractBalanceTest, StrategyTableOrder) {
  const auto& strategies = twsgate::balanceStrategies();
  ASSERT_EQ(strategies.size(), 5u);
  EXPECT_EQ(strategies.front(), "NetLiquidation");
  EXPECT_EQ(strategies[1], "TotalCashValue");
  EXPECT_EQ(strategies[2], "AvailableFunds");
  EXPECT_EQ(strategies[3], "BuyingPower");
  EXPECT_EQ(strategies.back(), "EquityWithLoanValue");
}

TEST(ExtractBalanceTest, NetLiquidationWins) {
  AccountValues values;
  put(values, "DU1", "TotalCashValue", "5000");
  put(values, "DU1", "NetLiquidation", "12500.50");

  const auto reading = twsgate::extractBalance(values);
  ASSERT_TRUE(reading.has_value());
  EXPECT_DOUBLE_EQ(reading->value, 12500.50);
  EXPECT_EQ(reading->strategy, "NetLiquidation");
  EXPECT_EQ(reading->account, "DU1");
  EXPECT_EQ(reading->currency, "USD");
}

// -----------------------------------------------------------------------------
// Unusable values fall through to the next strategy.
// -----------------------------------------------------------------------------
TEST(ExtractBalanceTest, SkipsUnusableValues) {
  AccountValues values;
  put(values, "DU1", "NetLiquidation", "");
  put(values, "DU1", "TotalCashValue", "12abc");
  put(values, "DU1", "AvailableFunds", "0");
  put(values, "DU1", "BuyingPower", "-10");
  put(values, "DU1", "EquityWithLoanValue", "800", "EUR");

  const auto reading = twsgate::extractBalance(values);
  ASSERT_TRUE(reading.has_value());
  EXPECT_EQ(reading->strategy, "EquityWithLoanValue");
  EXPECT_DOUBLE_EQ(reading->value, 800.0);
  EXPECT_EQ(reading->currency, "EUR");
}

TEST(ExtractBalanceTest, NothingUsable) {
  AccountValues values;
  put(values, "DU1", "GrossPositionValue", "1000");
  EXPECT_FALSE(twsgate::extractBalance(values).has_value());
  EXPECT_FALSE(twsgate::extractBalance(AccountValues{}).has_value());
}

TEST(AccountTrackerTest, ReplaceSummaryIsWholesale) {
  twsgate::AccountTracker tracker;
  tracker.replaceSummary({AccountValue{"DU1", "NetLiquidation", "100", "USD"},
                          AccountValue{"DU1", "BuyingPower", "400", "USD"}});
  ASSERT_EQ(tracker.accountSummary().size(), 2u);

  const auto fresh = tracker.replaceSummary(
      {AccountValue{"DU1", "NetLiquidation", "110", "USD"}});
  EXPECT_EQ(fresh.size(), 1u);

  const auto summary = tracker.accountSummary();
  ASSERT_EQ(summary.size(), 1u);
  EXPECT_EQ(summary.at({"DU1", "NetLiquidation"}).value, "110");
}

TEST(AccountTrackerTest, AccountValuesMerge) {
  twsgate::AccountTracker tracker;
  tracker.onAccountValue("CashBalance", "100", "USD", "DU1");
  tracker.onAccountValue("CashBalance", "150", "USD", "DU1");
  tracker.onAccountValue("CashBalance", "7", "USD", "DU2");

  const auto values = tracker.accountValues();
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values.at({"DU1", "CashBalance"}).value, "150");
}

TEST(AccountTrackerTest, ManagedAccounts) {
  twsgate::AccountTracker tracker;
  tracker.onManagedAccounts("DU111,DU222,");

  const auto accounts = tracker.managedAccounts();
  ASSERT_EQ(accounts.size(), 2u);
  EXPECT_EQ(accounts[0], "DU111");
  EXPECT_EQ(accounts[1], "DU222");
}
