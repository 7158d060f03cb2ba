#pragma once

#include <string>

namespace twsgate {
namespace domain {

// Minimal contract description sent on the wire. The adapter copies these
// fields into the vendor Contract.
struct ContractSpec {
  std::string symbol;
  std::string sec_type{"STK"};
  std::string exchange{"SMART"};
  std::string primary_exchange;
  std::string currency{"USD"};
  long con_id{0};
};

// One row of a contract or symbol search.
struct ContractMatch {
  long con_id{0};
  std::string symbol;
  std::string sec_type;
  std::string exchange;
  std::string primary_exchange;
  std::string currency;
  std::string long_name;
};

// -----------------------------------------------------------------------------
// makeContract(symbol)
// -----------------------------------------------------------------------------
// @brief  Builds the contract for a bare ticker.
//
// @details
// Index underlyings must be requested as secType IND on their listing
// exchange; asking for "VIX" as a stock returns error 200. Two conventions
// select an index:
//   - a leading caret ("^VIX", "^SPX"); the caret is stripped
//   - membership in the built-in index table (VIX, VXN, VVIX, SPX, XSP on
//     CBOE, NDX on NASDAQ, RUT on RUSSELL)
// Everything else is STK / SMART / USD. Symbols are upper-cased.
// -----------------------------------------------------------------------------
ContractSpec makeContract(const std::string& symbol);

// Same as makeContract() but with an explicit secType for searches.
ContractSpec makeContract(const std::string& symbol,
                          const std::string& sec_type);

bool isIndexSymbol(const std::string& symbol);

}  // namespace domain
}  // namespace twsgate
