#include "twsgate/domain/contract.hpp"

#include <algorithm>
#include <cctype>

namespace twsgate {
namespace domain {

namespace {

struct IndexListing {
  const char* symbol;
  const char* exchange;
};

constexpr IndexListing kIndexTable[] = {
    {"VIX", "CBOE"},  {"VXN", "CBOE"},   {"VVIX", "CBOE"}, {"SPX", "CBOE"},
    {"XSP", "CBOE"},  {"NDX", "NASDAQ"}, {"RUT", "RUSSELL"},
};

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

const IndexListing* findIndex(const std::string& symbol) {
  for (const auto& listing : kIndexTable) {
    if (symbol == listing.symbol) {
      return &listing;
    }
  }
  return nullptr;
}

}  // namespace

bool isIndexSymbol(const std::string& symbol) {
  std::string s = upper(symbol);
  if (!s.empty() && s.front() == '^') {
    return true;
  }
  return findIndex(s) != nullptr;
}

ContractSpec makeContract(const std::string& symbol) {
  ContractSpec spec;
  std::string s = upper(symbol);

  const bool caret = !s.empty() && s.front() == '^';
  if (caret) {
    s.erase(0, 1);
  }

  spec.symbol = s;

  if (const IndexListing* listing = findIndex(s)) {
    spec.sec_type = "IND";
    spec.exchange = listing->exchange;
  } else if (caret) {
    // Unlisted index: CBOE hosts most of what the gateway serves as IND.
    spec.sec_type = "IND";
    spec.exchange = "CBOE";
  }
  return spec;
}

ContractSpec makeContract(const std::string& symbol,
                          const std::string& sec_type) {
  if (sec_type.empty()) {
    return makeContract(symbol);
  }
  ContractSpec spec = makeContract(symbol);
  spec.sec_type = upper(sec_type);
  if (spec.sec_type == "STK") {
    spec.exchange = "SMART";
  }
  return spec;
}

}  // namespace domain
}  // namespace twsgate
