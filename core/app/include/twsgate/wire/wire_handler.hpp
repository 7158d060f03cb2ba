#pragma once

#include "twsgate/domain/contract.hpp"
#include "twsgate/domain/types.hpp"
#include "twsgate/wire/wire_records.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace twsgate {
namespace wire {

// -----------------------------------------------------------------------------
// WireHandler: inbound callback surface
// -----------------------------------------------------------------------------
//
// @brief  Every message the gateway sends, as a method call.
//
// @details
// Mirrors the subset of the vendor EWrapper that the session consumes, with
// vendor types (Decimal, Contract, Order, ...) already flattened by the
// adapter. Request-scoped callbacks carry the caller's RequestId; the
// position, portfolio and open-order streams carry none.
//
// Thread model:
//   Every method is invoked on the single gateway I/O thread, in wire
//   order. Implementations must not block: update state, signal waiters,
//   return.
// -----------------------------------------------------------------------------
class WireHandler {
 public:
  virtual ~WireHandler() = default;

  // Session
  virtual void onNextValidId(domain::OrderId order_id) = 0;
  virtual void onConnectionClosed() = 0;
  virtual void onManagedAccounts(const std::string& accounts) = 0;
  virtual void onError(std::int64_t id, int code,
                       const std::string& message) = 0;

  // Historical data
  virtual void onHistoricalBar(domain::RequestId id, const BarRecord& bar) = 0;
  virtual void onHistoricalDataEnd(domain::RequestId id) = 0;

  // Market data (tick_type is the vendor tick code)
  virtual void onTickPrice(domain::RequestId id, int tick_type,
                           double price) = 0;
  virtual void onTickSize(domain::RequestId id, int tick_type,
                          double size) = 0;
  virtual void onTickString(domain::RequestId id, int tick_type,
                            const std::string& value) = 0;
  virtual void onTickSnapshotEnd(domain::RequestId id) = 0;
  virtual void onMarketDataType(domain::RequestId id, int data_type) = 0;

  // Positions / portfolio / account
  virtual void onPosition(const std::string& account,
                          const domain::ContractSpec& contract,
                          double quantity, double average_cost) = 0;
  virtual void onPositionEnd() = 0;
  virtual void onPortfolioUpdate(const PortfolioRecord& record) = 0;
  virtual void onAccountValue(const std::string& key, const std::string& value,
                              const std::string& currency,
                              const std::string& account) = 0;
  virtual void onAccountDownloadEnd(const std::string& account) = 0;
  virtual void onAccountSummary(domain::RequestId id,
                                const std::string& account,
                                const std::string& tag,
                                const std::string& value,
                                const std::string& currency) = 0;
  virtual void onAccountSummaryEnd(domain::RequestId id) = 0;

  // Executions
  virtual void onExecution(domain::RequestId id,
                           const ExecutionRecord& record) = 0;
  virtual void onExecutionsEnd(domain::RequestId id) = 0;

  // Orders
  virtual void onOpenOrder(const OpenOrderRecord& record) = 0;
  virtual void onOpenOrdersEnd() = 0;
  virtual void onOrderStatus(const OrderStatusRecord& record) = 0;

  // Contract search
  virtual void onContractDetails(domain::RequestId id,
                                 const domain::ContractMatch& match) = 0;
  virtual void onContractDetailsEnd(domain::RequestId id) = 0;
  virtual void onSymbolSamples(
      domain::RequestId id,
      const std::vector<domain::ContractMatch>& matches) = 0;
};

}  // namespace wire
}  // namespace twsgate
