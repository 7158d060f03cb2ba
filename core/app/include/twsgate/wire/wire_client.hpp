#pragma once

#include "twsgate/domain/bar.hpp"
#include "twsgate/domain/contract.hpp"
#include "twsgate/domain/execution.hpp"
#include "twsgate/domain/order.hpp"
#include "twsgate/domain/tick.hpp"
#include "twsgate/domain/types.hpp"

#include <string>

namespace twsgate {
namespace wire {

class WireHandler;

// -----------------------------------------------------------------------------
// WireClient: outbound request surface
// -----------------------------------------------------------------------------
//
// @brief  Abstract seam over the vendor socket client. GatewaySession talks
//         only to this interface, so tests substitute a recording mock and
//         production plugs in TwsWireClient.
//
// @details
// Every send method is fire-and-forget: results arrive later on the
// attached WireHandler. Send methods called while disconnected are
// dropped by the implementation (the vendor client does the same and
// reports error 504).
//
// connect() opens the socket AND starts the I/O read loop. The handshake
// (nextValidId) arrives asynchronously through the handler. disconnect()
// closes the socket and joins the I/O thread; it must not be called from
// the I/O thread itself.
//
// Thread model:
//   Send methods may be called from any caller thread; implementations
//   serialize writes internally.
//
// Ownership:
//   Owned by GatewaySession via std::unique_ptr. The handler pointer is
//   non-owning and must outlive the client.
// -----------------------------------------------------------------------------
class WireClient {
 public:
  virtual ~WireClient() = default;

  virtual void attach(WireHandler* handler) = 0;

  virtual bool connect(const std::string& host, int port, int client_id) = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual void requestHistoricalData(domain::RequestId id,
                                     const domain::ContractSpec& contract,
                                     const domain::HistoricalDataQuery& query) = 0;

  virtual void requestMarketDataType(domain::MarketDataType type) = 0;
  virtual void requestMarketData(domain::RequestId id,
                                 const domain::ContractSpec& contract,
                                 bool snapshot) = 0;
  virtual void cancelMarketData(domain::RequestId id) = 0;

  virtual void requestPositions() = 0;
  virtual void cancelPositions() = 0;
  virtual void requestAccountUpdates(bool subscribe,
                                     const std::string& account) = 0;
  virtual void requestAccountSummary(domain::RequestId id,
                                     const std::string& group,
                                     const std::string& tags) = 0;
  virtual void cancelAccountSummary(domain::RequestId id) = 0;

  virtual void requestExecutions(domain::RequestId id,
                                 const domain::ExecutionFilter& filter) = 0;

  virtual void requestOpenOrders() = 0;
  virtual void placeOrder(domain::OrderId id,
                          const domain::ContractSpec& contract,
                          const domain::OrderRequest& order) = 0;
  virtual void cancelOrder(domain::OrderId id) = 0;

  virtual void requestContractDetails(domain::RequestId id,
                                      const domain::ContractSpec& contract) = 0;
  virtual void requestMatchingSymbols(domain::RequestId id,
                                      const std::string& pattern) = 0;
};

}  // namespace wire
}  // namespace twsgate
