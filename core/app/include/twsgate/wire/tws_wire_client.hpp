#pragma once

#include "twsgate/wire/wire_client.hpp"
#include "twsgate/wire/wire_handler.hpp"

#include "DefaultEWrapper.h"
#include "EClientSocket.h"
#include "EReader.h"
#include "EReaderOSSignal.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace twsgate {
namespace wire {

// -----------------------------------------------------------------------------
// TwsWireClient: WireClient over the IB TWS C++ API
// -----------------------------------------------------------------------------
//
// @brief  Production adapter. Sends through EClientSocket and receives by
//         overriding the DefaultEWrapper callbacks the session consumes,
//         flattening vendor types (Decimal, Contract, Order, ...) into the
//         wire records before handing them to the attached WireHandler.
//
// @details
// Threads:
//   EReader runs its own socket-reading thread and raises the
//   EReaderOSSignal whenever a message is buffered. This class owns one
//   more thread, the I/O thread, which waits on that signal and calls
//   EReader::processMsgs(). Every EWrapper callback, and therefore every
//   WireHandler method, runs on the I/O thread.
//
//   connect():    eConnect -> EReader::start -> spawn I/O thread
//   disconnect(): stop flag -> eDisconnect -> wake signal -> join I/O
//                 thread -> destroy EReader (joins the socket reader)
//
// Sends:
//   EClientSocket is not safe for concurrent writers; every send takes
//   send_mutex_. A send while the socket is closed is logged and dropped.
//
// Requires TWS API 10.33 or newer (callback signatures with Decimal
// quantities and the errorTime argument on error()).
//
// Ownership:
//   Owned by GatewaySession through std::unique_ptr<WireClient>. The
//   handler is borrowed. disconnect() must not be called from the I/O
//   thread.
// -----------------------------------------------------------------------------
class TwsWireClient final : public WireClient, public DefaultEWrapper {
 public:
  TwsWireClient();
  ~TwsWireClient() override;

  TwsWireClient(const TwsWireClient&) = delete;
  TwsWireClient& operator=(const TwsWireClient&) = delete;
  TwsWireClient(TwsWireClient&&) = delete;
  TwsWireClient& operator=(TwsWireClient&&) = delete;

  // --- WireClient ----------------------------------------------------------
  void attach(WireHandler* handler) override;

  bool connect(const std::string& host, int port, int client_id) override;
  void disconnect() override;
  bool isConnected() const override;

  void requestHistoricalData(domain::RequestId id,
                             const domain::ContractSpec& contract,
                             const domain::HistoricalDataQuery& query) override;

  void requestMarketDataType(domain::MarketDataType type) override;
  void requestMarketData(domain::RequestId id,
                         const domain::ContractSpec& contract,
                         bool snapshot) override;
  void cancelMarketData(domain::RequestId id) override;

  void requestPositions() override;
  void cancelPositions() override;
  void requestAccountUpdates(bool subscribe,
                             const std::string& account) override;
  void requestAccountSummary(domain::RequestId id, const std::string& group,
                             const std::string& tags) override;
  void cancelAccountSummary(domain::RequestId id) override;

  void requestExecutions(domain::RequestId id,
                         const domain::ExecutionFilter& filter) override;

  void requestOpenOrders() override;
  void placeOrder(domain::OrderId id, const domain::ContractSpec& contract,
                  const domain::OrderRequest& order) override;
  void cancelOrder(domain::OrderId id) override;

  void requestContractDetails(domain::RequestId id,
                              const domain::ContractSpec& contract) override;
  void requestMatchingSymbols(domain::RequestId id,
                              const std::string& pattern) override;

  // --- EWrapper ------------------------------------------------------------
  void nextValidId(::OrderId order_id) override;
  void connectionClosed() override;
  void managedAccounts(const std::string& accounts) override;
  void error(int id, time_t error_time, int code, const std::string& message,
             const std::string& advanced_order_reject_json) override;

  void historicalData(TickerId id, const ::Bar& bar) override;
  void historicalDataEnd(int id, const std::string& start,
                         const std::string& end) override;

  void tickPrice(TickerId id, TickType field, double price,
                 const TickAttrib& attrib) override;
  void tickSize(TickerId id, TickType field, Decimal size) override;
  void tickString(TickerId id, TickType field,
                  const std::string& value) override;
  void tickSnapshotEnd(int id) override;
  void marketDataType(TickerId id, int data_type) override;

  void position(const std::string& account, const Contract& contract,
                Decimal quantity, double average_cost) override;
  void positionEnd() override;
  void updatePortfolio(const Contract& contract, Decimal quantity,
                       double market_price, double market_value,
                       double average_cost, double unrealized_pnl,
                       double realized_pnl,
                       const std::string& account) override;
  void updateAccountValue(const std::string& key, const std::string& value,
                          const std::string& currency,
                          const std::string& account) override;
  void accountDownloadEnd(const std::string& account) override;
  void accountSummary(int id, const std::string& account,
                      const std::string& tag, const std::string& value,
                      const std::string& currency) override;
  void accountSummaryEnd(int id) override;

  void execDetails(int id, const Contract& contract,
                   const ::Execution& execution) override;
  void execDetailsEnd(int id) override;

  void openOrder(::OrderId order_id, const Contract& contract,
                 const ::Order& order, const OrderState& state) override;
  void openOrderEnd() override;
  void orderStatus(::OrderId order_id, const std::string& status,
                   Decimal filled, Decimal remaining, double avg_fill_price,
                   long long perm_id, int parent_id, double last_fill_price,
                   int client_id, const std::string& why_held,
                   double mkt_cap_price) override;

  void contractDetails(int id, const ContractDetails& details) override;
  void contractDetailsEnd(int id) override;
  void symbolSamples(
      int id, const std::vector<ContractDescription>& descriptions) override;

 private:
  void ioLoop();

  // True (and send_mutex_ held by the caller) when a send may proceed.
  bool canSend(const char* what) const;

  EReaderOSSignal signal_{2000};
  std::unique_ptr<EClientSocket> client_;
  std::unique_ptr<EReader> reader_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  WireHandler* handler_{nullptr};
  mutable std::mutex send_mutex_;
};

}  // namespace wire
}  // namespace twsgate
