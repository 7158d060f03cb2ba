#pragma once

#include "twsgate/config/session_config.hpp"
#include "twsgate/connection/connection_manager.hpp"
#include "twsgate/correlation/request_registry.hpp"
#include "twsgate/domain/account_value.hpp"
#include "twsgate/domain/bar.hpp"
#include "twsgate/domain/connection_state.hpp"
#include "twsgate/domain/contract.hpp"
#include "twsgate/domain/execution.hpp"
#include "twsgate/domain/order.hpp"
#include "twsgate/domain/position.hpp"
#include "twsgate/domain/session_error.hpp"
#include "twsgate/domain/tick.hpp"
#include "twsgate/domain/types.hpp"
#include "twsgate/eventbus/event_bus.hpp"
#include "twsgate/marketdata/market_data_cache.hpp"
#include "twsgate/time/clock.hpp"
#include "twsgate/tracking/account_tracker.hpp"
#include "twsgate/tracking/order_tracker.hpp"
#include "twsgate/tracking/position_tracker.hpp"
#include "twsgate/wire/wire_client.hpp"
#include "twsgate/wire/wire_handler.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace twsgate {

// Tags requested by getAccountSummary() when the caller names none.
inline constexpr const char* kDefaultAccountSummaryTags =
    "NetLiquidation,TotalCashValue,GrossPositionValue,AvailableFunds,"
    "BuyingPower";

// -----------------------------------------------------------------------------
// GatewaySession: synchronous facade over one gateway connection
// -----------------------------------------------------------------------------
//
// @brief  Composes the connection manager, request registry, trackers and
//         market data cache into blocking, timeout-bounded calls, and is the
//         WireHandler every gateway callback lands on.
//
// @details
// Request flow for a keyed request (historical data, account summary,
// executions, contract search):
//
//   1. registry_.issue(kind) allocates the request id
//   2. the matching WireClient send method fires
//   3. registry_.await*(id, timeout) blocks; callbacks on the I/O thread
//      stream rows in and the end callback completes the waiter
//
// Positions, portfolio and open orders carry no request id on the wire. A
// per-stream mutex keeps at most one of each in flight and the I/O side
// finds the waiter with registry_.latestOf(kind).
//
// Snapshots wait on their MarketDataCache entry instead of the registry.
//
// Error routing (onError):
//   informational  -> log (10167/10168 also mark the symbol)
//   fatal          -> ConnectionManager::onFatalError, all waiters fail
//   with an id     -> registry, then market data entry, then order tracker
//   every non-informational error is published as GatewayErrorEvent
//
// Thread model:
//   Facade methods may be called from any number of caller threads. The
//   WireHandler overrides run on the gateway I/O thread and never block.
//
// Ownership:
//   Explicitly constructed and owned (main() owns the production instance).
//   Owns the WireClient and every component. Borrows the Clock, which must
//   outlive the session. The destructor stops the supervisor and
//   disconnects.
// -----------------------------------------------------------------------------
class GatewaySession final : public wire::WireHandler {
 public:
  GatewaySession(std::unique_ptr<wire::WireClient> wire, const Clock& clock,
                 SessionConfig config = SessionConfig{});
  ~GatewaySession() override;

  GatewaySession(const GatewaySession&) = delete;
  GatewaySession& operator=(const GatewaySession&) = delete;
  GatewaySession(GatewaySession&&) = delete;
  GatewaySession& operator=(GatewaySession&&) = delete;

  // --- Connection ------------------------------------------------------------
  bool connect(const std::string& host, int port, int client_id,
               std::chrono::milliseconds timeout);

  // Host, port and client id from the config.
  bool connect(std::chrono::milliseconds timeout);
  bool connect();

  void disconnect();
  bool reconnect(std::chrono::milliseconds timeout);
  bool isConnected() const;
  domain::ConnectionState connectionState() const;

  // Interval and connect timeout from the config.
  void startSupervisor();
  void stopSupervisor();

  EventBus& eventBus() { return bus_; }

  // -------------------------------------------------------------------------
  // executeCommand(command)
  // -------------------------------------------------------------------------
  // @brief  Operator command handler bound to the IPC REP socket.
  //
  // @param  command  A bare verb ("STATUS") or a JSON object
  //                  {"cmd": "STATUS"}. Verbs: PING, STATUS, ORDERS,
  //                  POSITIONS, ACCOUNT, RECONNECT.
  //
  // @return One JSON object with an "ok" field. Malformed JSON and unknown
  //         verbs produce {"ok": false, "error": ...}.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& command);

  // --- Historical data -------------------------------------------------------

  // -------------------------------------------------------------------------
  // getHistoricalData(query, timeout)
  // -------------------------------------------------------------------------
  // @return Bars in wire order. InvalidArgument for a bad duration, bar size
  //         or whatToShow; NotConnected; otherwise whatever the registry
  //         wait produced.
  // -------------------------------------------------------------------------
  domain::Result<std::vector<domain::Bar>> getHistoricalData(
      const domain::HistoricalDataQuery& query,
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  // Sequential fetches of `query` for each symbol with `pacing` between
  // requests. Only symbols that succeeded appear in the map.
  std::map<std::string, std::vector<domain::Bar>> getHistoricalDataBatch(
      const std::vector<std::string>& symbols,
      const domain::HistoricalDataQuery& query,
      std::chrono::milliseconds pacing = std::chrono::milliseconds(500),
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  // --- Market data -----------------------------------------------------------

  // -------------------------------------------------------------------------
  // getMarketDataSnapshot(symbol, timeout, type)
  // -------------------------------------------------------------------------
  // @brief  One-shot quote. Opens a cache entry, requests a snapshot and
  //         waits on the entry; the entry is always cancelled and closed
  //         before returning.
  //
  // @details
  // A live request for a symbol already marked without entitlement fails
  // at once with PermissionDenied and sends nothing. Non-live types switch
  // the gateway's market data type for the request and restore Live
  // afterwards.
  // -------------------------------------------------------------------------
  domain::Result<domain::MarketDataTick> getMarketDataSnapshot(
      const std::string& symbol,
      std::chrono::milliseconds timeout = std::chrono::seconds(10),
      domain::MarketDataType type = domain::MarketDataType::Live);

  // Standing subscription. Read it with latestMarketData().
  domain::Result<domain::MarketDataHandle> subscribeMarketData(
      const std::string& symbol,
      domain::MarketDataType type = domain::MarketDataType::Live);

  // snapshot = true behaves like getMarketDataSnapshot(); otherwise opens a
  // subscription and returns its handle.
  domain::Result<std::variant<domain::MarketDataTick, domain::MarketDataHandle>>
  subscribeMarketData(const std::string& symbol, bool snapshot,
                      std::chrono::milliseconds timeout);

  std::optional<domain::MarketDataTick> latestMarketData(
      const domain::MarketDataHandle& handle) const;
  bool unsubscribeMarketData(const domain::MarketDataHandle& handle);

  // Snapshot price (last, close, midpoint, bid, ask). Retries with delayed
  // data on PermissionDenied.
  domain::Result<double> getMarketPrice(
      const std::string& symbol,
      std::chrono::milliseconds timeout = std::chrono::seconds(10));

  bool hasMarketDataPermissionError(const std::string& symbol) const;

  // --- Positions and account -------------------------------------------------
  domain::Result<std::vector<domain::Position>> getPositions(
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  domain::Result<std::vector<domain::Position>> getPortfolioPositions(
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  // Portfolio with entry times taken from the most recent opening-side
  // execution (last 7 days, falling back to all executions the gateway
  // still holds). Rows without a match keep their synthesized time.
  domain::Result<std::vector<domain::Position>> getPositionsWithEntryTimes(
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  domain::Result<domain::AccountValues> getAccountSummary(
      const std::string& tags = kDefaultAccountSummaryTags,
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  domain::Result<BalanceReading> getAccountBalance(
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  domain::Result<std::vector<domain::Execution>> getExecutions(
      std::optional<domain::Timestamp> since,
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  // --- Orders ----------------------------------------------------------------
  domain::Result<std::vector<domain::Order>> getOpenOrders(
      std::chrono::milliseconds timeout = std::chrono::seconds(30));

  // -------------------------------------------------------------------------
  // placeOrder(request)
  // -------------------------------------------------------------------------
  // @return The gateway order id as soon as the order is sent. Fill and
  //         rejection are observed through order()/orders() or the
  //         OrderUpdateEvent stream.
  //
  // @details
  // The Pending record is inserted before the wire send. InvalidArgument
  // and NotConnected fail without wire traffic and without using an id.
  // -------------------------------------------------------------------------
  domain::Result<domain::OrderId> placeOrder(
      const domain::OrderRequest& request);

  // False without wire traffic for unknown or terminal orders, or when not
  // connected.
  bool cancelOrder(domain::OrderId id);

  std::optional<domain::Order> order(domain::OrderId id) const;
  std::vector<domain::Order> orders() const;

  // --- Contracts -------------------------------------------------------------
  domain::Result<std::vector<domain::ContractMatch>> searchContracts(
      const std::string& pattern, const std::string& sec_type = "STK",
      std::chrono::milliseconds timeout = std::chrono::seconds(10));

  domain::Result<std::vector<domain::ContractMatch>> searchSymbols(
      const std::string& pattern,
      std::chrono::milliseconds timeout = std::chrono::seconds(10));

  // True per symbol when a contract search returns an exact symbol match.
  std::map<std::string, bool> validateSymbols(
      const std::vector<std::string>& symbols,
      std::chrono::milliseconds timeout = std::chrono::seconds(10));

  const SessionConfig& config() const { return config_; }

  // --- wire::WireHandler (I/O thread) ----------------------------------------
  void onNextValidId(domain::OrderId order_id) override;
  void onConnectionClosed() override;
  void onManagedAccounts(const std::string& accounts) override;
  void onError(std::int64_t id, int code, const std::string& message) override;

  void onHistoricalBar(domain::RequestId id,
                       const wire::BarRecord& bar) override;
  void onHistoricalDataEnd(domain::RequestId id) override;

  void onTickPrice(domain::RequestId id, int tick_type, double price) override;
  void onTickSize(domain::RequestId id, int tick_type, double size) override;
  void onTickString(domain::RequestId id, int tick_type,
                    const std::string& value) override;
  void onTickSnapshotEnd(domain::RequestId id) override;
  void onMarketDataType(domain::RequestId id, int data_type) override;

  void onPosition(const std::string& account,
                  const domain::ContractSpec& contract, double quantity,
                  double average_cost) override;
  void onPositionEnd() override;
  void onPortfolioUpdate(const wire::PortfolioRecord& record) override;
  void onAccountValue(const std::string& key, const std::string& value,
                      const std::string& currency,
                      const std::string& account) override;
  void onAccountDownloadEnd(const std::string& account) override;
  void onAccountSummary(domain::RequestId id, const std::string& account,
                        const std::string& tag, const std::string& value,
                        const std::string& currency) override;
  void onAccountSummaryEnd(domain::RequestId id) override;

  void onExecution(domain::RequestId id,
                   const wire::ExecutionRecord& record) override;
  void onExecutionsEnd(domain::RequestId id) override;

  void onOpenOrder(const wire::OpenOrderRecord& record) override;
  void onOpenOrdersEnd() override;
  void onOrderStatus(const wire::OrderStatusRecord& record) override;

  void onContractDetails(domain::RequestId id,
                         const domain::ContractMatch& match) override;
  void onContractDetailsEnd(domain::RequestId id) override;
  void onSymbolSamples(
      domain::RequestId id,
      const std::vector<domain::ContractMatch>& matches) override;

 private:
  template <typename T>
  static domain::Result<T> notConnected(const char* operation);

  void completeLatest(RequestKind kind);

  SessionConfig config_;
  const Clock& clock_;

  // Declared first so it is destroyed last: every component below may
  // still call into it during teardown.
  std::unique_ptr<wire::WireClient> wire_;

  EventBus bus_;
  ConnectionManager connection_;
  RequestRegistry registry_;
  OrderTracker orders_;
  PositionTracker positions_;
  AccountTracker accounts_;
  MarketDataCache market_data_;

  // One in-flight request per un-keyed stream.
  std::mutex positions_stream_mutex_;
  std::mutex portfolio_stream_mutex_;
  std::mutex open_orders_stream_mutex_;
};

}  // namespace twsgate
