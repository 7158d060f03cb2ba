#include "twsgate/wire/tws_wire_client.hpp"

#include "twsgate/time/time_utils.hpp"

#include "CommonDefs.h"
#include "Contract.h"
#include "Decimal.h"
#include "Execution.h"
#include "Order.h"
#include "OrderCancel.h"
#include "OrderState.h"

#include <iostream>

namespace twsgate {
namespace wire {

namespace {

Contract toVendorContract(const domain::ContractSpec& spec) {
  Contract contract;
  contract.conId = spec.con_id;
  contract.symbol = spec.symbol;
  contract.secType = spec.sec_type;
  contract.exchange = spec.exchange;
  contract.primaryExchange = spec.primary_exchange;
  contract.currency = spec.currency;
  return contract;
}

domain::ContractSpec fromVendorContract(const Contract& contract) {
  domain::ContractSpec spec;
  spec.con_id = contract.conId;
  spec.symbol = contract.symbol;
  spec.sec_type = contract.secType;
  spec.exchange = contract.exchange;
  spec.primary_exchange = contract.primaryExchange;
  spec.currency = contract.currency;
  return spec;
}

domain::ContractMatch toMatch(const Contract& contract,
                              const std::string& long_name) {
  domain::ContractMatch match;
  match.con_id = contract.conId;
  match.symbol = contract.symbol;
  match.sec_type = contract.secType;
  match.exchange = contract.exchange;
  match.primary_exchange = contract.primaryExchange;
  match.currency = contract.currency;
  match.long_name = long_name;
  return match;
}

double toDouble(Decimal value) {
  if (value == UNSET_DECIMAL) {
    return 0.0;
  }
  return DecimalFunctions::decimalToDouble(value);
}

}  // namespace

TwsWireClient::TwsWireClient()
    : client_(std::make_unique<EClientSocket>(this, &signal_)) {}

TwsWireClient::~TwsWireClient() { disconnect(); }

void TwsWireClient::attach(WireHandler* handler) { handler_ = handler; }

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------
bool TwsWireClient::connect(const std::string& host, int port,
                            int client_id) {
  {
    std::lock_guard lock(send_mutex_);
    if (!client_->eConnect(host.c_str(), port, client_id, false)) {
      std::cerr << "[TwsWire] ERROR: eConnect to " << host << ":" << port
                << " failed.\n";
      return false;
    }
  }

  reader_ = std::make_unique<EReader>(client_.get(), &signal_);
  reader_->start();

  running_.store(true);
  io_thread_ = std::thread([this] { ioLoop(); });

  std::cout << "[TwsWire] socket open, reader started, server version "
            << client_->serverVersion() << "\n";
  return true;
}

void TwsWireClient::disconnect() {
  running_.store(false);
  {
    std::lock_guard lock(send_mutex_);
    if (client_->isConnected()) {
      client_->eDisconnect();
    }
  }
  signal_.issueSignal();

  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  reader_.reset();
}

bool TwsWireClient::isConnected() const {
  std::lock_guard lock(send_mutex_);
  return client_->isConnected();
}

void TwsWireClient::ioLoop() {
  while (running_.load() && client_->isConnected()) {
    signal_.waitForSignal();
    if (!running_.load()) {
      break;
    }
    reader_->processMsgs();
  }
}

bool TwsWireClient::canSend(const char* what) const {
  if (!client_->isConnected()) {
    std::cerr << "[TwsWire] WARNING: " << what
              << " dropped, socket not connected.\n";
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// Outbound
// -----------------------------------------------------------------------------
void TwsWireClient::requestHistoricalData(
    domain::RequestId id, const domain::ContractSpec& contract,
    const domain::HistoricalDataQuery& query) {
  const std::string end =
      query.end_time ? formatWireDateTime(*query.end_time) : std::string{};

  std::lock_guard lock(send_mutex_);
  if (!canSend("reqHistoricalData")) {
    return;
  }
  // formatDate=2: intraday bar times as epoch seconds.
  client_->reqHistoricalData(id, toVendorContract(contract), end,
                             query.duration, query.bar_size,
                             query.what_to_show, query.use_rth ? 1 : 0, 2,
                             false, TagValueListSPtr());
}

void TwsWireClient::requestMarketDataType(domain::MarketDataType type) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqMarketDataType")) {
    return;
  }
  client_->reqMarketDataType(static_cast<int>(type));
}

void TwsWireClient::requestMarketData(domain::RequestId id,
                                      const domain::ContractSpec& contract,
                                      bool snapshot) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqMktData")) {
    return;
  }
  client_->reqMktData(id, toVendorContract(contract), "", snapshot, false,
                      TagValueListSPtr());
}

void TwsWireClient::cancelMarketData(domain::RequestId id) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("cancelMktData")) {
    return;
  }
  client_->cancelMktData(id);
}

void TwsWireClient::requestPositions() {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqPositions")) {
    return;
  }
  client_->reqPositions();
}

void TwsWireClient::cancelPositions() {
  std::lock_guard lock(send_mutex_);
  if (!canSend("cancelPositions")) {
    return;
  }
  client_->cancelPositions();
}

void TwsWireClient::requestAccountUpdates(bool subscribe,
                                          const std::string& account) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqAccountUpdates")) {
    return;
  }
  client_->reqAccountUpdates(subscribe, account);
}

void TwsWireClient::requestAccountSummary(domain::RequestId id,
                                          const std::string& group,
                                          const std::string& tags) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqAccountSummary")) {
    return;
  }
  client_->reqAccountSummary(id, group, tags);
}

void TwsWireClient::cancelAccountSummary(domain::RequestId id) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("cancelAccountSummary")) {
    return;
  }
  client_->cancelAccountSummary(id);
}

void TwsWireClient::requestExecutions(domain::RequestId id,
                                      const domain::ExecutionFilter& filter) {
  ::ExecutionFilter vendor_filter;
  vendor_filter.m_acctCode = filter.account;
  vendor_filter.m_symbol = filter.symbol;
  if (filter.since) {
    vendor_filter.m_time = formatWireDateTime(*filter.since);
  }

  std::lock_guard lock(send_mutex_);
  if (!canSend("reqExecutions")) {
    return;
  }
  client_->reqExecutions(id, vendor_filter);
}

void TwsWireClient::requestOpenOrders() {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqAllOpenOrders")) {
    return;
  }
  client_->reqAllOpenOrders();
}

void TwsWireClient::placeOrder(domain::OrderId id,
                               const domain::ContractSpec& contract,
                               const domain::OrderRequest& request) {
  ::Order order;
  order.action = domain::toWire(request.side);
  order.totalQuantity = DecimalFunctions::doubleToDecimal(request.quantity);
  order.orderType = domain::toWire(request.type);
  order.tif = domain::toWire(request.tif);
  order.account = request.account;
  order.transmit = true;
  if (request.limit_price) {
    order.lmtPrice = *request.limit_price;
  }
  if (request.stop_price) {
    order.auxPrice = *request.stop_price;
  }

  std::lock_guard lock(send_mutex_);
  if (!canSend("placeOrder")) {
    return;
  }
  client_->placeOrder(static_cast<::OrderId>(id), toVendorContract(contract),
                      order);
}

void TwsWireClient::cancelOrder(domain::OrderId id) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("cancelOrder")) {
    return;
  }
  client_->cancelOrder(static_cast<::OrderId>(id), OrderCancel());
}

void TwsWireClient::requestContractDetails(
    domain::RequestId id, const domain::ContractSpec& contract) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqContractDetails")) {
    return;
  }
  client_->reqContractDetails(id, toVendorContract(contract));
}

void TwsWireClient::requestMatchingSymbols(domain::RequestId id,
                                           const std::string& pattern) {
  std::lock_guard lock(send_mutex_);
  if (!canSend("reqMatchingSymbols")) {
    return;
  }
  client_->reqMatchingSymbols(id, pattern);
}

// -----------------------------------------------------------------------------
// Inbound (I/O thread)
// -----------------------------------------------------------------------------
void TwsWireClient::nextValidId(::OrderId order_id) {
  if (handler_) {
    handler_->onNextValidId(static_cast<domain::OrderId>(order_id));
  }
}

void TwsWireClient::connectionClosed() {
  std::cerr << "[TwsWire] WARNING: connection closed by gateway.\n";
  if (handler_) {
    handler_->onConnectionClosed();
  }
}

void TwsWireClient::managedAccounts(const std::string& accounts) {
  if (handler_) {
    handler_->onManagedAccounts(accounts);
  }
}

void TwsWireClient::error(int id, time_t /*error_time*/, int code,
                          const std::string& message,
                          const std::string& /*advanced_order_reject_json*/) {
  if (handler_) {
    handler_->onError(id, code, message);
  }
}

void TwsWireClient::historicalData(TickerId id, const ::Bar& bar) {
  if (!handler_) {
    return;
  }
  BarRecord record;
  record.time = bar.time;
  record.open = bar.open;
  record.high = bar.high;
  record.low = bar.low;
  record.close = bar.close;
  record.volume = toDouble(bar.volume);
  record.wap = toDouble(bar.wap);
  record.count = bar.count;
  handler_->onHistoricalBar(static_cast<domain::RequestId>(id), record);
}

void TwsWireClient::historicalDataEnd(int id, const std::string& /*start*/,
                                      const std::string& /*end*/) {
  if (handler_) {
    handler_->onHistoricalDataEnd(id);
  }
}

void TwsWireClient::tickPrice(TickerId id, TickType field, double price,
                              const TickAttrib& /*attrib*/) {
  if (handler_) {
    handler_->onTickPrice(static_cast<domain::RequestId>(id),
                          static_cast<int>(field), price);
  }
}

void TwsWireClient::tickSize(TickerId id, TickType field, Decimal size) {
  if (handler_) {
    handler_->onTickSize(static_cast<domain::RequestId>(id),
                         static_cast<int>(field), toDouble(size));
  }
}

void TwsWireClient::tickString(TickerId id, TickType field,
                               const std::string& value) {
  if (handler_) {
    handler_->onTickString(static_cast<domain::RequestId>(id),
                           static_cast<int>(field), value);
  }
}

void TwsWireClient::tickSnapshotEnd(int id) {
  if (handler_) {
    handler_->onTickSnapshotEnd(id);
  }
}

void TwsWireClient::marketDataType(TickerId id, int data_type) {
  if (handler_) {
    handler_->onMarketDataType(static_cast<domain::RequestId>(id), data_type);
  }
}

void TwsWireClient::position(const std::string& account,
                             const Contract& contract, Decimal quantity,
                             double average_cost) {
  if (handler_) {
    handler_->onPosition(account, fromVendorContract(contract),
                         toDouble(quantity), average_cost);
  }
}

void TwsWireClient::positionEnd() {
  if (handler_) {
    handler_->onPositionEnd();
  }
}

void TwsWireClient::updatePortfolio(const Contract& contract, Decimal quantity,
                                    double market_price, double market_value,
                                    double average_cost, double unrealized_pnl,
                                    double realized_pnl,
                                    const std::string& account) {
  if (!handler_) {
    return;
  }
  PortfolioRecord record;
  record.contract = fromVendorContract(contract);
  record.position = toDouble(quantity);
  record.market_price = market_price;
  record.market_value = market_value;
  record.average_cost = average_cost;
  record.unrealized_pnl = unrealized_pnl;
  record.realized_pnl = realized_pnl;
  record.account = account;
  handler_->onPortfolioUpdate(record);
}

void TwsWireClient::updateAccountValue(const std::string& key,
                                       const std::string& value,
                                       const std::string& currency,
                                       const std::string& account) {
  if (handler_) {
    handler_->onAccountValue(key, value, currency, account);
  }
}

void TwsWireClient::accountDownloadEnd(const std::string& account) {
  if (handler_) {
    handler_->onAccountDownloadEnd(account);
  }
}

void TwsWireClient::accountSummary(int id, const std::string& account,
                                   const std::string& tag,
                                   const std::string& value,
                                   const std::string& currency) {
  if (handler_) {
    handler_->onAccountSummary(id, account, tag, value, currency);
  }
}

void TwsWireClient::accountSummaryEnd(int id) {
  if (handler_) {
    handler_->onAccountSummaryEnd(id);
  }
}

void TwsWireClient::execDetails(int id, const Contract& contract,
                                const ::Execution& execution) {
  if (!handler_) {
    return;
  }
  ExecutionRecord record;
  record.exec_id = execution.execId;
  record.order_id = static_cast<domain::OrderId>(execution.orderId);
  record.account = execution.acctNumber;
  record.symbol = contract.symbol;
  record.side = execution.side;
  record.shares = toDouble(execution.shares);
  record.price = execution.price;
  record.time = execution.time;
  handler_->onExecution(id, record);
}

void TwsWireClient::execDetailsEnd(int id) {
  if (handler_) {
    handler_->onExecutionsEnd(id);
  }
}

void TwsWireClient::openOrder(::OrderId order_id, const Contract& contract,
                              const ::Order& order, const OrderState& state) {
  if (!handler_) {
    return;
  }
  OpenOrderRecord record;
  record.order_id = static_cast<domain::OrderId>(order_id);
  record.contract = fromVendorContract(contract);
  record.action = order.action;
  record.total_quantity = toDouble(order.totalQuantity);
  record.order_type = order.orderType;
  record.limit_price = order.lmtPrice == UNSET_DOUBLE ? 0.0 : order.lmtPrice;
  record.aux_price = order.auxPrice == UNSET_DOUBLE ? 0.0 : order.auxPrice;
  record.tif = order.tif;
  record.status = state.status;
  handler_->onOpenOrder(record);
}

void TwsWireClient::openOrderEnd() {
  if (handler_) {
    handler_->onOpenOrdersEnd();
  }
}

void TwsWireClient::orderStatus(::OrderId order_id, const std::string& status,
                                Decimal filled, Decimal remaining,
                                double avg_fill_price, long long /*perm_id*/,
                                int /*parent_id*/, double last_fill_price,
                                int /*client_id*/, const std::string& why_held,
                                double /*mkt_cap_price*/) {
  if (!handler_) {
    return;
  }
  OrderStatusRecord record;
  record.order_id = static_cast<domain::OrderId>(order_id);
  record.status = status;
  record.filled = toDouble(filled);
  record.remaining = toDouble(remaining);
  record.average_fill_price = avg_fill_price;
  record.last_fill_price = last_fill_price;
  record.why_held = why_held;
  handler_->onOrderStatus(record);
}

void TwsWireClient::contractDetails(int id, const ContractDetails& details) {
  if (handler_) {
    handler_->onContractDetails(id, toMatch(details.contract,
                                            details.longName));
  }
}

void TwsWireClient::contractDetailsEnd(int id) {
  if (handler_) {
    handler_->onContractDetailsEnd(id);
  }
}

void TwsWireClient::symbolSamples(
    int id, const std::vector<ContractDescription>& descriptions) {
  if (!handler_) {
    return;
  }
  std::vector<domain::ContractMatch> matches;
  matches.reserve(descriptions.size());
  for (const auto& description : descriptions) {
    matches.push_back(toMatch(description.contract, {}));
  }
  handler_->onSymbolSamples(id, matches);
}

}  // namespace wire
}  // namespace twsgate
