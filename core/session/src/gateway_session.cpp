#include "twsgate/session/gateway_session.hpp"

#include "twsgate/errors/error_classifier.hpp"
#include "twsgate/events/event_types.hpp"
#include "twsgate/network/json_format.hpp"
#include "twsgate/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <thread>
#include <utility>

namespace twsgate {

using domain::ErrorKind;
using domain::Result;

namespace {

constexpr auto kExecutionLookback = std::chrono::hours(24 * 7);

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

bool fitsRequestId(std::int64_t id) {
  return id >= 0 && id <= std::numeric_limits<domain::RequestId>::max();
}

nlohmann::json errorReply(const std::string& message) {
  return nlohmann::json{{"ok", false}, {"error", message}};
}

nlohmann::json errorReply(const domain::SessionError& error) {
  return nlohmann::json{{"ok", false},
                        {"error", error.message},
                        {"kind", domain::toString(error.kind)},
                        {"code", error.code}};
}

}  // namespace

GatewaySession::GatewaySession(std::unique_ptr<wire::WireClient> wire,
                               const Clock& clock, SessionConfig config)
    : config_(std::move(config)),
      clock_(clock),
      wire_(std::move(wire)),
      connection_(*wire_, config_.request_id_base),
      registry_(connection_.requestIds()),
      orders_(bus_, clock_),
      positions_(bus_, clock_),
      market_data_(clock_) {
  ConnectionManager::Hooks hooks;
  hooks.before_teardown = [this] {
    for (const auto id : market_data_.activeIds()) {
      wire_->cancelMarketData(id);
    }
  };
  hooks.fail_waiters = [this](const domain::SessionError& error) {
    const auto requests = registry_.failAll(error);
    const auto snapshots = market_data_.failAll(error);
    market_data_.clear();
    if (requests + snapshots > 0) {
      std::cerr << "[GatewaySession] WARNING: failed " << requests
                << " pending requests and " << snapshots
                << " market data waiters (" << error.message << ").\n";
    }
  };
  hooks.state_changed = [this](domain::ConnectionState previous,
                               domain::ConnectionState current,
                               const std::string& reason) {
    bus_.publish(
        ConnectionStateEvent{previous, current, reason, clock_.now()});
  };
  connection_.setHooks(std::move(hooks));

  wire_->attach(this);
}

GatewaySession::~GatewaySession() {
  connection_.stopSupervisor();
  connection_.disconnect();
  wire_->attach(nullptr);
}

template <typename T>
Result<T> GatewaySession::notConnected(const char* operation) {
  return Result<T>::failure(ErrorKind::NotConnected,
                            std::string(operation) + ": not connected");
}

// =============================================================================
// Connection
// =============================================================================

bool GatewaySession::connect(const std::string& host, int port, int client_id,
                             std::chrono::milliseconds timeout) {
  return connection_.connect(ConnectionManager::Endpoint{host, port, client_id},
                             timeout);
}

bool GatewaySession::connect(std::chrono::milliseconds timeout) {
  return connect(config_.host, config_.port, config_.client_id, timeout);
}

bool GatewaySession::connect() { return connect(config_.connect_timeout); }

void GatewaySession::disconnect() { connection_.disconnect(); }

bool GatewaySession::reconnect(std::chrono::milliseconds timeout) {
  return connection_.reconnect(timeout);
}

bool GatewaySession::isConnected() const { return connection_.isConnected(); }

domain::ConnectionState GatewaySession::connectionState() const {
  return connection_.state();
}

void GatewaySession::startSupervisor() {
  connection_.startSupervisor(config_.supervisor_interval,
                              config_.connect_timeout);
}

void GatewaySession::stopSupervisor() { connection_.stopSupervisor(); }

// -----------------------------------------------------------------------------
// executeCommand(): IPC REP handler
// -----------------------------------------------------------------------------
std::string GatewaySession::executeCommand(const std::string& command) {
  std::string verb = trim(command);

  try {
    if (!verb.empty() && verb.front() == '{') {
      const auto request = nlohmann::json::parse(verb);
      verb = request.at("cmd").get<std::string>();
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[GatewaySession] WARNING: bad command payload: " << e.what()
              << "\n";
    return errorReply(std::string("bad command: ") + e.what()).dump();
  }
  verb = upper(trim(verb));

  nlohmann::json reply;
  if (verb == "PING") {
    reply = {{"ok", true}, {"reply", "PONG"}};
  } else if (verb == "STATUS") {
    reply = {{"ok", true},
             {"state", domain::toString(connectionState())},
             {"connected", isConnected()},
             {"orders", orders_.snapshot().size()},
             {"open_orders", orders_.openOrders().size()},
             {"market_data_streams", market_data_.size()},
             {"pending_requests", registry_.size()},
             {"reconnects", connection_.reconnectCount()},
             {"events_published", bus_.publishedCount()}};
  } else if (verb == "ORDERS") {
    auto rows = nlohmann::json::array();
    for (const auto& o : orders()) {
      rows.push_back(toJson(o));
    }
    reply = {{"ok", true}, {"orders", rows}};
  } else if (verb == "POSITIONS") {
    const auto result = getPortfolioPositions(config_.request_timeout);
    if (!result) {
      return errorReply(result.error).dump();
    }
    auto rows = nlohmann::json::array();
    for (const auto& p : *result.value) {
      rows.push_back(toJson(p));
    }
    reply = {{"ok", true}, {"positions", rows}};
  } else if (verb == "ACCOUNT") {
    const auto result =
        getAccountSummary(kDefaultAccountSummaryTags, config_.request_timeout);
    if (!result) {
      return errorReply(result.error).dump();
    }
    reply = {{"ok", true}, {"account", toJson(*result.value)}};
  } else if (verb == "RECONNECT") {
    const bool ok = reconnect(config_.connect_timeout);
    reply = {{"ok", ok}, {"state", domain::toString(connectionState())}};
  } else {
    return errorReply("unknown command '" + verb + "'").dump();
  }
  return reply.dump();
}

// =============================================================================
// Historical data
// =============================================================================

Result<std::vector<domain::Bar>> GatewaySession::getHistoricalData(
    const domain::HistoricalDataQuery& query,
    std::chrono::milliseconds timeout) {
  using R = Result<std::vector<domain::Bar>>;

  if (query.symbol.empty()) {
    return R::failure(ErrorKind::InvalidArgument, "symbol is empty");
  }
  if (!domain::isValidDuration(query.duration)) {
    return R::failure(ErrorKind::InvalidArgument,
                      "invalid duration '" + query.duration + "'");
  }
  if (!domain::isValidBarSize(query.bar_size)) {
    return R::failure(ErrorKind::InvalidArgument,
                      "invalid bar size '" + query.bar_size + "'");
  }
  if (!domain::isValidWhatToShow(query.what_to_show)) {
    return R::failure(ErrorKind::InvalidArgument,
                      "invalid whatToShow '" + query.what_to_show + "'");
  }
  if (!isConnected()) {
    return notConnected<std::vector<domain::Bar>>("getHistoricalData");
  }

  const auto id = registry_.issue(RequestKind::HistoricalData);
  wire_->requestHistoricalData(id, domain::makeContract(query.symbol), query);

  auto result = registry_.awaitAs<domain::Bar>(id, timeout);
  if (!result) {
    std::cerr << "[GatewaySession] WARNING: historical data for "
              << query.symbol << " failed: " << result.error.message << "\n";
  }
  return result;
}

std::map<std::string, std::vector<domain::Bar>>
GatewaySession::getHistoricalDataBatch(const std::vector<std::string>& symbols,
                                       const domain::HistoricalDataQuery& query,
                                       std::chrono::milliseconds pacing,
                                       std::chrono::milliseconds timeout) {
  std::map<std::string, std::vector<domain::Bar>> out;

  for (std::size_t i = 0; i < symbols.size(); ++i) {
    if (i > 0 && pacing.count() > 0) {
      std::this_thread::sleep_for(pacing);
    }
    auto per_symbol = query;
    per_symbol.symbol = symbols[i];
    auto result = getHistoricalData(per_symbol, timeout);
    if (result) {
      out.emplace(symbols[i], std::move(*result.value));
    }
  }

  std::cout << "[GatewaySession] historical batch: " << out.size() << "/"
            << symbols.size() << " symbols fetched.\n";
  return out;
}

// =============================================================================
// Market data
// =============================================================================

Result<domain::MarketDataTick> GatewaySession::getMarketDataSnapshot(
    const std::string& symbol, std::chrono::milliseconds timeout,
    domain::MarketDataType type) {
  using R = Result<domain::MarketDataTick>;

  if (symbol.empty()) {
    return R::failure(ErrorKind::InvalidArgument, "symbol is empty");
  }
  const auto contract = domain::makeContract(symbol);

  if (type == domain::MarketDataType::Live &&
      market_data_.hasPermissionError(contract.symbol)) {
    return R::failure(ErrorKind::PermissionDenied,
                      "no live market data permission for " + contract.symbol +
                          "; retry with delayed data");
  }
  if (!isConnected()) {
    return notConnected<domain::MarketDataTick>("getMarketDataSnapshot");
  }

  const bool switch_type = type != domain::MarketDataType::Live;
  if (switch_type) {
    wire_->requestMarketDataType(type);
  }

  const auto id = connection_.requestIds().next();
  const auto handle = market_data_.open(id, contract.symbol, type);
  wire_->requestMarketData(id, contract, true);

  auto result = market_data_.waitSnapshot(id, timeout, config_.snapshot_quiet);

  // A teardown during the wait already cancelled and cleared the entry, and
  // a reconnect may have handed this id to someone else.
  if (market_data_.close(handle) && isConnected()) {
    wire_->cancelMarketData(id);
  }
  if (switch_type && isConnected()) {
    wire_->requestMarketDataType(domain::MarketDataType::Live);
  }
  return result;
}

Result<domain::MarketDataHandle> GatewaySession::subscribeMarketData(
    const std::string& symbol, domain::MarketDataType type) {
  using R = Result<domain::MarketDataHandle>;

  if (symbol.empty()) {
    return R::failure(ErrorKind::InvalidArgument, "symbol is empty");
  }
  if (!isConnected()) {
    return notConnected<domain::MarketDataHandle>("subscribeMarketData");
  }

  const auto contract = domain::makeContract(symbol);
  if (type != domain::MarketDataType::Live) {
    wire_->requestMarketDataType(type);
  }

  const auto id = connection_.requestIds().next();
  auto handle = market_data_.open(id, contract.symbol, type);
  wire_->requestMarketData(id, contract, false);

  std::cout << "[GatewaySession] subscribed " << contract.symbol
            << " id=" << id << "\n";
  return R::success(std::move(handle));
}

Result<std::variant<domain::MarketDataTick, domain::MarketDataHandle>>
GatewaySession::subscribeMarketData(const std::string& symbol, bool snapshot,
                                    std::chrono::milliseconds timeout) {
  using Value = std::variant<domain::MarketDataTick, domain::MarketDataHandle>;
  using R = Result<Value>;

  if (snapshot) {
    auto tick = getMarketDataSnapshot(symbol, timeout);
    if (!tick) {
      return R::failure(tick.error);
    }
    return R::success(Value{std::move(*tick.value)});
  }

  auto handle = subscribeMarketData(symbol);
  if (!handle) {
    return R::failure(handle.error);
  }
  return R::success(Value{std::move(*handle.value)});
}

std::optional<domain::MarketDataTick> GatewaySession::latestMarketData(
    const domain::MarketDataHandle& handle) const {
  return market_data_.latest(handle);
}

bool GatewaySession::unsubscribeMarketData(
    const domain::MarketDataHandle& handle) {
  if (!market_data_.close(handle)) {
    return false;
  }
  if (isConnected()) {
    wire_->cancelMarketData(handle.id);
  }
  return true;
}

Result<double> GatewaySession::getMarketPrice(
    const std::string& symbol, std::chrono::milliseconds timeout) {
  auto tick = getMarketDataSnapshot(symbol, timeout);
  if (!tick && tick.error.kind == ErrorKind::PermissionDenied) {
    std::cout << "[GatewaySession] " << symbol
              << ": no live permission, falling back to delayed data.\n";
    tick = getMarketDataSnapshot(symbol, timeout,
                                 domain::MarketDataType::Delayed);
  }
  if (!tick) {
    return Result<double>::failure(tick.error);
  }

  if (const auto price = tick.value->bestPrice()) {
    return Result<double>::success(*price);
  }
  return Result<double>::failure(ErrorKind::RequestFailed,
                                 "no positive price for " + symbol);
}

bool GatewaySession::hasMarketDataPermissionError(
    const std::string& symbol) const {
  return market_data_.hasPermissionError(domain::makeContract(symbol).symbol);
}

// =============================================================================
// Positions and account
// =============================================================================

Result<std::vector<domain::Position>> GatewaySession::getPositions(
    std::chrono::milliseconds timeout) {
  using R = Result<std::vector<domain::Position>>;
  std::lock_guard stream_lock(positions_stream_mutex_);

  if (!isConnected()) {
    return notConnected<std::vector<domain::Position>>("getPositions");
  }

  positions_.beginPositionSnapshot();
  const auto id = registry_.issue(RequestKind::Positions);
  wire_->requestPositions();
  const auto done = registry_.await(id, timeout);
  wire_->cancelPositions();

  if (!done) {
    return R::failure(done.error);
  }
  return R::success(positions_.positionSnapshot());
}

Result<std::vector<domain::Position>> GatewaySession::getPortfolioPositions(
    std::chrono::milliseconds timeout) {
  using R = Result<std::vector<domain::Position>>;
  std::lock_guard stream_lock(portfolio_stream_mutex_);

  if (!isConnected()) {
    return notConnected<std::vector<domain::Position>>(
        "getPortfolioPositions");
  }

  const auto id = registry_.issue(RequestKind::Portfolio);
  wire_->requestAccountUpdates(true, config_.account);
  const auto done = registry_.await(id, timeout);
  wire_->requestAccountUpdates(false, config_.account);

  if (!done) {
    return R::failure(done.error);
  }
  return R::success(positions_.portfolio());
}

Result<std::vector<domain::Position>>
GatewaySession::getPositionsWithEntryTimes(std::chrono::milliseconds timeout) {
  using R = Result<std::vector<domain::Position>>;

  auto portfolio = getPortfolioPositions(timeout);
  if (!portfolio || portfolio.value->empty()) {
    return portfolio;
  }

  auto executions = getExecutions(clock_.now() - kExecutionLookback, timeout);
  if (executions && executions.value->empty()) {
    executions = getExecutions(std::nullopt, timeout);
  }
  if (!executions) {
    std::cerr << "[GatewaySession] WARNING: executions unavailable ("
              << executions.error.message
              << "). Keeping synthesized entry times.\n";
    return portfolio;
  }

  return R::success(positions_.withExecutionEntryTimes(*executions.value));
}

Result<domain::AccountValues> GatewaySession::getAccountSummary(
    const std::string& tags, std::chrono::milliseconds timeout) {
  using R = Result<domain::AccountValues>;

  if (!isConnected()) {
    return notConnected<domain::AccountValues>("getAccountSummary");
  }

  const auto id = registry_.issue(RequestKind::AccountSummary);
  wire_->requestAccountSummary(id, "All", tags);
  auto rows = registry_.awaitAs<domain::AccountValue>(id, timeout);
  wire_->cancelAccountSummary(id);

  if (!rows) {
    return R::failure(rows.error);
  }
  return R::success(accounts_.replaceSummary(*rows.value));
}

Result<BalanceReading> GatewaySession::getAccountBalance(
    std::chrono::milliseconds timeout) {
  std::string tags;
  for (const auto& tag : balanceStrategies()) {
    tags += tags.empty() ? tag : "," + tag;
  }

  auto summary = getAccountSummary(tags, timeout);
  if (!summary) {
    return Result<BalanceReading>::failure(summary.error);
  }

  if (auto reading = extractBalance(*summary.value)) {
    return Result<BalanceReading>::success(std::move(*reading));
  }
  return Result<BalanceReading>::failure(
      ErrorKind::RequestFailed, "account summary holds no positive balance");
}

Result<std::vector<domain::Execution>> GatewaySession::getExecutions(
    std::optional<domain::Timestamp> since,
    std::chrono::milliseconds timeout) {
  if (!isConnected()) {
    return notConnected<std::vector<domain::Execution>>("getExecutions");
  }

  domain::ExecutionFilter filter;
  filter.since = since;
  filter.account = config_.account;

  const auto id = registry_.issue(RequestKind::Executions);
  wire_->requestExecutions(id, filter);
  return registry_.awaitAs<domain::Execution>(id, timeout);
}

// =============================================================================
// Orders
// =============================================================================

Result<std::vector<domain::Order>> GatewaySession::getOpenOrders(
    std::chrono::milliseconds timeout) {
  using R = Result<std::vector<domain::Order>>;
  std::lock_guard stream_lock(open_orders_stream_mutex_);

  if (!isConnected()) {
    return notConnected<std::vector<domain::Order>>("getOpenOrders");
  }

  const auto id = registry_.issue(RequestKind::OpenOrders);
  wire_->requestOpenOrders();
  auto reported = registry_.awaitAs<domain::Order>(id, timeout);
  if (!reported) {
    return R::failure(reported.error);
  }

  // The gateway may report one order several times; return each once, as
  // the tracker now holds it.
  std::map<domain::OrderId, domain::Order> merged;
  for (auto& o : *reported.value) {
    const auto current = orders_.find(o.id);
    merged[o.id] = current ? *current : std::move(o);
  }

  std::vector<domain::Order> out;
  out.reserve(merged.size());
  for (auto& [order_id, o] : merged) {
    out.push_back(std::move(o));
  }
  return R::success(std::move(out));
}

Result<domain::OrderId> GatewaySession::placeOrder(
    const domain::OrderRequest& request) {
  using R = Result<domain::OrderId>;

  const std::string reason = domain::validateOrderRequest(request);
  if (!reason.empty()) {
    return R::failure(ErrorKind::InvalidArgument, reason);
  }

  const auto id = connection_.nextOrderId();
  if (!id) {
    return notConnected<domain::OrderId>("placeOrder");
  }

  orders_.track(*id, request);
  wire_->placeOrder(*id, domain::makeContract(request.symbol), request);

  std::cout << "[GatewaySession] placed order " << *id << " "
            << domain::toWire(request.side) << " " << request.quantity << " "
            << request.symbol << " " << domain::toWire(request.type) << "\n";
  return R::success(*id);
}

bool GatewaySession::cancelOrder(domain::OrderId id) {
  if (!isConnected()) {
    std::cerr << "[GatewaySession] WARNING: cancelOrder(" << id
              << ") while not connected.\n";
    return false;
  }

  const auto current = orders_.find(id);
  if (!current) {
    std::cerr << "[GatewaySession] WARNING: cancelOrder(" << id
              << ") unknown order.\n";
    return false;
  }
  if (domain::isTerminal(current->status)) {
    std::cerr << "[GatewaySession] WARNING: cancelOrder(" << id
              << ") order already " << domain::toString(current->status)
              << ".\n";
    return false;
  }

  wire_->cancelOrder(id);
  return true;
}

std::optional<domain::Order> GatewaySession::order(domain::OrderId id) const {
  return orders_.find(id);
}

std::vector<domain::Order> GatewaySession::orders() const {
  return orders_.snapshot();
}

// =============================================================================
// Contracts
// =============================================================================

Result<std::vector<domain::ContractMatch>> GatewaySession::searchContracts(
    const std::string& pattern, const std::string& sec_type,
    std::chrono::milliseconds timeout) {
  using R = Result<std::vector<domain::ContractMatch>>;

  if (trim(pattern).empty()) {
    return R::failure(ErrorKind::InvalidArgument, "search pattern is empty");
  }
  if (!isConnected()) {
    return notConnected<std::vector<domain::ContractMatch>>("searchContracts");
  }

  const auto id = registry_.issue(RequestKind::ContractSearch);
  wire_->requestContractDetails(id,
                                domain::makeContract(trim(pattern), sec_type));
  return registry_.awaitAs<domain::ContractMatch>(id, timeout);
}

Result<std::vector<domain::ContractMatch>> GatewaySession::searchSymbols(
    const std::string& pattern, std::chrono::milliseconds timeout) {
  using R = Result<std::vector<domain::ContractMatch>>;

  if (trim(pattern).empty()) {
    return R::failure(ErrorKind::InvalidArgument, "search pattern is empty");
  }
  if (!isConnected()) {
    return notConnected<std::vector<domain::ContractMatch>>("searchSymbols");
  }

  const auto id = registry_.issue(RequestKind::SymbolSearch);
  wire_->requestMatchingSymbols(id, trim(pattern));
  return registry_.awaitAs<domain::ContractMatch>(id, timeout);
}

std::map<std::string, bool> GatewaySession::validateSymbols(
    const std::vector<std::string>& symbols,
    std::chrono::milliseconds timeout) {
  std::map<std::string, bool> out;

  for (const auto& symbol : symbols) {
    const auto wanted = domain::makeContract(symbol).symbol;
    // Empty secType: makeContract picks IND for index symbols.
    const auto matches = searchContracts(symbol, "", timeout);

    bool valid = false;
    if (matches) {
      valid = std::any_of(matches.value->begin(), matches.value->end(),
                          [&wanted](const domain::ContractMatch& m) {
                            return upper(m.symbol) == wanted;
                          });
    }
    out[symbol] = valid;
  }
  return out;
}

// =============================================================================
// wire::WireHandler: I/O thread
// =============================================================================

void GatewaySession::onNextValidId(domain::OrderId order_id) {
  connection_.onHandshake(order_id);
}

void GatewaySession::onConnectionClosed() {
  connection_.onConnectionClosed();
}

void GatewaySession::onManagedAccounts(const std::string& accounts) {
  accounts_.onManagedAccounts(accounts);
  std::cout << "[GatewaySession] managed accounts: " << accounts << "\n";
}

// -----------------------------------------------------------------------------
// onError(): classify, then route
// -----------------------------------------------------------------------------
void GatewaySession::onError(std::int64_t id, int code,
                             const std::string& message) {
  const ErrorClass classification = ErrorClassifier::classify(code);

  if (ErrorClassifier::isMarketDataPermission(code) && fitsRequestId(id)) {
    if (const auto symbol =
            market_data_.symbolFor(static_cast<domain::RequestId>(id))) {
      market_data_.markPermissionDenied(*symbol);
    }
  }

  if (classification == ErrorClass::Informational) {
    std::cout << "[GatewaySession] gateway " << code << " (id=" << id
              << "): " << message << "\n";
    return;
  }

  bus_.publish(
      GatewayErrorEvent{id, code, message, classification, clock_.now()});

  if (classification == ErrorClass::ConnectionFatal) {
    connection_.onFatalError(code, message);
    return;
  }

  if (id == domain::kNoId) {
    std::cerr << "[GatewaySession] WARNING: gateway error " << code << ": "
              << message << "\n";
    return;
  }

  // Order ids can collide with request ids; an order-scoped code for a
  // working order belongs to that order.
  if (ErrorClassifier::isOrderScoped(code) && orders_.isWorking(id)) {
    orders_.onOrderError(id, code, message);
    return;
  }

  const auto error = ErrorClassifier::toSessionError(code, message);
  if (fitsRequestId(id)) {
    const auto request_id = static_cast<domain::RequestId>(id);
    if (registry_.fail(request_id, error)) {
      return;
    }
    if (market_data_.fail(request_id, error)) {
      return;
    }
  }
  if (orders_.onOrderError(id, code, message)) {
    return;
  }

  std::cerr << "[GatewaySession] WARNING: gateway error " << code
            << " for unmatched id " << id << ": " << message << "\n";
}

void GatewaySession::onHistoricalBar(domain::RequestId id,
                                     const wire::BarRecord& record) {
  domain::Bar bar;
  bar.open = record.open;
  bar.high = record.high;
  bar.low = record.low;
  bar.close = record.close;
  bar.volume = record.volume;
  bar.wap = record.wap;
  bar.bar_count = record.count;
  bar.wire_time = record.time;

  if (const auto ts = parseWireTimestamp(record.time)) {
    bar.timestamp = *ts;
  } else {
    std::cerr << "[GatewaySession] WARNING: unparsed bar time '"
              << record.time << "' (id=" << id << ")\n";
  }

  registry_.completeStreaming(id, std::move(bar));
}

void GatewaySession::onHistoricalDataEnd(domain::RequestId id) {
  registry_.complete(id);
}

void GatewaySession::onTickPrice(domain::RequestId id, int tick_type,
                                 double price) {
  market_data_.onTickPrice(id, tick_type, price);
}

void GatewaySession::onTickSize(domain::RequestId id, int tick_type,
                                double size) {
  market_data_.onTickSize(id, tick_type, size);
}

void GatewaySession::onTickString(domain::RequestId id, int tick_type,
                                  const std::string& value) {
  market_data_.onTickString(id, tick_type, value);
}

void GatewaySession::onTickSnapshotEnd(domain::RequestId id) {
  market_data_.onSnapshotEnd(id);
}

void GatewaySession::onMarketDataType(domain::RequestId id, int data_type) {
  market_data_.onMarketDataType(id, data_type);
}

void GatewaySession::onPosition(const std::string& account,
                                const domain::ContractSpec& contract,
                                double quantity, double average_cost) {
  positions_.onPosition(account, contract, quantity, average_cost);
}

void GatewaySession::onPositionEnd() { completeLatest(RequestKind::Positions); }

void GatewaySession::onPortfolioUpdate(const wire::PortfolioRecord& record) {
  positions_.onPortfolioUpdate(record);
}

void GatewaySession::onAccountValue(const std::string& key,
                                    const std::string& value,
                                    const std::string& currency,
                                    const std::string& account) {
  accounts_.onAccountValue(key, value, currency, account);
}

void GatewaySession::onAccountDownloadEnd(const std::string& /*account*/) {
  completeLatest(RequestKind::Portfolio);
}

void GatewaySession::onAccountSummary(domain::RequestId id,
                                      const std::string& account,
                                      const std::string& tag,
                                      const std::string& value,
                                      const std::string& currency) {
  registry_.completeStreaming(
      id, domain::AccountValue{account, tag, value, currency});
}

void GatewaySession::onAccountSummaryEnd(domain::RequestId id) {
  registry_.complete(id);
}

void GatewaySession::onExecution(domain::RequestId id,
                                 const wire::ExecutionRecord& record) {
  domain::Execution execution;
  execution.exec_id = record.exec_id;
  execution.order_id = record.order_id;
  execution.account = record.account;
  execution.symbol = record.symbol;
  execution.side =
      domain::sideFromWire(record.side).value_or(domain::Side::Buy);
  execution.shares = record.shares;
  execution.price = record.price;
  execution.time = parseWireTimestamp(record.time);
  execution.wire_time = record.time;

  registry_.completeStreaming(id, std::move(execution));
}

void GatewaySession::onExecutionsEnd(domain::RequestId id) {
  registry_.complete(id);
}

void GatewaySession::onOpenOrder(const wire::OpenOrderRecord& record) {
  domain::Order merged = orders_.onOpenOrder(record);
  if (const auto id = registry_.latestOf(RequestKind::OpenOrders)) {
    registry_.completeStreaming(*id, std::move(merged));
  }
}

void GatewaySession::onOpenOrdersEnd() {
  completeLatest(RequestKind::OpenOrders);
}

void GatewaySession::onOrderStatus(const wire::OrderStatusRecord& record) {
  orders_.onOrderStatus(record);
}

void GatewaySession::onContractDetails(domain::RequestId id,
                                       const domain::ContractMatch& match) {
  registry_.completeStreaming(id, match);
}

void GatewaySession::onContractDetailsEnd(domain::RequestId id) {
  registry_.complete(id);
}

void GatewaySession::onSymbolSamples(
    domain::RequestId id, const std::vector<domain::ContractMatch>& matches) {
  for (const auto& match : matches) {
    registry_.completeStreaming(id, match);
  }
  registry_.complete(id);
}

void GatewaySession::completeLatest(RequestKind kind) {
  if (const auto id = registry_.latestOf(kind)) {
    registry_.complete(*id);
  }
}

}  // namespace twsgate
