// =============================================================================
// gateway_session_test.cpp
// =============================================================================
// Integration tests for twsgate::GatewaySession over MockWireClient.
//
// The mock's responders play the gateway synchronously inside each send,
// so every blocking call below resolves through the real correlation,
// tracking and routing code.
//
// Validates:
//   - Historical bars arrive complete and in order; invalid queries never
//     reach the wire
//   - Every data call fails fast with NotConnected before connect()
//   - placeOrder + status callbacks end in Filled with fill price
//   - cancelOrder refuses unknown and terminal orders
//   - A permission error marks the symbol; the next live snapshot fails
//     without wire traffic; getMarketPrice falls back to delayed data
//   - Snapshots always cancel their stream
//   - Entry times are stable across portfolio refreshes and refined from
//     executions
//   - Account summary and balance extraction
//   - Open orders deduplicated; contract validation
//   - Errors routed by id, fatal codes drive the connection to Error; an
//     order error never reaches a request that shares the order's id
//   - Market data handles do not survive a reconnect
//   - executeCommand PING / STATUS / unknown / malformed
// =============================================================================

#include "twsgate/session/gateway_session.hpp"

#include "twsgate/events/event_types.hpp"
#include "twsgate/time/clock.hpp"
#include "twsgate/time/time_utils.hpp"

#include "mock_wire_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using twsgate::domain::ErrorKind;
using twsgate::domain::OrderStatus;
using twsgate::wire::WireHandler;

class GatewaySessionTestFixture : public ::testing::Test {
 protected:
  GatewaySessionTestFixture() {
    auto mock = std::make_unique<twsgate::test::MockWireClient>();
    wire = mock.get();

    twsgate::SessionConfig config;
    config.account = "DU123";
    config.snapshot_quiet = 50ms;
    session = std::make_unique<twsgate::GatewaySession>(std::move(mock),
                                                        clock, config);
  }

  void connect() {
    ASSERT_TRUE(session->connect("127.0.0.1", 4002, 1, 1s));
    wire->clearCalls();
  }

  static twsgate::domain::OrderRequest limitBuy(const std::string& symbol,
                                                double qty, double price) {
    twsgate::domain::OrderRequest r;
    r.symbol = symbol;
    r.side = twsgate::domain::Side::Buy;
    r.quantity = qty;
    r.type = twsgate::domain::OrderType::Limit;
    r.limit_price = price;
    return r;
  }

  static twsgate::wire::OrderStatusRecord status(twsgate::domain::OrderId id,
                                                 const std::string& s,
                                                 double filled,
                                                 double remaining,
                                                 double avg) {
    twsgate::wire::OrderStatusRecord rec;
    rec.order_id = id;
    rec.status = s;
    rec.filled = filled;
    rec.remaining = remaining;
    rec.average_fill_price = avg;
    return rec;
  }

  static twsgate::wire::PortfolioRecord holding(const std::string& symbol,
                                                double qty) {
    twsgate::wire::PortfolioRecord r;
    r.contract.symbol = symbol;
    r.position = qty;
    r.average_cost = 150.0;
    r.market_price = 155.0;
    r.market_value = qty * 155.0;
    r.account = "DU123";
    return r;
  }

  twsgate::ManualClock clock{twsgate::ms_to_timestamp(1'704'447'000'000)};
  twsgate::test::MockWireClient* wire{nullptr};
  std::unique_ptr<twsgate::GatewaySession> session;
};

// -----------------------------------------------------------------------------
// 1. Historical data
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, HistoricalBarsInOrder) {
  connect();
  wire->on_historical_data = [](WireHandler& h, twsgate::domain::RequestId id) {
    for (int i = 0; i < 10; ++i) {
      twsgate::wire::BarRecord bar;
      bar.time = std::to_string(1704447000 + i * 300);
      bar.open = 100.0 + i;
      bar.high = 101.0 + i;
      bar.low = 99.0 + i;
      bar.close = 100.5 + i;
      bar.volume = 1000;
      h.onHistoricalBar(id, bar);
    }
    h.onHistoricalDataEnd(id);
  };

  twsgate::domain::HistoricalDataQuery query;
  query.symbol = "AAPL";
  query.duration = "1 D";
  query.bar_size = "5 mins";

  const auto result = session->getHistoricalData(query, 2s);
  ASSERT_TRUE(result.ok()) << result.error.message;
  ASSERT_EQ(result.value->size(), 10u);
  for (int i = 0; i < 10; ++i) {
    const auto& bar = (*result.value)[static_cast<std::size_t>(i)];
    EXPECT_DOUBLE_EQ(bar.open, 100.0 + i);
    EXPECT_EQ(bar.timestamp, twsgate::domain::Timestamp{std::chrono::seconds{
                                 1704447000LL + i * 300}});
  }
  EXPECT_EQ(wire->countCalls("reqHistoricalData 10000 AAPL 1 D 5 mins"), 1u);
}

TEST_F(GatewaySessionTestFixture, InvalidHistoricalQueryNeverSent) {
  connect();
  twsgate::domain::HistoricalDataQuery query;
  query.symbol = "AAPL";
  query.bar_size = "7 mins";

  const auto result = session->getHistoricalData(query, 1s);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error.kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(wire->countCalls("reqHistoricalData"), 0u);
}

TEST_F(GatewaySessionTestFixture, HistoricalErrorFailsRequest) {
  connect();
  wire->on_historical_data = [](WireHandler& h, twsgate::domain::RequestId id) {
    h.onError(id, 162, "Historical Market Data Service error message");
  };

  twsgate::domain::HistoricalDataQuery query;
  query.symbol = "AAPL";
  const auto result = session->getHistoricalData(query, 2s);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error.kind, ErrorKind::RequestFailed);
  EXPECT_EQ(result.error.code, 162);
}

TEST_F(GatewaySessionTestFixture, HistoricalTimeout) {
  connect();
  twsgate::domain::HistoricalDataQuery query;
  query.symbol = "AAPL";

  const auto result = session->getHistoricalData(query, 50ms);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error.kind, ErrorKind::Timeout);
}

TEST_F(GatewaySessionTestFixture, BatchKeepsSuccessesOnly) {
  connect();
  wire->on_historical_data = [](WireHandler& h, twsgate::domain::RequestId id) {
    // The second request is refused.
    if (id == 10001) {
      h.onError(id, 200, "No security definition has been found");
      return;
    }
    twsgate::wire::BarRecord bar;
    bar.time = "20240105 09:30:00";
    bar.close = 10.0;
    h.onHistoricalBar(id, bar);
    h.onHistoricalDataEnd(id);
  };

  twsgate::domain::HistoricalDataQuery query;
  const auto out = session->getHistoricalDataBatch({"AAPL", "NOPE", "MSFT"},
                                                   query, 0ms, 1s);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out.count("AAPL"), 1u);
  EXPECT_EQ(out.count("MSFT"), 1u);
  EXPECT_EQ(out.count("NOPE"), 0u);
}

// -----------------------------------------------------------------------------
// 2. NotConnected before connect()
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, CallsFailFastWhenDisconnected) {
  twsgate::domain::HistoricalDataQuery query;
  query.symbol = "AAPL";

  EXPECT_EQ(session->getHistoricalData(query, 1s).error.kind,
            ErrorKind::NotConnected);
  EXPECT_EQ(session->getMarketDataSnapshot("AAPL", 1s).error.kind,
            ErrorKind::NotConnected);
  EXPECT_EQ(session->getPositions(1s).error.kind, ErrorKind::NotConnected);
  EXPECT_EQ(session->getAccountSummary().error.kind, ErrorKind::NotConnected);
  EXPECT_EQ(session->getOpenOrders(1s).error.kind, ErrorKind::NotConnected);
  EXPECT_EQ(session->placeOrder(limitBuy("AAPL", 1, 10)).error.kind,
            ErrorKind::NotConnected);
  EXPECT_FALSE(session->cancelOrder(1));
  EXPECT_TRUE(wire->calls().empty());
}

// -----------------------------------------------------------------------------
// 3. Orders
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, PlaceOrderReachesFilled) {
  connect();
  wire->on_place_order = [](WireHandler& h, twsgate::domain::RequestId id) {
    const auto order_id = static_cast<twsgate::domain::OrderId>(id);
    h.onOrderStatus(status(order_id, "Submitted", 0, 100, 0));
    h.onOrderStatus(status(order_id, "Filled", 100, 0, 101.5));
  };

  std::vector<OrderStatus> seen;
  session->eventBus().subscribe<twsgate::OrderUpdateEvent>(
      [&seen](const twsgate::OrderUpdateEvent& e) {
        seen.push_back(e.order.status);
      });

  const auto id = session->placeOrder(limitBuy("AAPL", 100, 102.0));
  ASSERT_TRUE(id.ok()) << id.error.message;
  EXPECT_EQ(*id.value, 1);

  const auto order = session->order(*id.value);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(order->filled_quantity, 100.0);
  EXPECT_DOUBLE_EQ(order->average_fill_price, 101.5);

  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen.front(), OrderStatus::Pending);
  EXPECT_EQ(seen.back(), OrderStatus::Filled);
  EXPECT_EQ(wire->countCalls("placeOrder 1 AAPL LMT"), 1u);
}

TEST_F(GatewaySessionTestFixture, InvalidOrderRejectedLocally) {
  connect();
  auto request = limitBuy("AAPL", 0, 10.0);
  const auto result = session->placeOrder(request);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error.kind, ErrorKind::InvalidArgument);
  EXPECT_EQ(wire->countCalls("placeOrder"), 0u);
}

TEST_F(GatewaySessionTestFixture, CancelOrderRules) {
  connect();
  EXPECT_FALSE(session->cancelOrder(999));

  const auto open_id = session->placeOrder(limitBuy("AAPL", 10, 100.0));
  ASSERT_TRUE(open_id.ok());
  EXPECT_TRUE(session->cancelOrder(*open_id.value));
  EXPECT_EQ(wire->countCalls("cancelOrder " + std::to_string(*open_id.value)),
            1u);

  wire->on_place_order = [](WireHandler& h, twsgate::domain::RequestId id) {
    h.onOrderStatus(status(static_cast<twsgate::domain::OrderId>(id),
                           "Filled", 5, 0, 99.0));
  };
  const auto filled_id = session->placeOrder(limitBuy("AAPL", 5, 100.0));
  ASSERT_TRUE(filled_id.ok());
  EXPECT_FALSE(session->cancelOrder(*filled_id.value));
}

TEST_F(GatewaySessionTestFixture, OrderRejectionRoutedByOrderId) {
  connect();
  wire->on_place_order = [](WireHandler& h, twsgate::domain::RequestId id) {
    h.onError(id, 201, "Order rejected - reason: no funds");
  };

  const auto id = session->placeOrder(limitBuy("AAPL", 10, 100.0));
  ASSERT_TRUE(id.ok());
  const auto order = session->order(*id.value);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->status, OrderStatus::Rejected);
  EXPECT_NE(order->last_error.find("no funds"), std::string::npos);
}

// Gateway order ids are per account and can reach the request id range.
TEST_F(GatewaySessionTestFixture, OrderErrorSparesRequestWithSameId) {
  wire->setNextValidId(10000);
  connect();
  wire->on_place_order = [](WireHandler& h, twsgate::domain::RequestId id) {
    h.onError(id, 201, "Order rejected - reason: margin");
  };

  using BarsResult = twsgate::domain::Result<std::vector<twsgate::domain::Bar>>;
  std::promise<BarsResult> outcome;
  auto future = outcome.get_future();
  std::thread caller([&] {
    twsgate::domain::HistoricalDataQuery query;
    query.symbol = "AAPL";
    outcome.set_value(session->getHistoricalData(query, 5s));
  });

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (wire->countCalls("reqHistoricalData 10000") == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  ASSERT_EQ(wire->countCalls("reqHistoricalData 10000"), 1u);

  const auto order_id = session->placeOrder(limitBuy("AAPL", 10, 100.0));
  ASSERT_TRUE(order_id.ok());
  ASSERT_EQ(*order_id.value, 10000);
  EXPECT_EQ(session->order(10000)->status, OrderStatus::Rejected);

  twsgate::wire::BarRecord bar;
  bar.time = "1704447000";
  bar.close = 100.5;
  wire->handler()->onHistoricalBar(10000, bar);
  wire->handler()->onHistoricalDataEnd(10000);

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  const auto bars = future.get();
  caller.join();
  ASSERT_TRUE(bars.ok()) << bars.error.message;
  ASSERT_EQ(bars.value->size(), 1u);
  EXPECT_DOUBLE_EQ((*bars.value)[0].close, 100.5);
}

TEST_F(GatewaySessionTestFixture, OpenOrdersDeduplicated) {
  connect();
  wire->on_open_orders = [](WireHandler& h, twsgate::domain::RequestId) {
    twsgate::wire::OpenOrderRecord rec;
    rec.order_id = 77;
    rec.contract.symbol = "MSFT";
    rec.action = "BUY";
    rec.total_quantity = 5;
    rec.order_type = "LMT";
    rec.limit_price = 300.0;
    rec.tif = "DAY";
    rec.status = "Submitted";
    h.onOpenOrder(rec);
    h.onOpenOrder(rec);
    h.onOpenOrdersEnd();
  };

  const auto result = session->getOpenOrders(2s);
  ASSERT_TRUE(result.ok()) << result.error.message;
  ASSERT_EQ(result.value->size(), 1u);
  EXPECT_EQ((*result.value)[0].id, 77);
  EXPECT_EQ((*result.value)[0].status, OrderStatus::Submitted);
  EXPECT_TRUE(session->order(77).has_value());
}

// -----------------------------------------------------------------------------
// 4. Market data
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, SnapshotResolvesAndCancels) {
  connect();
  wire->on_market_data = [](WireHandler& h, twsgate::domain::RequestId id) {
    h.onTickPrice(id, 1, 189.9);
    h.onTickPrice(id, 2, 190.1);
    h.onTickPrice(id, 4, 190.0);
    h.onTickSnapshotEnd(id);
  };

  const auto tick = session->getMarketDataSnapshot("aapl", 2s);
  ASSERT_TRUE(tick.ok()) << tick.error.message;
  EXPECT_EQ(tick.value->symbol, "AAPL");
  EXPECT_DOUBLE_EQ(*tick.value->bestPrice(), 190.0);
  EXPECT_EQ(wire->countCalls("reqMktData 10000 AAPL snapshot"), 1u);
  EXPECT_EQ(wire->countCalls("cancelMktData 10000"), 1u);
}

TEST_F(GatewaySessionTestFixture, PermissionErrorShortCircuitsLiveSnapshots) {
  connect();
  wire->on_market_data = [](WireHandler& h, twsgate::domain::RequestId id) {
    h.onError(id, 354, "Requested market data is not subscribed");
  };

  const auto first = session->getMarketDataSnapshot("AAPL", 2s);
  ASSERT_FALSE(first.ok());
  EXPECT_EQ(first.error.kind, ErrorKind::PermissionDenied);
  EXPECT_TRUE(session->hasMarketDataPermissionError("AAPL"));
  ASSERT_EQ(wire->countCalls("reqMktData"), 1u);

  const auto second = session->getMarketDataSnapshot("AAPL", 2s);
  ASSERT_FALSE(second.ok());
  EXPECT_EQ(second.error.kind, ErrorKind::PermissionDenied);
  EXPECT_EQ(wire->countCalls("reqMktData"), 1u);
}

TEST_F(GatewaySessionTestFixture, MarketPriceFallsBackToDelayed) {
  connect();
  wire->on_market_data = [this](WireHandler& h,
                                twsgate::domain::RequestId id) {
    // Live requests are refused; delayed ones answer with delayed codes.
    if (wire->countCalls("reqMarketDataType 3") == 0) {
      h.onError(id, 10089, "Requested market data requires additional "
                           "subscription");
      return;
    }
    h.onTickPrice(id, 75, 187.5);
    h.onTickSnapshotEnd(id);
  };

  const auto price = session->getMarketPrice("AAPL", 2s);
  ASSERT_TRUE(price.ok()) << price.error.message;
  EXPECT_DOUBLE_EQ(*price.value, 187.5);
  EXPECT_EQ(wire->countCalls("reqMarketDataType 3"), 1u);
  // Live restored after the delayed snapshot.
  EXPECT_EQ(wire->countCalls("reqMarketDataType 1"), 1u);
}

TEST_F(GatewaySessionTestFixture, StreamingSubscription) {
  connect();
  const auto handle = session->subscribeMarketData("MSFT");
  ASSERT_TRUE(handle.ok());
  EXPECT_EQ(wire->countCalls("reqMktData " + std::to_string(handle.value->id) +
                             " MSFT stream"),
            1u);

  auto* handler = wire->handler();
  ASSERT_NE(handler, nullptr);
  handler->onTickPrice(handle.value->id, 4, 410.0);
  const auto latest = session->latestMarketData(*handle.value);
  ASSERT_TRUE(latest.has_value());
  EXPECT_DOUBLE_EQ(*latest->last, 410.0);

  EXPECT_TRUE(session->unsubscribeMarketData(*handle.value));
  EXPECT_FALSE(session->unsubscribeMarketData(*handle.value));
  EXPECT_EQ(wire->countCalls("cancelMktData"), 1u);
}

// Request ids restart after a reconnect; a handle from the old connection
// must not reach the new subscription that reuses its id.
TEST_F(GatewaySessionTestFixture, HandleFromPreviousConnectionIsStale) {
  connect();
  const auto old_handle = session->subscribeMarketData("AAPL");
  ASSERT_TRUE(old_handle.ok());

  ASSERT_TRUE(session->reconnect(1s));
  const auto fresh = session->subscribeMarketData("MSFT");
  ASSERT_TRUE(fresh.ok());
  ASSERT_EQ(fresh.value->id, old_handle.value->id);

  wire->handler()->onTickPrice(fresh.value->id, 4, 410.0);
  EXPECT_FALSE(session->latestMarketData(*old_handle.value).has_value());
  EXPECT_FALSE(session->unsubscribeMarketData(*old_handle.value));

  const auto latest = session->latestMarketData(*fresh.value);
  ASSERT_TRUE(latest.has_value());
  EXPECT_EQ(latest->symbol, "MSFT");
  EXPECT_DOUBLE_EQ(*latest->last, 410.0);
  EXPECT_TRUE(session->unsubscribeMarketData(*fresh.value));
}

// -----------------------------------------------------------------------------
// 5. Positions and account
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, PortfolioEntryTimeStable) {
  connect();
  wire->on_account_updates = [](WireHandler& h, twsgate::domain::RequestId) {
    h.onPortfolioUpdate(holding("AAPL", 10));
    h.onAccountDownloadEnd("DU123");
  };

  const auto first = session->getPortfolioPositions(2s);
  ASSERT_TRUE(first.ok()) << first.error.message;
  ASSERT_EQ(first.value->size(), 1u);
  const auto entered = (*first.value)[0].entry_time;
  ASSERT_TRUE(entered.has_value());

  clock.advance(10min);
  const auto second = session->getPortfolioPositions(2s);
  ASSERT_TRUE(second.ok());
  ASSERT_EQ(second.value->size(), 1u);
  EXPECT_EQ((*second.value)[0].entry_time, entered);

  EXPECT_EQ(wire->countCalls("reqAccountUpdates 1 DU123"), 2u);
  EXPECT_EQ(wire->countCalls("reqAccountUpdates 0 DU123"), 2u);
}

TEST_F(GatewaySessionTestFixture, PositionsSnapshot) {
  connect();
  wire->on_positions = [](WireHandler& h, twsgate::domain::RequestId) {
    twsgate::domain::ContractSpec aapl;
    aapl.symbol = "AAPL";
    h.onPosition("DU123", aapl, 10, 150.0);
    h.onPositionEnd();
  };

  const auto result = session->getPositions(2s);
  ASSERT_TRUE(result.ok()) << result.error.message;
  ASSERT_EQ(result.value->size(), 1u);
  EXPECT_EQ((*result.value)[0].symbol, "AAPL");
  EXPECT_EQ(wire->countCalls("cancelPositions"), 1u);
}

TEST_F(GatewaySessionTestFixture, EntryTimesFromExecutions) {
  connect();
  wire->on_account_updates = [](WireHandler& h, twsgate::domain::RequestId) {
    h.onPortfolioUpdate(holding("AAPL", 10));
    h.onAccountDownloadEnd("DU123");
  };
  wire->on_executions = [](WireHandler& h, twsgate::domain::RequestId id) {
    twsgate::wire::ExecutionRecord rec;
    rec.exec_id = "0001";
    rec.order_id = 3;
    rec.symbol = "AAPL";
    rec.side = "BOT";
    rec.shares = 10;
    rec.price = 150.0;
    rec.time = "20240104 15:45:00";
    h.onExecution(id, rec);
    h.onExecutionsEnd(id);
  };

  const auto result = session->getPositionsWithEntryTimes(2s);
  ASSERT_TRUE(result.ok()) << result.error.message;
  ASSERT_EQ(result.value->size(), 1u);
  EXPECT_EQ((*result.value)[0].entry_time,
            twsgate::parseWireTimestamp("20240104 15:45:00"));
  EXPECT_EQ(wire->countCalls("reqExecutions"), 1u);
}

TEST_F(GatewaySessionTestFixture, ExecutionEntryTimesDoNotReplaceCachedOnes) {
  connect();
  wire->on_account_updates = [](WireHandler& h, twsgate::domain::RequestId) {
    h.onPortfolioUpdate(holding("AAPL", 10));
    h.onAccountDownloadEnd("DU123");
  };
  wire->on_executions = [](WireHandler& h, twsgate::domain::RequestId id) {
    twsgate::wire::ExecutionRecord rec;
    rec.exec_id = "0002";
    rec.symbol = "AAPL";
    rec.side = "BOT";
    rec.shares = 10;
    rec.price = 150.0;
    rec.time = "20240104 15:45:00";
    h.onExecution(id, rec);
    h.onExecutionsEnd(id);
  };

  const auto first = session->getPortfolioPositions(2s);
  ASSERT_TRUE(first.ok()) << first.error.message;
  ASSERT_EQ(first.value->size(), 1u);
  const auto cached = (*first.value)[0].entry_time;

  const auto overlaid = session->getPositionsWithEntryTimes(2s);
  ASSERT_TRUE(overlaid.ok()) << overlaid.error.message;
  EXPECT_EQ((*overlaid.value)[0].entry_time,
            twsgate::parseWireTimestamp("20240104 15:45:00"));

  clock.advance(30s);
  const auto again = session->getPortfolioPositions(2s);
  ASSERT_TRUE(again.ok()) << again.error.message;
  ASSERT_EQ(again.value->size(), 1u);
  EXPECT_EQ((*again.value)[0].entry_time, cached);
}

TEST_F(GatewaySessionTestFixture, AccountSummaryAndBalance) {
  connect();
  wire->on_account_summary = [](WireHandler& h, twsgate::domain::RequestId id) {
    h.onAccountSummary(id, "DU123", "NetLiquidation", "25000.75", "USD");
    h.onAccountSummary(id, "DU123", "TotalCashValue", "1000", "USD");
    h.onAccountSummaryEnd(id);
  };

  const auto summary = session->getAccountSummary();
  ASSERT_TRUE(summary.ok()) << summary.error.message;
  EXPECT_EQ(summary.value->size(), 2u);
  EXPECT_EQ(wire->countCalls("cancelAccountSummary"), 1u);

  const auto balance = session->getAccountBalance(2s);
  ASSERT_TRUE(balance.ok()) << balance.error.message;
  EXPECT_DOUBLE_EQ(balance.value->value, 25000.75);
  EXPECT_EQ(balance.value->strategy, "NetLiquidation");
}

// -----------------------------------------------------------------------------
// 6. Contracts
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, ValidateSymbols) {
  connect();
  // Only AAPL exists; anything else is unknown to the gateway.
  wire->on_contract_details = [this](WireHandler& h,
                                     twsgate::domain::RequestId id) {
    const auto calls = wire->calls();
    const bool aapl = calls.back().find(" AAPL ") != std::string::npos;
    if (!aapl) {
      h.onError(id, 200, "No security definition has been found");
      return;
    }
    twsgate::domain::ContractMatch match;
    match.con_id = 265598;
    match.symbol = "AAPL";
    match.sec_type = "STK";
    h.onContractDetails(id, match);
    h.onContractDetailsEnd(id);
  };

  const auto out = session->validateSymbols({"AAPL", "ZZZZQ"}, 1s);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_TRUE(out.at("AAPL"));
  EXPECT_FALSE(out.at("ZZZZQ"));
}

TEST_F(GatewaySessionTestFixture, SymbolSearch) {
  connect();
  wire->on_matching_symbols = [](WireHandler& h,
                                 twsgate::domain::RequestId id) {
    twsgate::domain::ContractMatch a;
    a.symbol = "AAPL";
    twsgate::domain::ContractMatch b;
    b.symbol = "AAPL.OLD";
    h.onSymbolSamples(id, {a, b});
  };

  EXPECT_EQ(session->searchSymbols("   ", 1s).error.kind,
            ErrorKind::InvalidArgument);
  const auto result = session->searchSymbols("aap", 1s);
  ASSERT_TRUE(result.ok()) << result.error.message;
  EXPECT_EQ(result.value->size(), 2u);
}

// -----------------------------------------------------------------------------
// 7. Connection-level errors
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, FatalErrorFailsPendingRequest) {
  connect();
  std::vector<twsgate::domain::ConnectionState> states;
  session->eventBus().subscribe<twsgate::ConnectionStateEvent>(
      [&states](const twsgate::ConnectionStateEvent& e) {
        states.push_back(e.current);
      });

  std::promise<ErrorKind> outcome;
  auto future = outcome.get_future();
  std::thread caller([&] {
    twsgate::domain::HistoricalDataQuery query;
    query.symbol = "AAPL";
    outcome.set_value(session->getHistoricalData(query, 5s).error.kind);
  });

  // Wait until the request is on the wire, then drop the connection.
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (wire->countCalls("reqHistoricalData") == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  wire->handler()->onError(-1, 1100, "Connectivity between IB and TWS lost");

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(future.get(), ErrorKind::ConnectionLost);
  caller.join();

  EXPECT_EQ(session->connectionState(), twsgate::domain::ConnectionState::Error);
  ASSERT_FALSE(states.empty());
  EXPECT_EQ(states.back(), twsgate::domain::ConnectionState::Error);
}

TEST_F(GatewaySessionTestFixture, InformationalErrorsAreNotPublished) {
  connect();
  int published = 0;
  session->eventBus().subscribe<twsgate::GatewayErrorEvent>(
      [&published](const twsgate::GatewayErrorEvent&) { ++published; });

  wire->handler()->onError(-1, 2104, "Market data farm connection is OK");
  EXPECT_EQ(published, 0);
  wire->handler()->onError(424242, 12345, "something odd");
  EXPECT_EQ(published, 1);
  EXPECT_TRUE(session->isConnected());
}

// -----------------------------------------------------------------------------
// 8. executeCommand
// -----------------------------------------------------------------------------
TEST_F(GatewaySessionTestFixture, ExecuteCommand) {
  const auto ping = nlohmann::json::parse(session->executeCommand("ping"));
  EXPECT_TRUE(ping.at("ok").get<bool>());
  EXPECT_EQ(ping.at("reply").get<std::string>(), "PONG");

  connect();
  const auto status =
      nlohmann::json::parse(session->executeCommand(R"({"cmd":"status"})"));
  EXPECT_TRUE(status.at("ok").get<bool>());
  EXPECT_EQ(status.at("state").get<std::string>(), "Connected");
  EXPECT_TRUE(status.at("connected").get<bool>());
  EXPECT_EQ(status.at("orders").get<int>(), 0);
  // connect() published at least the Connected transition.
  EXPECT_GE(status.at("events_published").get<std::uint64_t>(), 1u);

  const auto unknown = nlohmann::json::parse(session->executeCommand("FLY"));
  EXPECT_FALSE(unknown.at("ok").get<bool>());

  const auto malformed =
      nlohmann::json::parse(session->executeCommand("{not json"));
  EXPECT_FALSE(malformed.at("ok").get<bool>());
}
