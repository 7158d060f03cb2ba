// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for twsgate::EventBus.
//
// Validates:
//   - Generic subscription receives every event type
//   - Typed subscription receives only its type
//   - Multiple subscribers all receive the same event
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A callback may subscribe, unsubscribe or publish without deadlock
//   - Publishing from several threads delivers every event
//   - A subscriber removed mid-publish gets no further delivery
//   - A throwing subscriber is counted and does not stop the others
// =============================================================================

#include "twsgate/eventbus/event_bus.hpp"
#include "twsgate/events/event.hpp"
#include "twsgate/events/event_types.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class EventBusTestFixture : public ::testing::Test {
 protected:
  static twsgate::ConnectionStateEvent stateEvent(
      twsgate::domain::ConnectionState current) {
    twsgate::ConnectionStateEvent e;
    e.current = current;
    e.reason = "test";
    return e;
  }

  static twsgate::GatewayErrorEvent errorEvent(int code) {
    twsgate::GatewayErrorEvent e;
    e.id = 10000;
    e.code = code;
    e.message = "error " + std::to_string(code);
    return e;
  }

  twsgate::EventBus bus;
};

TEST_F(EventBusTestFixture, GenericSubscriberSeesEverything) {
  int count = 0;
  bus.subscribe([&count](const twsgate::Event&) { ++count; });

  bus.publish(stateEvent(twsgate::domain::ConnectionState::Connected));
  bus.publish(errorEvent(162));
  bus.publish(twsgate::OrderUpdateEvent{});
  bus.publish(twsgate::PositionUpdateEvent{});
  EXPECT_EQ(count, 4);
}

TEST_F(EventBusTestFixture, TypedSubscriberFilters) {
  std::vector<int> codes;
  bus.subscribe<twsgate::GatewayErrorEvent>(
      [&codes](const twsgate::GatewayErrorEvent& e) {
        codes.push_back(e.code);
      });

  bus.publish(stateEvent(twsgate::domain::ConnectionState::Connected));
  bus.publish(errorEvent(162));
  bus.publish(errorEvent(200));

  ASSERT_EQ(codes.size(), 2u);
  EXPECT_EQ(codes[0], 162);
  EXPECT_EQ(codes[1], 200);
}

TEST_F(EventBusTestFixture, EverySubscriberReceives) {
  int a = 0;
  int b = 0;
  bus.subscribe<twsgate::ConnectionStateEvent>(
      [&a](const twsgate::ConnectionStateEvent&) { ++a; });
  bus.subscribe<twsgate::ConnectionStateEvent>(
      [&b](const twsgate::ConnectionStateEvent&) { ++b; });

  bus.publish(stateEvent(twsgate::domain::ConnectionState::Error));
  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(bus.subscriberCount(), 2u);
}

TEST_F(EventBusTestFixture, UnsubscribeStopsDelivery) {
  int count = 0;
  const auto id = bus.subscribe([&count](const twsgate::Event&) { ++count; });

  bus.publish(errorEvent(1));
  bus.unsubscribe(id);
  bus.unsubscribe(id);
  bus.unsubscribe(12345);
  bus.publish(errorEvent(2));

  EXPECT_EQ(count, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTestFixture, PublishWithNoSubscribers) {
  EXPECT_NO_THROW(bus.publish(errorEvent(1)));
}

// -----------------------------------------------------------------------------
// Callbacks run without the bus lock held.
// -----------------------------------------------------------------------------
TEST_F(EventBusTestFixture, ReentrantCallbacks) {
  int errors = 0;
  twsgate::EventBus::SubscriptionId self = 0;
  self = bus.subscribe<twsgate::ConnectionStateEvent>(
      [&](const twsgate::ConnectionStateEvent&) {
        bus.publish(errorEvent(504));
        bus.unsubscribe(self);
      });
  bus.subscribe<twsgate::GatewayErrorEvent>(
      [&errors](const twsgate::GatewayErrorEvent&) { ++errors; });

  bus.publish(stateEvent(twsgate::domain::ConnectionState::Error));
  bus.publish(stateEvent(twsgate::domain::ConnectionState::Error));

  EXPECT_EQ(errors, 1);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTestFixture, ConcurrentPublishers) {
  std::atomic<int> count{0};
  bus.subscribe([&count](const twsgate::Event&) { count.fetch_add(1); });

  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;
  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([this] {
      for (int i = 0; i < kPerThread; ++i) {
        bus.publish(errorEvent(i));
      }
    });
  }
  for (auto& t : publishers) {
    t.join();
  }
  EXPECT_EQ(count.load(), kThreads * kPerThread);
}

// -----------------------------------------------------------------------------
// A subscriber unsubscribed by an earlier callback of the same publish is
// skipped, even though publish() had already copied the list.
// -----------------------------------------------------------------------------
TEST_F(EventBusTestFixture, SiblingUnsubscribedMidPublish) {
  int late = 0;
  twsgate::EventBus::SubscriptionId victim = 0;
  bus.subscribe([&](const twsgate::Event&) { bus.unsubscribe(victim); });
  victim = bus.subscribe([&late](const twsgate::Event&) { ++late; });

  bus.publish(errorEvent(1));
  bus.publish(errorEvent(2));
  EXPECT_EQ(late, 0);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTestFixture, ThrowingSubscriberIsIsolated) {
  int delivered = 0;
  bus.subscribe<twsgate::GatewayErrorEvent>(
      [](const twsgate::GatewayErrorEvent&) {
        throw std::runtime_error("telemetry socket closed");
      });
  bus.subscribe([&delivered](const twsgate::Event&) { ++delivered; });

  EXPECT_NO_THROW(bus.publish(errorEvent(162)));
  EXPECT_NO_THROW(
      bus.publish(stateEvent(twsgate::domain::ConnectionState::Connected)));

  EXPECT_EQ(delivered, 2);
  EXPECT_EQ(bus.subscriberFailures(), 1u);
  EXPECT_EQ(bus.publishedCount(), 2u);
}
