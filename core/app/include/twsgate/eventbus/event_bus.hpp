#pragma once

#include "twsgate/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace twsgate {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Fan-out of session events to collaborators (IPC telemetry, the rule
// engine, loggers) without those collaborators reaching into the trackers.
//
// Thread model:
//   subscribe/unsubscribe/publish are safe from any thread. Callbacks run
//   synchronously on the publishing thread, which for most events is the
//   gateway I/O thread: subscribers must return quickly and must not call
//   blocking GatewaySession methods. Hand work to a queue instead.
//
//   publish() copies the subscriber list under the lock and invokes
//   callbacks without it, so a callback may subscribe or unsubscribe.
//
// Unsubscribe:
//   Once unsubscribe(id) returns, no publish() starts a new delivery to
//   that subscriber, including a publish() that had already copied the
//   list. A delivery running on another thread at that moment still
//   completes.
//
// Failures:
//   A subscriber that throws std::exception is logged and counted; the
//   remaining subscribers still receive the event and the exception never
//   reaches the publisher (the I/O thread must keep reading).
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  // Invoked only when the published variant holds EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;
  std::uint64_t publishedCount() const { return published_.load(); }
  std::uint64_t subscriberFailures() const { return failures_.load(); }

 private:
  struct Subscriber {
    Subscriber(SubscriptionId i, GenericCallback cb)
        : id(i), callback(std::move(cb)) {}

    const SubscriptionId id;
    const GenericCallback callback;
    std::atomic<bool> active{true};
  };

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<std::shared_ptr<Subscriber>> subscribers_;

  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> failures_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(
      GenericCallback([cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace twsgate
