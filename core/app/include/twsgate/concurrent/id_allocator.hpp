#pragma once

#include "twsgate/domain/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>

namespace twsgate {

// -----------------------------------------------------------------------------
// RequestIdAllocator
// -----------------------------------------------------------------------------
// @brief  Caller-side correlation ids. Monotonic from a configurable base.
//
// @details
// Request ids share the error() callback's id field with order ids, so the
// base is kept well away from typical gateway order ids to make logs easy
// to read. Routing never relies on that distance; it checks the request
// tables first.
//
// reset() rewinds to the base. Only the ConnectionManager calls it, after
// every waiter has been failed and the socket is closed, so no stale
// callback can name a rewound id.
//
// Thread-safety: next() is lock-free and safe from any thread.
// -----------------------------------------------------------------------------
class RequestIdAllocator {
 public:
  explicit RequestIdAllocator(domain::RequestId base = 10000)
      : base_(base), next_(base) {}

  RequestIdAllocator(const RequestIdAllocator&) = delete;
  RequestIdAllocator& operator=(const RequestIdAllocator&) = delete;

  domain::RequestId next() {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

  void reset() { next_.store(base_, std::memory_order_relaxed); }

  domain::RequestId base() const { return base_; }

 private:
  const domain::RequestId base_;
  std::atomic<domain::RequestId> next_;
};

// -----------------------------------------------------------------------------
// OrderIdAllocator
// -----------------------------------------------------------------------------
// @brief  Gateway-assigned order ids.
//
// @details
// Unusable until seed() is called with the nextValidId handshake value.
// The gateway may send nextValidId again later (e.g. after reqIds); a
// reseed only ever moves the counter forward so an id already handed out
// is never issued twice.
//
// Thread-safety: next() and seed() are safe from any thread.
// -----------------------------------------------------------------------------
class OrderIdAllocator {
 public:
  OrderIdAllocator() = default;

  OrderIdAllocator(const OrderIdAllocator&) = delete;
  OrderIdAllocator& operator=(const OrderIdAllocator&) = delete;

  void seed(domain::OrderId first_valid) {
    domain::OrderId current = next_.load();
    while (current < first_valid &&
           !next_.compare_exchange_weak(current, first_valid)) {
    }
    seeded_.store(true);
  }

  std::optional<domain::OrderId> next() {
    if (!seeded_.load()) {
      return std::nullopt;
    }
    return next_.fetch_add(1);
  }

  bool seeded() const { return seeded_.load(); }

  void reset() {
    seeded_.store(false);
    next_.store(0);
  }

 private:
  std::atomic<domain::OrderId> next_{0};
  std::atomic<bool> seeded_{false};
};

}  // namespace twsgate
