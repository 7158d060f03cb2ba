#pragma once

#include "twsgate/domain/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace twsgate {

// -----------------------------------------------------------------------------
// Clock: injectable wall-clock source
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every timestamp the session synthesizes
//         itself: order submission times, position entry times, tick
//         update times and the default executions look-back.
//
// @details
// Gateway callbacks carry their own times where the protocol supplies them.
// Everything else comes from here, so tests can pin time with ManualClock
// and assert on exact entry timestamps.
//
// Thread-safety contract:
//   now() is called from the I/O thread and from caller threads at the same
//   time. Implementations must be safe for concurrent reads.
//
// Ownership:
//   Held by const reference. Must outlive the GatewaySession using it.
// -----------------------------------------------------------------------------
class Clock {
 public:
  virtual ~Clock() = default;

  virtual domain::Timestamp now() const = 0;
};

// Delegates to std::chrono::system_clock.
class LiveClock final : public Clock {
 public:
  domain::Timestamp now() const override;
};

// -----------------------------------------------------------------------------
// ManualClock
// -----------------------------------------------------------------------------
// Time moves only when set() or advance() is called. Stored as epoch
// milliseconds in an atomic so writers and readers need no lock.
// -----------------------------------------------------------------------------
class ManualClock final : public Clock {
 public:
  explicit ManualClock(domain::Timestamp start = domain::Timestamp{});

  domain::Timestamp now() const override;

  void set(domain::Timestamp t);
  void advance(std::chrono::milliseconds delta);

 private:
  std::atomic<std::int64_t> now_ms_{0};
};

}  // namespace twsgate
