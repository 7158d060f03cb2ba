#pragma once

#include <chrono>
#include <cstdint>

namespace twsgate {
namespace domain {

// Gateway-assigned order identifier. Seeded by the nextValidId handshake.
using OrderId = std::int64_t;

// Caller-chosen correlation id for every non-order request. The vendor
// protocol carries these as 32-bit ints.
using RequestId = int;

// Sentinel the gateway uses for errors that name no request or order.
constexpr std::int64_t kNoId = -1;

// Wall-clock instant used for bars, ticks, executions and entry times.
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace domain
}  // namespace twsgate
