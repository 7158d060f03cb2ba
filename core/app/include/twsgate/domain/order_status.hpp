#pragma once

#include <optional>
#include <string>

namespace twsgate {
namespace domain {

enum class OrderStatus {
  Pending,          // Inserted locally before the wire send, or PendingSubmit
  Submitted,        // Working at the gateway (PreSubmitted / Submitted)
  PartiallyFilled,  // Some quantity filled, remainder still working
  Filled,           // Fully filled: terminal
  Cancelled,        // Cancelled by us, another client or the gateway: terminal
  Rejected,         // Rejected by the gateway: terminal
  Inactive,         // Parked by the gateway; can be reactivated
};

// -----------------------------------------------------------------------------
// isTerminal(status)
// -----------------------------------------------------------------------------
// @brief  True for Filled, Cancelled and Rejected. No status callback may
//         move an order out of a terminal state.
// -----------------------------------------------------------------------------
inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected;
}

const char* toString(OrderStatus status);

// -----------------------------------------------------------------------------
// orderStatusFromWire(status, filled, remaining)
// -----------------------------------------------------------------------------
// @brief  Maps a gateway status string onto the tracker's state set.
//
// @return std::nullopt for strings the gateway may add in future versions.
//         Callers log and keep the current status in that case.
//
// @details
//   ApiPending, PendingSubmit               -> Pending
//   PreSubmitted, Submitted, PendingCancel  -> Submitted, or PartiallyFilled
//                                              when 0 < filled and remaining > 0
//   Filled                                  -> Filled
//   Cancelled, ApiCancelled                 -> Cancelled
//   Inactive                                -> Inactive
// -----------------------------------------------------------------------------
std::optional<OrderStatus> orderStatusFromWire(const std::string& status,
                                               double filled,
                                               double remaining);

}  // namespace domain
}  // namespace twsgate
