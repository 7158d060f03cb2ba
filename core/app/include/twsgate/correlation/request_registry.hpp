#pragma once

#include "twsgate/concurrent/id_allocator.hpp"
#include "twsgate/domain/account_value.hpp"
#include "twsgate/domain/bar.hpp"
#include "twsgate/domain/contract.hpp"
#include "twsgate/domain/execution.hpp"
#include "twsgate/domain/order.hpp"
#include "twsgate/domain/position.hpp"
#include "twsgate/domain/session_error.hpp"
#include "twsgate/domain/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

namespace twsgate {

enum class RequestKind {
  HistoricalData,
  Snapshot,
  AccountSummary,
  Positions,
  Portfolio,
  Executions,
  ContractSearch,
  SymbolSearch,
  OpenOrders,
};

const char* toString(RequestKind kind);

// One row delivered by a multi-row callback sequence.
using Fragment = std::variant<domain::Bar,
                              domain::ContractMatch,
                              domain::Execution,
                              domain::AccountValue,
                              domain::Position,
                              domain::Order>;

// -----------------------------------------------------------------------------
// RequestRegistry: request-id keyed waiters
// -----------------------------------------------------------------------------
//
// @brief  Turns "fire request, get N callbacks then an end callback" into a
//         blocking, timeout-bounded call.
//
// @details
// Life of a request:
//
//   caller thread                      I/O thread
//   -------------                      ----------
//   id = issue(kind)
//   wire.send(id, ...)
//   await(id, timeout)  ── blocks ──   completeStreaming(id, row)   x N
//                                      complete(id)      (or fail(id, err))
//   <- rows, entry removed
//
// Removal happens in exactly one place: await() (or cancel() for a request
// that will never be awaited). The I/O-side calls only mark the entry done;
// they never erase it. That keeps the exactly-once removal rule trivially
// true and lets the late-callback case fall out naturally: once await() has
// removed the entry, a late complete()/completeStreaming()/fail() finds
// nothing and returns false.
//
// After an entry is done (completed or failed) further fragments for it are
// discarded, so a success result is never extended by stray rows.
//
// Thread model:
//   One mutex guards the map. Each entry owns its own condition_variable so
//   a completion wakes exactly the caller waiting on that id. I/O-side
//   methods hold the mutex only for the map lookup and a vector append.
//
// Ownership:
//   Owned by GatewaySession. Borrows the RequestIdAllocator owned by the
//   ConnectionManager.
// -----------------------------------------------------------------------------
class RequestRegistry {
 public:
  using Fragments = std::vector<Fragment>;

  explicit RequestRegistry(RequestIdAllocator& ids);

  RequestRegistry(const RequestRegistry&) = delete;
  RequestRegistry& operator=(const RequestRegistry&) = delete;
  RequestRegistry(RequestRegistry&&) = delete;
  RequestRegistry& operator=(RequestRegistry&&) = delete;

  // Allocates a fresh id and registers a waiter for it.
  domain::RequestId issue(RequestKind kind);

  // -------------------------------------------------------------------------
  // await(id, timeout)
  // -------------------------------------------------------------------------
  // @brief  Blocks until the request completes, fails or times out, then
  //         removes it.
  //
  // @return Fragments in arrival order on success. On failure, the error
  //         passed to fail()/failAll(). On deadline, ErrorKind::Timeout;
  //         rows received so far are discarded, never returned as success.
  //         An unknown id yields RequestFailed immediately.
  // -------------------------------------------------------------------------
  domain::Result<Fragments> await(domain::RequestId id,
                                  std::chrono::milliseconds timeout);

  // Typed convenience over await(): every fragment must hold T.
  template <typename T>
  domain::Result<std::vector<T>> awaitAs(domain::RequestId id,
                                         std::chrono::milliseconds timeout);

  // I/O-side. All return false (and do nothing) for unknown or done ids.
  bool completeStreaming(domain::RequestId id, Fragment fragment);
  bool complete(domain::RequestId id);
  bool fail(domain::RequestId id, domain::SessionError error);

  // Removes a request that will not be awaited. No-op for unknown ids.
  void cancel(domain::RequestId id);

  // Fails every outstanding request. Returns how many were woken.
  std::size_t failAll(const domain::SessionError& error);

  // Most recently issued live request of `kind`, for streams whose
  // callbacks carry no request id (positions, portfolio, open orders).
  std::optional<domain::RequestId> latestOf(RequestKind kind) const;

  std::optional<RequestKind> kindOf(domain::RequestId id) const;
  bool contains(domain::RequestId id) const;
  std::size_t size() const;

 private:
  struct PendingRequest {
    RequestKind kind{RequestKind::HistoricalData};
    std::uint64_t sequence{0};
    Fragments fragments;
    std::optional<domain::SessionError> error;
    bool done{false};
    std::condition_variable cv;
  };

  RequestIdAllocator& ids_;
  mutable std::mutex mutex_;
  std::uint64_t sequence_{0};
  std::unordered_map<domain::RequestId, std::shared_ptr<PendingRequest>>
      pending_;
};

// -----------------------------------------------------------------------------
// Template implementation
// -----------------------------------------------------------------------------
template <typename T>
domain::Result<std::vector<T>> RequestRegistry::awaitAs(
    domain::RequestId id, std::chrono::milliseconds timeout) {
  auto raw = await(id, timeout);
  if (!raw.ok()) {
    return domain::Result<std::vector<T>>::failure(raw.error);
  }

  std::vector<T> rows;
  rows.reserve(raw.value->size());
  for (auto& fragment : *raw.value) {
    if (auto* row = std::get_if<T>(&fragment)) {
      rows.push_back(std::move(*row));
    }
  }
  return domain::Result<std::vector<T>>::success(std::move(rows));
}

}  // namespace twsgate
