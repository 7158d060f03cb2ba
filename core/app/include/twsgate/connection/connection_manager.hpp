#pragma once

#include "twsgate/concurrent/id_allocator.hpp"
#include "twsgate/domain/connection_state.hpp"
#include "twsgate/domain/session_error.hpp"
#include "twsgate/domain/types.hpp"
#include "twsgate/wire/wire_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace twsgate {

// -----------------------------------------------------------------------------
// ConnectionManager: socket lifecycle, handshake, supervision
// -----------------------------------------------------------------------------
//
// @brief  Owns the Disconnected -> Connecting -> Connected -> Error
//         lifecycle of the one gateway connection, both id counters, and
//         the background supervisor that repairs lost connections.
//
// @details
// Two locks, never nested in the reverse order:
//
//   lifecycle_mutex_  held for the FULL duration of connect(), disconnect(),
//                     reconnect() and every supervisor pass. At most one
//                     of these runs at a time, so two connect attempts can
//                     never both succeed and race the id counters.
//
//   state_mutex_      guards state_, endpoint_ and the handshake flag. Taken
//                     briefly by caller threads and by the I/O thread. Never
//                     held while calling out.
//
// The I/O-thread entry points (onHandshake, onConnectionClosed,
// onFatalError) take only state_mutex_. They must not touch
// lifecycle_mutex_: connect() holds it while waiting for the handshake and
// disconnect() holds it while joining the I/O thread.
//
// Reconnect coalescing:
//   reconnect() samples a generation counter before taking the lock. If a
//   cycle completed while it waited, it returns that cycle's outcome instead
//   of tearing the fresh connection down again. N simultaneous callers
//   therefore produce exactly one teardown and one connect.
//
// Supervision:
//   startSupervisor() spawns a thread that, every interval, calls connect()
//   with the last endpoint whenever the state is not Connected and the
//   owner has not explicitly disconnected. It retries forever at a fixed
//   interval.
//
// Ownership:
//   Owned by GatewaySession. Borrows the WireClient. Owns the supervisor
//   thread; the destructor stops and joins it.
// -----------------------------------------------------------------------------
class ConnectionManager {
 public:
  struct Endpoint {
    std::string host{"127.0.0.1"};
    int port{4002};
    int client_id{1};
  };

  // Callbacks into the owner. Installed once, before the first connect().
  struct Hooks {
    // Runs during teardown while the socket is still open, so market data
    // subscriptions can be cancelled on the wire.
    std::function<void()> before_teardown;

    // Every outstanding waiter must be failed with this error.
    std::function<void(const domain::SessionError&)> fail_waiters;

    // Invoked outside any lock after each state change.
    std::function<void(domain::ConnectionState previous,
                       domain::ConnectionState current,
                       const std::string& reason)>
        state_changed;
  };

  ConnectionManager(wire::WireClient& wire, domain::RequestId request_id_base);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;
  ConnectionManager(ConnectionManager&&) = delete;
  ConnectionManager& operator=(ConnectionManager&&) = delete;

  void setHooks(Hooks hooks);

  // -------------------------------------------------------------------------
  // connect(endpoint, timeout)
  // -------------------------------------------------------------------------
  // @brief  Opens the socket, starts the I/O loop and blocks until the
  //         nextValidId handshake or the timeout.
  //
  // @return true when Connected. Returns true immediately, without wire
  //         traffic, if already Connected.
  //
  // @details
  // From Error (or a half-open socket) the stale connection is torn down
  // first. On a refused socket, a fatal error during the handshake, or a
  // timeout, the partial connection is torn down and the state ends in
  // Error so the supervisor will retry.
  //
  // Thread-safety: any caller thread; never the I/O thread.
  // -------------------------------------------------------------------------
  bool connect(const Endpoint& endpoint, std::chrono::milliseconds timeout);

  // Uses the last endpoint passed to connect(). False if there is none.
  bool connect(std::chrono::milliseconds timeout);

  // Cancels market data (via hooks), closes the socket, joins the I/O
  // loop, fails every waiter with NotConnected and resets both counters.
  // Also stops the supervisor from reconnecting until the next connect().
  void disconnect();

  bool reconnect(std::chrono::milliseconds timeout);

  bool isConnected() const;
  domain::ConnectionState state() const;
  std::optional<Endpoint> endpoint() const;

  // Number of completed teardown/connect cycles run by reconnect().
  std::uint64_t reconnectCount() const { return reconnect_generation_.load(); }

  void startSupervisor(std::chrono::milliseconds interval,
                       std::chrono::milliseconds connect_timeout);
  void stopSupervisor();
  bool supervisorRunning() const;

  // One supervisory pass. Skips when another lifecycle operation holds the
  // lock. Returns true if a connect attempt was made.
  bool superviseOnce(std::chrono::milliseconds connect_timeout);

  // --- I/O-thread notifications -------------------------------------------
  void onHandshake(domain::OrderId next_valid_id);
  void onConnectionClosed();
  void onFatalError(int code, const std::string& message);

  // Fails when not Connected; otherwise the next gateway order id.
  std::optional<domain::OrderId> nextOrderId();

  RequestIdAllocator& requestIds() { return request_ids_; }

 private:
  bool connectLocked(const Endpoint& endpoint,
                     std::chrono::milliseconds timeout);
  void teardownLocked(domain::ConnectionState final_state,
                      domain::ErrorKind waiter_error,
                      const std::string& reason);
  void setState(domain::ConnectionState next, const std::string& reason);
  void markLost(const std::string& reason);
  void supervisorLoop(std::chrono::milliseconds interval,
                      std::chrono::milliseconds connect_timeout);

  wire::WireClient& wire_;
  Hooks hooks_;

  RequestIdAllocator request_ids_;
  OrderIdAllocator order_ids_;

  std::mutex lifecycle_mutex_;
  std::optional<Endpoint> endpoint_;   // written under both locks
  std::atomic<bool> wanted_{false};    // false after explicit disconnect()
  std::atomic<bool> tearing_down_{false};
  std::atomic<std::uint64_t> reconnect_generation_{0};

  mutable std::mutex state_mutex_;
  std::condition_variable handshake_cv_;
  domain::ConnectionState state_{domain::ConnectionState::Disconnected};
  bool handshake_received_{false};

  std::mutex supervisor_mutex_;
  std::condition_variable supervisor_cv_;
  bool supervisor_stop_{false};
  std::thread supervisor_;
};

}  // namespace twsgate
