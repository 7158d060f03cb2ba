#include "twsgate/connection/connection_manager.hpp"

#include <iostream>
#include <utility>

namespace twsgate {

using domain::ConnectionState;

ConnectionManager::ConnectionManager(wire::WireClient& wire,
                                     domain::RequestId request_id_base)
    : wire_(wire), request_ids_(request_id_base) {}

ConnectionManager::~ConnectionManager() { stopSupervisor(); }

void ConnectionManager::setHooks(Hooks hooks) { hooks_ = std::move(hooks); }

// -----------------------------------------------------------------------------
// connect()
// -----------------------------------------------------------------------------
bool ConnectionManager::connect(const Endpoint& endpoint,
                                std::chrono::milliseconds timeout) {
  std::lock_guard lock(lifecycle_mutex_);
  wanted_.store(true);
  return connectLocked(endpoint, timeout);
}

bool ConnectionManager::connect(std::chrono::milliseconds timeout) {
  std::lock_guard lock(lifecycle_mutex_);
  if (!endpoint_) {
    std::cerr << "[ConnectionManager] WARNING: connect() without a known "
                 "endpoint. Skipping.\n";
    return false;
  }
  wanted_.store(true);
  const Endpoint endpoint = *endpoint_;
  return connectLocked(endpoint, timeout);
}

bool ConnectionManager::connectLocked(const Endpoint& endpoint,
                                      std::chrono::milliseconds timeout) {
  if (state() == ConnectionState::Connected && wire_.isConnected()) {
    return true;
  }

  // Stale socket from a fatal error or a dropped connection.
  if (state() != ConnectionState::Disconnected || wire_.isConnected()) {
    teardownLocked(ConnectionState::Disconnected,
                   domain::ErrorKind::ConnectionLost,
                   "replacing stale connection");
  }

  {
    std::lock_guard state_lock(state_mutex_);
    endpoint_ = endpoint;
    handshake_received_ = false;
  }
  setState(ConnectionState::Connecting,
           endpoint.host + ":" + std::to_string(endpoint.port));

  std::cout << "[ConnectionManager] connecting to " << endpoint.host << ":"
            << endpoint.port << " client_id=" << endpoint.client_id << "\n";

  if (!wire_.connect(endpoint.host, endpoint.port, endpoint.client_id)) {
    std::cerr << "[ConnectionManager] ERROR: socket connect to "
              << endpoint.host << ":" << endpoint.port << " failed.\n";
    teardownLocked(ConnectionState::Error, domain::ErrorKind::NotConnected,
                   "socket connect failed");
    return false;
  }

  bool handshake = false;
  {
    std::unique_lock state_lock(state_mutex_);
    handshake_cv_.wait_for(state_lock, timeout, [this] {
      return handshake_received_ || state_ == ConnectionState::Error;
    });
    handshake = handshake_received_ && state_ == ConnectionState::Connected;
  }

  if (!handshake) {
    std::cerr << "[ConnectionManager] ERROR: no handshake from "
              << endpoint.host << ":" << endpoint.port << " within "
              << timeout.count() << " ms. Tearing down.\n";
    teardownLocked(ConnectionState::Error, domain::ErrorKind::NotConnected,
                   "handshake failed");
    return false;
  }

  std::cout << "[ConnectionManager] connected.\n";
  return true;
}

// -----------------------------------------------------------------------------
// disconnect() / reconnect()
// -----------------------------------------------------------------------------
void ConnectionManager::disconnect() {
  std::lock_guard lock(lifecycle_mutex_);
  wanted_.store(false);
  if (state() == ConnectionState::Disconnected && !wire_.isConnected()) {
    return;
  }
  teardownLocked(ConnectionState::Disconnected,
                 domain::ErrorKind::NotConnected, "disconnect requested");
  std::cout << "[ConnectionManager] disconnected.\n";
}

bool ConnectionManager::reconnect(std::chrono::milliseconds timeout) {
  const std::uint64_t observed = reconnect_generation_.load();

  std::lock_guard lock(lifecycle_mutex_);
  if (reconnect_generation_.load() != observed) {
    // Another caller finished a full cycle while we waited for the lock.
    return isConnected();
  }
  if (!endpoint_) {
    std::cerr << "[ConnectionManager] WARNING: reconnect() before any "
                 "connect(). Skipping.\n";
    return false;
  }

  std::cout << "[ConnectionManager] reconnecting.\n";
  wanted_.store(true);
  teardownLocked(ConnectionState::Disconnected,
                 domain::ErrorKind::ConnectionLost, "reconnect requested");
  const Endpoint endpoint = *endpoint_;
  const bool ok = connectLocked(endpoint, timeout);
  reconnect_generation_.fetch_add(1);
  return ok;
}

// -----------------------------------------------------------------------------
// teardownLocked(): requires lifecycle_mutex_
// -----------------------------------------------------------------------------
void ConnectionManager::teardownLocked(ConnectionState final_state,
                                       domain::ErrorKind waiter_error,
                                       const std::string& reason) {
  tearing_down_.store(true);

  if (hooks_.before_teardown) {
    hooks_.before_teardown();
  }
  wire_.disconnect();

  {
    std::lock_guard state_lock(state_mutex_);
    handshake_received_ = false;
  }

  if (hooks_.fail_waiters) {
    hooks_.fail_waiters(domain::SessionError{waiter_error, 0, reason});
  }

  order_ids_.reset();
  request_ids_.reset();

  setState(final_state, reason);
  tearing_down_.store(false);
}

// -----------------------------------------------------------------------------
// State
// -----------------------------------------------------------------------------
void ConnectionManager::setState(ConnectionState next,
                                 const std::string& reason) {
  ConnectionState previous;
  {
    std::lock_guard state_lock(state_mutex_);
    previous = state_;
    state_ = next;
  }
  handshake_cv_.notify_all();

  if (previous != next && hooks_.state_changed) {
    hooks_.state_changed(previous, next, reason);
  }
}

bool ConnectionManager::isConnected() const {
  return state() == ConnectionState::Connected;
}

ConnectionState ConnectionManager::state() const {
  std::lock_guard state_lock(state_mutex_);
  return state_;
}

std::optional<ConnectionManager::Endpoint> ConnectionManager::endpoint()
    const {
  std::lock_guard state_lock(state_mutex_);
  return endpoint_;
}

std::optional<domain::OrderId> ConnectionManager::nextOrderId() {
  if (!isConnected()) {
    return std::nullopt;
  }
  return order_ids_.next();
}

// -----------------------------------------------------------------------------
// I/O-thread notifications
// -----------------------------------------------------------------------------
void ConnectionManager::onHandshake(domain::OrderId next_valid_id) {
  order_ids_.seed(next_valid_id);

  bool became_connected = false;
  {
    std::lock_guard state_lock(state_mutex_);
    handshake_received_ = true;
    if (state_ == ConnectionState::Connecting) {
      became_connected = true;
    }
  }

  if (became_connected) {
    setState(ConnectionState::Connected,
             "handshake next_valid_id=" + std::to_string(next_valid_id));
  } else {
    handshake_cv_.notify_all();
  }
}

void ConnectionManager::onConnectionClosed() {
  if (tearing_down_.load()) {
    return;
  }
  markLost("connection closed by gateway");
}

void ConnectionManager::onFatalError(int code, const std::string& message) {
  markLost("fatal gateway error " + std::to_string(code) + ": " + message);
}

void ConnectionManager::markLost(const std::string& reason) {
  {
    std::lock_guard state_lock(state_mutex_);
    if (state_ == ConnectionState::Disconnected ||
        state_ == ConnectionState::Error) {
      return;
    }
  }

  std::cerr << "[ConnectionManager] ERROR: " << reason
            << ". State -> Error.\n";
  setState(ConnectionState::Error, reason);

  if (hooks_.fail_waiters) {
    hooks_.fail_waiters(
        domain::SessionError{domain::ErrorKind::ConnectionLost, 0, reason});
  }
}

// -----------------------------------------------------------------------------
// Supervisor
// -----------------------------------------------------------------------------
void ConnectionManager::startSupervisor(
    std::chrono::milliseconds interval,
    std::chrono::milliseconds connect_timeout) {
  if (supervisor_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(supervisor_mutex_);
    supervisor_stop_ = false;
  }
  supervisor_ = std::thread([this, interval, connect_timeout] {
    supervisorLoop(interval, connect_timeout);
  });
  std::cout << "[ConnectionManager] supervisor started, interval="
            << interval.count() << " ms\n";
}

void ConnectionManager::stopSupervisor() {
  {
    std::lock_guard lock(supervisor_mutex_);
    supervisor_stop_ = true;
  }
  supervisor_cv_.notify_all();
  if (supervisor_.joinable()) {
    supervisor_.join();
    std::cout << "[ConnectionManager] supervisor stopped.\n";
  }
}

bool ConnectionManager::supervisorRunning() const {
  return supervisor_.joinable();
}

void ConnectionManager::supervisorLoop(
    std::chrono::milliseconds interval,
    std::chrono::milliseconds connect_timeout) {
  while (true) {
    {
      std::unique_lock lock(supervisor_mutex_);
      if (supervisor_cv_.wait_for(lock, interval,
                                  [this] { return supervisor_stop_; })) {
        return;
      }
    }
    superviseOnce(connect_timeout);
  }
}

bool ConnectionManager::superviseOnce(
    std::chrono::milliseconds connect_timeout) {
  std::unique_lock lock(lifecycle_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    return false;
  }
  if (!wanted_.load() || !endpoint_ || isConnected()) {
    return false;
  }

  std::cout << "[ConnectionManager] supervisor: state="
            << domain::toString(state()) << ", attempting connect.\n";
  const Endpoint endpoint = *endpoint_;
  if (!connectLocked(endpoint, connect_timeout)) {
    std::cerr << "[ConnectionManager] WARNING: supervisor connect failed. "
                 "Retrying next interval.\n";
  }
  return true;
}

}  // namespace twsgate
