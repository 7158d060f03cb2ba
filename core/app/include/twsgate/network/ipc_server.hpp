#pragma once

#include "twsgate/concurrent/thread_safe_queue.hpp"
#include "twsgate/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace twsgate {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ telemetry and operator command channel
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that broadcasts session events as JSON on
//         a PUB socket and answers operator commands on a REP socket.
//
// @details
// Two sockets, one thread:
//
//   1. PUB (default tcp://127.0.0.1:5557)
//      Every Event pushed through pushTelemetry() is formatted with
//      formatTelemetry() and published. Events arrive through a bounded
//      ThreadSafeQueue, so formatting and socket I/O never run on the
//      gateway I/O thread that publishes most events.
//
//   2. REP (default tcp://127.0.0.1:5556)
//      Each request string is passed to the command handler (bound to
//      GatewaySession::executeCommand) and the returned JSON is sent back.
//      ZMQ_RCVTIMEO bounds each receive so the loop alternates between
//      commands and telemetry.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread and may block (RECONNECT
//   does); telemetry is buffered meanwhile.
//
// Errors:
//   EINTR from recv is treated as "no message". Any other zmq::error_t
//   propagates out of the IPC thread.
//
// Ownership:
//   Owned by main(). Owns the ZMQ context, both sockets, the queue and the
//   worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  void start();

  // Idempotent. Publishes whatever is still queued before returning.
  void stop();

  bool running() const { return running_.load(); }

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return One-line JSON object with a "type" field of order_update,
  //         position_update, connection_state or gateway_error.
  // -------------------------------------------------------------------------
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace twsgate
