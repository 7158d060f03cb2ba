// -----------------------------------------------------------------------------
// twsgate: gateway session process entry point
//
//   1) Load config/session.json (or argv[1]) with IB_* overrides.
//   2) Build the GatewaySession around a TwsWireClient and a LiveClock.
//   3) Connect, then hand connection repair to the supervisor.
//   4) Bridge session events to the IPC PUB socket and serve operator
//      commands on the REP socket.
//   5) Idle on the main thread until Ctrl-C, then shut down in reverse.
//
// Thread layout:
//   main thread        -> startup, idle wait, shutdown
//   gateway I/O thread -> every wire callback (owned by TwsWireClient)
//   supervisor thread  -> reconnect loop (owned by ConnectionManager)
//   ipc thread         -> telemetry PUB + command REP (owned by IpcServer)
// -----------------------------------------------------------------------------

#include "twsgate/config/session_config.hpp"
#include "twsgate/events/event.hpp"
#include "twsgate/events/event_types.hpp"
#include "twsgate/network/ipc_server.hpp"
#include "twsgate/session/gateway_session.hpp"
#include "twsgate/time/clock.hpp"
#include "twsgate/wire/tws_wire_client.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

// Set from the SIGINT/SIGTERM handler; polled by the main thread.
static std::atomic<bool> g_shutdown{false};

static void shutdown_handler(int /*signum*/) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "config/session.json";

  twsgate::SessionConfig config;
  try {
    config = twsgate::loadSessionConfig(config_path);
  } catch (const twsgate::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] gateway " << config.host << ":" << config.port
            << " client_id=" << config.client_id
            << " mode=" << config.trading_mode << "\n";

  twsgate::LiveClock clock;
  twsgate::GatewaySession session(
      std::make_unique<twsgate::wire::TwsWireClient>(), clock, config);

  std::unique_ptr<twsgate::IpcServer> ipc;
  std::optional<twsgate::EventBus::SubscriptionId> telemetry;
  if (config.ipc_enabled) {
    ipc = std::make_unique<twsgate::IpcServer>(
        [&session](const std::string& command) {
          return session.executeCommand(command);
        },
        config.cmd_endpoint, config.pub_endpoint);

    // Callbacks run on the publishing thread; they only enqueue.
    telemetry = session.eventBus().subscribe(
        [&ipc](const twsgate::Event& event) { ipc->pushTelemetry(event); });
    ipc->start();
  }

  session.eventBus().subscribe<twsgate::ConnectionStateEvent>(
      [](const twsgate::ConnectionStateEvent& e) {
        std::cout << "[main] connection " << twsgate::domain::toString(e.previous)
                  << " -> " << twsgate::domain::toString(e.current) << " ("
                  << e.reason << ")\n";
      });

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  if (!session.connect()) {
    std::cerr << "[main] WARNING: initial connect failed";
    if (config.supervisor_enabled) {
      std::cerr << ", supervisor will retry every "
                << config.supervisor_interval.count() << " ms";
    }
    std::cerr << ".\n";
  }
  if (config.supervisor_enabled) {
    session.startSupervisor();
  }

  std::cout << "[main] running. Press Ctrl-C to shut down.\n";
  while (!g_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "\n[main] shutting down...\n";
  session.stopSupervisor();
  session.disconnect();
  if (ipc) {
    ipc->stop();
    session.eventBus().unsubscribe(*telemetry);
  }
  return 0;
}
