#include "twsgate/network/ipc_server.hpp"

#include "twsgate/network/json_format.hpp"

#include <iostream>
#include <utility>

namespace twsgate {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  } else if (!context_) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  const auto dropped = telemetry_queue_.dropped();
  std::cout << "[IpcServer] stopped.";
  if (dropped > 0) {
    std::cout << " " << dropped << " telemetry events dropped on overflow.";
  }
  std::cout << "\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*event);
    zmq::message_t msg(payload.data(), payload.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: PUB send would block. Dropped.\n";
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string command(static_cast<const char*>(request.data()),
                            request.size());
  const std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): Event variant -> JSON line
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit([](const auto& e) { return toJson(e).dump(); }, event);
}

}  // namespace twsgate
