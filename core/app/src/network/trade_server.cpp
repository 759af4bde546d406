#include "predict/network/trade_server.hpp"

#include "predict/network/trade_protocol.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace predict {

TradeServer::TradeServer(CommandHandler command_handler,
                         std::string command_endpoint,
                         std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

TradeServer::~TradeServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets, spawn the server thread
// -----------------------------------------------------------------------------
void TradeServer::start() {
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
  cmd_socket_->bind(command_endpoint_);
  pub_socket_->bind(telemetry_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[TradeServer] started. CMD=" << command_endpoint_
            << " PUB=" << telemetry_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void TradeServer::stop() {
  running_.store(false);
  if (!thread_.joinable()) {
    return;
  }
  thread_.join();

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[TradeServer] stopped.\n";
}

void TradeServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): alternate telemetry drain and command poll
// -----------------------------------------------------------------------------
void TradeServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void TradeServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    std::string payload = protocol::encodeTelemetry(*event);
    zmq::message_t msg(payload.data(), payload.size());
    // PUB never blocks; with no subscriber the message is dropped.
    (void)pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

void TradeServer::processCommands() {
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

  std::string command(static_cast<const char*>(request.data()),
                      request.size());
  std::string response = command_handler_(command);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace predict
