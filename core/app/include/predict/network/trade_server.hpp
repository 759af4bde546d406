#pragma once

#include "predict/concurrent/thread_safe_queue.hpp"
#include "predict/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace predict {

// -----------------------------------------------------------------------------
// TradeServer — ZeroMQ gateway for trade commands and market telemetry
// -----------------------------------------------------------------------------
//
// @brief  One thread serving a REP socket (JSON commands in, JSON replies
//         out) and a PUB socket (JSON telemetry out).
//
// @details
//   1. REP socket (command_endpoint):
//      Each request string goes to the CommandHandler, which is bound to
//      TradingEngine::executeCommand(). The handler hands trades to the
//      worker pool and waits at most the configured request timeout, so a
//      slow commit cannot stall this loop for longer than that.
//      ZMQ_RCVTIMEO keeps recv() from blocking forever, so the loop also
//      gets to drain telemetry and notice stop().
//
//   2. PUB socket (telemetry_endpoint):
//      TradeSettledEvent, TradeRejectedEvent and MarketResolvedEvent arrive
//      through pushTelemetry() from the worker threads and are published as
//      JSON (see protocol::encodeTelemetry()).
//
// Thread model:
//   start()/stop() on the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the server thread.
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the server thread.
// -----------------------------------------------------------------------------
class TradeServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  TradeServer(CommandHandler command_handler, std::string command_endpoint,
              std::string telemetry_endpoint);

  ~TradeServer();

  TradeServer(const TradeServer&) = delete;
  TradeServer& operator=(const TradeServer&) = delete;
  TradeServer(TradeServer&&) = delete;
  TradeServer& operator=(TradeServer&&) = delete;

  // Binds both sockets and spawns the server thread. Idempotent. Throws
  // zmq::error_t if an endpoint cannot be bound.
  void start();

  // Stops the loop within kPollTimeoutMs, publishes queued telemetry, joins
  // and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();

  // Drains the telemetry queue onto the PUB socket without blocking.
  void processTelemetry();

  // Waits up to kPollTimeoutMs for one request and answers it.
  void processCommands();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace predict
