// -----------------------------------------------------------------------------
// predict_engine — single executable entry point.
//
//   1) Load EngineConfig from the JSON file named on the command line, or
//      use the built-in defaults when no file is given.
//   2) Create a LiveTimeProvider (markets expire on wall-clock time).
//   3) Create the TradingEngine and start it: worker pool plus the ZeroMQ
//      command (REP) and telemetry (PUB) sockets.
//   4) Idle on the main thread until SIGINT or SIGTERM.
//   5) Stop the engine: the server stops taking commands, queued trades
//      finish, every thread is joined.
//
// Thread layout:
//   main thread      -> waits for a shutdown signal
//   server thread    -> TradeServer::run() (REP recv loop + PUB drain)
//   worker threads   -> TradeCoordinator::buy()/sell() via TradeWorkerPool
// -----------------------------------------------------------------------------

#include "predict/config/engine_config.hpp"
#include "predict/engine/trading_engine.hpp"
#include "predict/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------------
// Shutdown flag. The only global in the program; written from the signal
// handler, polled by the main loop.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [config.json]\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  predict::config::EngineConfig config;
  try {
    if (argc == 2) {
      config = predict::config::loadEngineConfig(argv[1]);
      std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
    } else {
      std::cout << "[main] No configuration file given; using defaults.\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) + 3) Clock and engine.
  // -------------------------------------------------------------------------
  predict::LiveTimeProvider clock;
  predict::TradingEngine engine(std::move(config), clock);

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] Failed to start engine: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  const auto& server = engine.config().server;
  std::cout << "[main] Commands on " << server.command_endpoint
            << ", telemetry on " << server.telemetry_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Idle until a shutdown signal arrives.
  // -------------------------------------------------------------------------
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 5) Clean shutdown.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
