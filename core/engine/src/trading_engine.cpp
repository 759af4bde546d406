#include "predict/engine/trading_engine.hpp"

#include "predict/network/trade_protocol.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace predict {

namespace {

config::EngineConfig validated(config::EngineConfig config) {
  config::validateEngineConfig(config);
  return config;
}

// Executes one parsed command against the coordinator and encodes the
// reply. TradeErrors propagate to executeCommand().
struct CommandRunner {
  TradeCoordinator& coordinator;

  std::string operator()(const protocol::PingCommand&) const {
    return protocol::encodePong();
  }
  std::string operator()(const protocol::BuyCommand& c) const {
    return protocol::encodeBuyReceipt(coordinator.buy(c.request));
  }
  std::string operator()(const protocol::SellCommand& c) const {
    return protocol::encodeSellReceipt(coordinator.sell(c.request));
  }
  std::string operator()(const protocol::MarketStateCommand& c) const {
    return protocol::encodeMarketState(coordinator.getMarketState(c.market_id));
  }
  std::string operator()(const protocol::OpenAccountCommand& c) const {
    return protocol::encodeWallet(
        coordinator.openAccount(c.user_id, c.balance, c.referrer_id));
  }
  std::string operator()(const protocol::WalletCommand& c) const {
    return protocol::encodeWallet(coordinator.wallet(c.user_id));
  }
  std::string operator()(const protocol::HoldingsCommand& c) const {
    return protocol::encodeHoldings(
        c.user_id, c.market_id, coordinator.holdings(c.user_id, c.market_id));
  }
  std::string operator()(const protocol::ResolveCommand& c) const {
    return protocol::encodeMarket(
        coordinator.resolveMarket(c.market_id, c.outcome));
  }
};

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(config::EngineConfig config,
                             const ITimeProvider& clock)
    : config_(validated(std::move(config))),
      clock_(clock),
      catalog_(config_.questions),
      curve_(CurveLimits{config_.markets.min_price, config_.markets.max_price}),
      fees_(config_.fees),
      market_ledger_(catalog_, clock_, config_.markets),
      wallet_ledger_(clock_),
      coordinator_(store_, market_ledger_, position_book_, wallet_ledger_,
                   curve_, fees_, clock_, trade_ids_, config_.retry,
                   &event_bus_) {
  std::cout << "[TradingEngine] catalog bootstrapped with "
            << catalog_.size() << " question(s).\n";
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Worker pool: trades can be submitted from here on ----------------
  worker_pool_ = std::make_unique<TradeWorkerPool>(config_.server.worker_threads);
  worker_pool_->start();

  // ---  2) Command/telemetry server, skipped without endpoints --------------
  const auto& server = config_.server;
  if (!server.command_endpoint.empty() && !server.telemetry_endpoint.empty()) {
    server_ = std::make_unique<TradeServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        server.command_endpoint, server.telemetry_endpoint);
    server_->start();

    // Telemetry bridge: worker threads -> server queue -> PUB socket.
    telemetry_sub_id_ = event_bus_.subscribe(
        [this](const Event& event) { server_->pushTelemetry(event); });
  }

  running_ = true;

  std::cout << "[TradingEngine] started. Workers: " << server.worker_threads
            << (server_ ? ", server: on" : ", server: off") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop taking commands (joins the server thread) -------------------
  if (server_) {
    server_->stop();
  }

  // ---  2) Let queued trades finish, then join the workers ------------------
  worker_pool_->stop();
  worker_pool_.reset();

  // ---  3) No more publishers: detach the bridge and drop the server --------
  if (server_) {
    event_bus_.unsubscribe(telemetry_sub_id_);
    server_.reset();
  }

  running_ = false;

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// dispatch(): worker pool with request timeout, or inline when stopped
// -----------------------------------------------------------------------------
template <typename Fn>
std::string TradingEngine::dispatch(const char* op, Fn&& fn) {
  if (!worker_pool_) {
    return fn();
  }

  std::future<std::string> reply = worker_pool_->submit(std::forward<Fn>(fn));
  const int timeout_ms = config_.server.request_timeout_ms;
  if (reply.wait_for(std::chrono::milliseconds(timeout_ms)) !=
      std::future_status::ready) {
    // The task keeps running; its commit completes or rolls back on its own.
    std::cerr << "[TradingEngine] " << op << " timed out after " << timeout_ms
              << " ms.\n";
    return protocol::encodeTimeout(op, timeout_ms);
  }
  return reply.get();
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON in, JSON out
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& command) {
  try {
    protocol::Command parsed = protocol::parseCommand(command);
    if (std::holds_alternative<protocol::PingCommand>(parsed)) {
      return protocol::encodePong();
    }

    const char* op = protocol::commandName(parsed);
    return dispatch(op, [this, parsed = std::move(parsed)]() {
      return std::visit(CommandRunner{coordinator_}, parsed);
    });
  } catch (const TradeError& e) {
    return protocol::encodeError(e);
  } catch (const std::exception& e) {
    std::cerr << "[TradingEngine] command failed: " << e.what() << "\n";
    return protocol::encodeInternalError(e.what());
  }
}

// -----------------------------------------------------------------------------
// submitBuy() / submitSell()
// -----------------------------------------------------------------------------
std::future<BuyReceipt> TradingEngine::submitBuy(BuyRequest request) {
  if (!worker_pool_) {
    throw std::logic_error("TradingEngine: not running");
  }
  return worker_pool_->submit([this, request = std::move(request)]() {
    return coordinator_.buy(request);
  });
}

std::future<SellReceipt> TradingEngine::submitSell(SellRequest request) {
  if (!worker_pool_) {
    throw std::logic_error("TradingEngine: not running");
  }
  return worker_pool_->submit([this, request = std::move(request)]() {
    return coordinator_.sell(request);
  });
}

}  // namespace predict
