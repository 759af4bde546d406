#pragma once

#include "predict/catalog/in_memory_question_catalog.hpp"
#include "predict/concurrent/sequence_generator.hpp"
#include "predict/concurrent/trade_worker_pool.hpp"
#include "predict/config/engine_config.hpp"
#include "predict/eventbus/event_bus.hpp"
#include "predict/ledger/market_ledger.hpp"
#include "predict/ledger/position_book.hpp"
#include "predict/ledger/wallet_ledger.hpp"
#include "predict/network/trade_server.hpp"
#include "predict/pricing/fee_calculator.hpp"
#include "predict/pricing/pricing_curve.hpp"
#include "predict/storage/in_memory_store.hpp"
#include "predict/time/i_time_provider.hpp"
#include "predict/trade/trade_coordinator.hpp"
#include "predict/trade/trade_receipt.hpp"

#include <future>
#include <memory>
#include <string>

namespace predict {

// -----------------------------------------------------------------------------
// TradingEngine — composition root of the prediction-market core
// -----------------------------------------------------------------------------
//
// @brief  Owns the store, the ledgers, the calculators, the coordinator, the
//         worker pool and the command/telemetry server, and wires them
//         together in dependency order.
//
// @details
// Construction builds every stateless component and bootstraps the
// question catalog from EngineConfig::questions. start() spawns the worker
// pool and, when both endpoints are configured, the TradeServer with a
// telemetry bridge from the EventBus. stop() tears down in reverse order:
// server first (no new requests), then the pool (queued trades finish).
//
// Trades enter either through executeCommand() (JSON, used by the server)
// or through submitBuy()/submitSell() (typed, returns a future).
//
// Thread model:
//   start()/stop() on the owning thread. executeCommand() and submit*()
//   from any thread.
//
// Ownership:
//   Borrows the clock; owns everything else. Non-copyable, non-movable
//   because components hold references into it.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  TradingEngine(config::EngineConfig config, const ITimeProvider& clock);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // Idempotent.
  void start();

  // Idempotent. Waits for queued trades to finish.
  void stop();

  bool running() const { return running_; }

  // Parses one JSON command, runs it (trades on the worker pool), and
  // returns the JSON reply. Never throws for bad input: every failure is
  // encoded as an error reply.
  std::string executeCommand(const std::string& command);

  // Typed entry points. The future carries the receipt or the TradeError.
  // Throws std::logic_error when the engine is not running.
  std::future<BuyReceipt> submitBuy(BuyRequest request);
  std::future<SellReceipt> submitSell(SellRequest request);

  TradeCoordinator& coordinator() { return coordinator_; }
  InMemoryQuestionCatalog& catalog() { return catalog_; }
  const InMemoryStore& store() const { return store_; }
  EventBus& eventBus() { return event_bus_; }
  const config::EngineConfig& config() const { return config_; }

 private:
  // Runs `fn` on the worker pool when running, inline otherwise, and waits
  // up to the request timeout.
  template <typename Fn>
  std::string dispatch(const char* op, Fn&& fn);

  const config::EngineConfig config_;
  const ITimeProvider& clock_;

  InMemoryStore store_;
  InMemoryQuestionCatalog catalog_;
  PricingCurve curve_;
  FeeCalculator fees_;
  MarketLedger market_ledger_;
  PositionBook position_book_;
  WalletLedger wallet_ledger_;
  SequenceGenerator trade_ids_{"T-"};
  EventBus event_bus_;
  TradeCoordinator coordinator_;

  std::unique_ptr<TradeWorkerPool> worker_pool_;
  std::unique_ptr<TradeServer> server_;
  EventBus::SubscriptionId telemetry_sub_id_{0};

  bool running_{false};
};

}  // namespace predict
