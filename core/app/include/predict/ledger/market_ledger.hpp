#pragma once

#include "predict/catalog/i_question_catalog.hpp"
#include "predict/config/engine_config.hpp"
#include "predict/domain/market.hpp"
#include "predict/pricing/pricing_curve.hpp"
#include "predict/storage/i_unit_of_work.hpp"
#include "predict/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace predict {

// Market row as written by applyBuy()/applySell(), with its new prices.
struct CommittedTrade {
  domain::Market market;
  Decimal yes_price;
  Decimal no_price;
};

using CommittedBuy = CommittedTrade;
using CommittedSell = CommittedTrade;

// -----------------------------------------------------------------------------
// MarketLedger — the single place that writes Market rows
// -----------------------------------------------------------------------------
//
// @brief  Loads, lazily creates, updates and resolves markets through the
//         IMarketRepository of the caller's unit of work.
//
// @details
// Markets are created on first use from the question catalog with a
// symmetric seed (MarketDefaults::seed_liquidity split evenly between the
// pools). The question's resolution time becomes the market end time.
//
// applyBuy()/applySell() accept a quote only if it was priced against the
// pools currently visible to the unit of work. A mismatch means another
// trade moved the market first and is reported as ConcurrencyConflictError
// so the coordinator re-prices. Pool conservation is re-checked before
// writing.
//
// Thread model:
//   Stateless apart from const references; safe to call from any worker.
//
// Ownership:
//   Owned by TradingEngine. References the catalog and clock it outlives.
// -----------------------------------------------------------------------------
class MarketLedger {
 public:
  MarketLedger(const IQuestionCatalog& catalog, const ITimeProvider& clock,
               config::MarketDefaults defaults);

  // Creates the market with a symmetric seed pool. Returns the existing row
  // unchanged when the id is already taken.
  domain::Market createMarket(IMarketRepository& markets,
                              const std::string& market_id,
                              const std::string& question,
                              std::optional<std::int64_t> end_time_ms,
                              Decimal seed) const;

  // Market that may be traded right now. `market_id` may also be a question
  // number. Throws MarketNotFoundError, MarketResolvedError or
  // MarketExpiredError.
  domain::Market loadTradable(IMarketRepository& markets,
                              const std::string& market_id) const;

  // -------------------------------------------------------------------------
  // applyBuy(markets, snapshot, quote, net_amount)
  // -------------------------------------------------------------------------
  // What: Writes the quote's new pools and adds net_amount to liquidity.
  // Why: The quote was priced from `snapshot`; writing it over pools that
  // have since moved would price the trade at a stale rate.
  // Thread-safety: Stateless. Two workers may hold the same snapshot; the
  // loser of the race sees ConcurrencyConflictError here or at commit.
  // Input: snapshot — the market as loaded by loadTradable() in this unit of
  // work; quote — PricingCurve::quoteBuy() on snapshot's pools.
  // Output: The staged market row and its new prices.
  // Throws: ConcurrencyConflictError (pools moved), MarketNotFoundError,
  // MarketResolvedError, MarketExpiredError. std::logic_error when the
  // quote does not conserve pools.
  // -------------------------------------------------------------------------
  CommittedBuy applyBuy(IMarketRepository& markets,
                        const domain::Market& snapshot, const BuyQuote& quote,
                        Decimal net_amount) const;

  // As applyBuy(); liquidity falls by quote.gross_proceeds.
  CommittedSell applySell(IMarketRepository& markets,
                          const domain::Market& snapshot,
                          const SellQuote& quote) const;

  // Current prices and pools. A catalog question without a market row
  // reports its seed state. Throws MarketNotFoundError.
  domain::MarketState state(IMarketRepository& markets,
                            const std::string& market_id) const;

  // Flags the market resolved with `outcome`. No payouts are made. Throws
  // MarketNotFoundError or MarketResolvedError (already resolved).
  domain::Market resolve(IMarketRepository& markets,
                         const std::string& market_id,
                         domain::Outcome outcome) const;

 private:
  // Existing row by id, or by the canonical id of the matching question.
  std::optional<domain::Market> lookup(IMarketRepository& markets,
                                       const std::string& market_id) const;

  void requireTradable(const domain::Market& market) const;

  CommittedTrade writeTrade(IMarketRepository& markets,
                            const domain::Market& snapshot,
                            Decimal new_yes_pool, Decimal new_no_pool,
                            Decimal liquidity_delta) const;

  const IQuestionCatalog& catalog_;
  const ITimeProvider& clock_;
  config::MarketDefaults defaults_;
};

}  // namespace predict
