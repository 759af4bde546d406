#include "predict/ledger/market_ledger.hpp"

#include "predict/domain/trade_errors.hpp"

#include <stdexcept>

namespace predict {

namespace {

struct SeedSplit {
  Decimal yes;
  Decimal no;
};

SeedSplit splitSeed(Decimal seed) {
  Decimal yes = Decimal::fromRaw(seed.raw() / 2);
  return SeedSplit{yes, seed - yes};
}

}  // namespace

MarketLedger::MarketLedger(const IQuestionCatalog& catalog,
                           const ITimeProvider& clock,
                           config::MarketDefaults defaults)
    : catalog_(catalog), clock_(clock), defaults_(defaults) {}

// -----------------------------------------------------------------------------
// createMarket()
// -----------------------------------------------------------------------------
domain::Market MarketLedger::createMarket(
    IMarketRepository& markets, const std::string& market_id,
    const std::string& question, std::optional<std::int64_t> end_time_ms,
    Decimal seed) const {
  if (auto existing = markets.find(market_id)) {
    return *existing;
  }
  if (seed.raw() < 2) {
    throw std::invalid_argument("MarketLedger: seed liquidity too small");
  }

  auto [yes, no] = splitSeed(seed);

  domain::Market market;
  market.id = market_id;
  market.question = question;
  market.yes_pool = yes;
  market.no_pool = no;
  market.liquidity = seed;
  market.end_time_ms = end_time_ms;
  market.created_at_ms = clock_.now_ms();
  markets.save(market);
  return market;
}

// -----------------------------------------------------------------------------
// loadTradable()
// -----------------------------------------------------------------------------
domain::Market MarketLedger::loadTradable(IMarketRepository& markets,
                                          const std::string& market_id) const {
  if (auto market = lookup(markets, market_id)) {
    requireTradable(*market);
    return *market;
  }

  auto question = catalog_.find(market_id);
  if (!question) {
    throw MarketNotFoundError("Market not found", {{"market_id", market_id}});
  }
  if (question->status != domain::QuestionStatus::Active) {
    throw MarketResolvedError(
        "Question is not active",
        {{"market_id", question->id},
         {"status", domain::questionStatusToString(question->status)}});
  }
  if (question->resolution_time_ms &&
      clock_.now_ms() >= *question->resolution_time_ms) {
    throw MarketExpiredError(
        "Market has expired",
        {{"market_id", question->id},
         {"end_time_ms", std::to_string(*question->resolution_time_ms)}});
  }

  return createMarket(markets, question->id, question->text,
                      question->resolution_time_ms, defaults_.seed_liquidity);
}

// -----------------------------------------------------------------------------
// applyBuy() / applySell()
// -----------------------------------------------------------------------------
CommittedBuy MarketLedger::applyBuy(IMarketRepository& markets,
                                    const domain::Market& snapshot,
                                    const BuyQuote& quote,
                                    Decimal net_amount) const {
  if (quote.new_yes_pool + quote.new_no_pool !=
      snapshot.yes_pool + snapshot.no_pool + net_amount) {
    throw std::logic_error("MarketLedger: buy quote does not conserve pools");
  }
  return writeTrade(markets, snapshot, quote.new_yes_pool, quote.new_no_pool,
                    net_amount);
}

CommittedSell MarketLedger::applySell(IMarketRepository& markets,
                                      const domain::Market& snapshot,
                                      const SellQuote& quote) const {
  if (quote.new_yes_pool + quote.new_no_pool !=
      snapshot.yes_pool + snapshot.no_pool - quote.gross_proceeds) {
    throw std::logic_error("MarketLedger: sell quote does not conserve pools");
  }
  return writeTrade(markets, snapshot, quote.new_yes_pool, quote.new_no_pool,
                    -quote.gross_proceeds);
}

CommittedTrade MarketLedger::writeTrade(IMarketRepository& markets,
                                        const domain::Market& snapshot,
                                        Decimal new_yes_pool,
                                        Decimal new_no_pool,
                                        Decimal liquidity_delta) const {
  auto current = markets.find(snapshot.id);
  if (!current) {
    throw MarketNotFoundError("Market not found", {{"market_id", snapshot.id}});
  }
  if (current->yes_pool != snapshot.yes_pool ||
      current->no_pool != snapshot.no_pool) {
    throw ConcurrencyConflictError(
        "Market pools moved since the quote was priced",
        {{"market_id", snapshot.id},
         {"quoted_yes_pool", snapshot.yes_pool.toString()},
         {"current_yes_pool", current->yes_pool.toString()}});
  }
  requireTradable(*current);

  domain::Market updated = *current;
  updated.yes_pool = new_yes_pool;
  updated.no_pool = new_no_pool;
  updated.liquidity = current->liquidity + liquidity_delta;
  markets.save(updated);

  Decimal yes_price = PricingCurve::price(updated.yes_pool, updated.no_pool,
                                          domain::Outcome::Yes);
  return CommittedTrade{updated, yes_price, Decimal::one() - yes_price};
}

// -----------------------------------------------------------------------------
// state()
// -----------------------------------------------------------------------------
domain::MarketState MarketLedger::state(IMarketRepository& markets,
                                        const std::string& market_id) const {
  domain::MarketState s;

  if (auto market = lookup(markets, market_id)) {
    s.market_id = market->id;
    s.yes_pool = market->yes_pool;
    s.no_pool = market->no_pool;
    s.liquidity = market->liquidity;
    s.resolved = market->resolved;
    s.resolution = market->resolution;
    s.end_time_ms = market->end_time_ms;
  } else if (auto question = catalog_.find(market_id)) {
    auto [yes, no] = splitSeed(defaults_.seed_liquidity);
    s.market_id = question->id;
    s.yes_pool = yes;
    s.no_pool = no;
    s.liquidity = defaults_.seed_liquidity;
    s.resolved = (question->status == domain::QuestionStatus::Resolved);
    s.end_time_ms = question->resolution_time_ms;
    s.materialized = false;
  } else {
    throw MarketNotFoundError("Market not found", {{"market_id", market_id}});
  }

  s.yes_price = PricingCurve::price(s.yes_pool, s.no_pool, domain::Outcome::Yes);
  s.no_price = Decimal::one() - s.yes_price;
  return s;
}

// -----------------------------------------------------------------------------
// resolve()
// -----------------------------------------------------------------------------
domain::Market MarketLedger::resolve(IMarketRepository& markets,
                                     const std::string& market_id,
                                     domain::Outcome outcome) const {
  std::optional<domain::Market> market = lookup(markets, market_id);
  if (!market) {
    auto question = catalog_.find(market_id);
    if (!question) {
      throw MarketNotFoundError("Market not found", {{"market_id", market_id}});
    }
    market = createMarket(markets, question->id, question->text,
                          question->resolution_time_ms,
                          defaults_.seed_liquidity);
  }

  if (market->resolved) {
    throw MarketResolvedError(
        "Market is already resolved",
        {{"market_id", market->id},
         {"resolution", market->resolution
                            ? domain::outcomeToString(*market->resolution)
                            : "none"}});
  }

  market->resolved = true;
  market->resolution = outcome;
  markets.save(*market);
  return *market;
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
std::optional<domain::Market> MarketLedger::lookup(
    IMarketRepository& markets, const std::string& market_id) const {
  if (auto market = markets.find(market_id)) {
    return market;
  }
  if (auto question = catalog_.find(market_id);
      question && question->id != market_id) {
    return markets.find(question->id);
  }
  return std::nullopt;
}

void MarketLedger::requireTradable(const domain::Market& market) const {
  if (market.resolved) {
    throw MarketResolvedError("Market is resolved",
                              {{"market_id", market.id}});
  }
  if (auto question = catalog_.find(market.id);
      question && question->status != domain::QuestionStatus::Active) {
    throw MarketResolvedError(
        "Question is not active",
        {{"market_id", market.id},
         {"status", domain::questionStatusToString(question->status)}});
  }
  if (market.isExpiredAt(clock_.now_ms())) {
    throw MarketExpiredError(
        "Market has expired",
        {{"market_id", market.id},
         {"end_time_ms", std::to_string(*market.end_time_ms)}});
  }
}

}  // namespace predict
