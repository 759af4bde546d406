#include "predict/trade/trade_coordinator.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <thread>
#include <utility>

namespace predict {

namespace {

void requireIdentifiers(const std::string& user_id,
                        const std::string& market_id) {
  if (user_id.empty() || market_id.empty()) {
    throw InvalidRequestError("user_id and market_id are required",
                              {{"user_id", user_id}, {"market_id", market_id}});
  }
}

}  // namespace

TradeCoordinator::TradeCoordinator(ITransactionalStore& store,
                                   const MarketLedger& markets,
                                   const PositionBook& positions,
                                   const WalletLedger& wallets,
                                   const PricingCurve& curve,
                                   const FeeCalculator& fees,
                                   const ITimeProvider& clock,
                                   SequenceGenerator& trade_ids,
                                   config::RetryPolicy retry, EventBus* bus)
    : store_(store),
      markets_(markets),
      positions_(positions),
      wallets_(wallets),
      curve_(curve),
      fees_(fees),
      clock_(clock),
      trade_ids_(trade_ids),
      retry_(retry),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// withRetry(): optimistic-concurrency retry loop
// -----------------------------------------------------------------------------
template <typename Fn>
std::invoke_result_t<Fn&, int> TradeCoordinator::withRetry(
    const char* operation, const std::string& subject, Fn&& attempt) {
  for (int n = 1;; ++n) {
    try {
      return attempt(n);
    } catch (const ConcurrencyConflictError& e) {
      if (n >= retry_.max_attempts) {
        std::cerr << "[TradeCoordinator] " << operation << " " << subject
                  << " gave up after " << n << " attempt(s): " << e.what()
                  << "\n";
        throw TradeConflictError(
            "Too many concurrent updates; please retry",
            {{"operation", operation},
             {"subject", subject},
             {"attempts", std::to_string(n)}});
      }
      std::cerr << "[TradeCoordinator] " << operation << " " << subject
                << " conflict on attempt " << n << " (" << e.what()
                << "), retrying.\n";
      if (retry_.backoff_ms > 0) {
        std::this_thread::sleep_for(
            std::chrono::milliseconds(retry_.backoff_ms * n));
      }
    }
  }
}

// -----------------------------------------------------------------------------
// buy()
// -----------------------------------------------------------------------------
BuyReceipt TradeCoordinator::buy(const BuyRequest& request) {
  const std::string trade_id = trade_ids_.next_label();
  TradeStage stage = TradeStage::Validating;
  Settlement<BuyReceipt> settled;

  try {
    requireIdentifiers(request.user_id, request.market_id);
    if (!request.amount.isPositive()) {
      throw InvalidTradeSizeError("Trade amount must be positive",
                                  {{"market_id", request.market_id},
                                   {"amount", request.amount.toString()}});
    }
    settled = withRetry("buy", trade_id, [&](int attempt) {
      return attemptBuy(request, trade_id, attempt, stage);
    });
  } catch (const TradeError& e) {
    publishRejected(TradeAction::Buy, trade_id, request.user_id,
                    request.market_id, stage, e);
    throw;
  }

  // Committed; nothing past this point may fail the trade.
  publish(settled.event);
  return settled.receipt;
}

TradeCoordinator::Settlement<BuyReceipt> TradeCoordinator::attemptBuy(const BuyRequest& request,
                                        const std::string& trade_id,
                                        int attempt, TradeStage& stage) {
  // --- 1) Validating --------------------------------------------------------
  stage = TradeStage::Validating;
  std::unique_ptr<IUnitOfWork> uow = store_.begin();

  const domain::WalletAccount account =
      wallets_.account(uow->wallets(), request.user_id);
  const domain::Market market =
      markets_.loadTradable(uow->markets(), request.market_id);
  if (account.balance < request.amount) {
    throw InsufficientFundsError("Insufficient balance",
                                 {{"market_id", market.id},
                                  {"requested", request.amount.toString()},
                                  {"balance", account.balance.toString()}});
  }

  // --- 2) FeeSplit ----------------------------------------------------------
  stage = TradeStage::FeeSplit;
  const FeeSplit fee = fees_.computeFee(request.amount, FeeType::PredictionBuy,
                                        account.referrer_id.has_value());
  if (!fee.net_amount.isPositive()) {
    throw InvalidTradeSizeError("Trade amount too low after fees",
                                {{"market_id", market.id},
                                 {"amount", request.amount.toString()},
                                 {"fee", fee.fee_charged.toString()}});
  }

  // --- 3) Pricing -----------------------------------------------------------
  stage = TradeStage::Pricing;
  const BuyQuote quote = curve_.quoteBuy(market.yes_pool, market.no_pool,
                                         request.side, fee.net_amount);

  // --- 4) Committing --------------------------------------------------------
  stage = TradeStage::Committing;
  const std::string side_name = domain::outcomeToString(request.side);
  const domain::WalletAccount debited = wallets_.debit(
      uow->wallets(), request.user_id, request.amount,
      domain::TransactionType::PredictionBuy, trade_id,
      "Bought " + quote.shares_bought.toFixed(2) + " " + side_name +
          " shares in " + market.id);
  const CommittedBuy committed =
      markets_.applyBuy(uow->markets(), market, quote, fee.net_amount);
  const domain::Position position =
      positions_.credit(uow->positions(), request.user_id, market.id,
                        request.side, quote.shares_bought, quote.avg_price);
  bookFees(*uow, request.user_id, account.referrer_id, fee, trade_id);
  commit(*uow, trade_id);
  stage = TradeStage::Settled;

  BuyReceipt receipt;
  receipt.trade_id = trade_id;
  receipt.market_id = market.id;
  receipt.side = request.side;
  receipt.shares_bought = quote.shares_bought;
  receipt.avg_price = quote.avg_price;
  receipt.fee = fee;
  receipt.yes_price = committed.yes_price;
  receipt.no_price = committed.no_price;
  receipt.price_impact = quote.price_impact;
  receipt.liquidity = committed.market.liquidity;
  receipt.new_balance = debited.balance;
  receipt.position_shares = position.shares;
  receipt.attempts = attempt;

  std::cout << "[TradeCoordinator] " << trade_id << " BUY " << side_name
            << " market=" << market.id << " user=" << request.user_id
            << " amount=" << request.amount << " fee=" << fee.fee_charged
            << " shares=" << quote.shares_bought
            << " yes_price=" << committed.yes_price << "\n";

  return {receipt,
          settledEvent(TradeAction::Buy, trade_id, request.user_id,
                       request.side, request.amount, quote.shares_bought,
                       fee.fee_charged, committed, quote.price_impact)};
}

// -----------------------------------------------------------------------------
// sell()
// -----------------------------------------------------------------------------
SellReceipt TradeCoordinator::sell(const SellRequest& request) {
  const std::string trade_id = trade_ids_.next_label();
  TradeStage stage = TradeStage::Validating;
  Settlement<SellReceipt> settled;

  try {
    requireIdentifiers(request.user_id, request.market_id);
    if (!request.shares.isPositive()) {
      throw InvalidTradeSizeError("Share count must be positive",
                                  {{"market_id", request.market_id},
                                   {"shares", request.shares.toString()}});
    }
    settled = withRetry("sell", trade_id, [&](int attempt) {
      return attemptSell(request, trade_id, attempt, stage);
    });
  } catch (const TradeError& e) {
    publishRejected(TradeAction::Sell, trade_id, request.user_id,
                    request.market_id, stage, e);
    throw;
  }

  publish(settled.event);
  return settled.receipt;
}

TradeCoordinator::Settlement<SellReceipt> TradeCoordinator::attemptSell(const SellRequest& request,
                                          const std::string& trade_id,
                                          int attempt, TradeStage& stage) {
  // --- 1) Validating --------------------------------------------------------
  stage = TradeStage::Validating;
  std::unique_ptr<IUnitOfWork> uow = store_.begin();

  const domain::WalletAccount account =
      wallets_.account(uow->wallets(), request.user_id);
  const domain::Market market =
      markets_.loadTradable(uow->markets(), request.market_id);
  const domain::Outcome side =
      resolveSellSide(uow->positions(), request, market.id);
  const std::string side_name = domain::outcomeToString(side);

  auto held = positions_.find(uow->positions(), request.user_id, market.id, side);
  if (!held) {
    throw PositionNotFoundError("No position in this market",
                                {{"market_id", market.id}, {"side", side_name}});
  }
  if (request.shares > held->shares) {
    throw InsufficientSharesError("Not enough shares to sell",
                                  {{"market_id", market.id},
                                   {"side", side_name},
                                   {"requested", request.shares.toString()},
                                   {"held", held->shares.toString()}});
  }

  // --- 2) Pricing -----------------------------------------------------------
  stage = TradeStage::Pricing;
  const SellQuote quote = curve_.quoteSell(market.yes_pool, market.no_pool,
                                           side, request.shares);

  // --- 3) FeeSplit ----------------------------------------------------------
  stage = TradeStage::FeeSplit;
  const FeeSplit fee =
      fees_.computeFee(quote.gross_proceeds, FeeType::PredictionSell,
                       account.referrer_id.has_value());
  if (!fee.net_amount.isPositive()) {
    throw InvalidTradeSizeError("Trade amount too low after fees",
                                {{"market_id", market.id},
                                 {"gross", quote.gross_proceeds.toString()},
                                 {"fee", fee.fee_charged.toString()}});
  }

  // --- 4) Committing --------------------------------------------------------
  stage = TradeStage::Committing;
  // P&L is measured on what the trader actually receives.
  const Decimal net_fill_price =
      fee.net_amount.div(request.shares, Decimal::Rounding::HalfUp);
  const PositionDebit debit =
      positions_.debit(uow->positions(), request.user_id, market.id, side,
                       request.shares, net_fill_price);
  const CommittedSell committed =
      markets_.applySell(uow->markets(), market, quote);
  const domain::WalletAccount credited = wallets_.credit(
      uow->wallets(), request.user_id, fee.net_amount,
      domain::TransactionType::PredictionSell, trade_id,
      "Sold " + request.shares.toFixed(2) + " " + side_name + " shares in " +
          market.id);
  wallets_.recordPnL(uow->wallets(), request.user_id, debit.realized_pnl);
  bookFees(*uow, request.user_id, account.referrer_id, fee, trade_id);
  commit(*uow, trade_id);
  stage = TradeStage::Settled;

  SellReceipt receipt;
  receipt.trade_id = trade_id;
  receipt.market_id = market.id;
  receipt.side = side;
  receipt.shares_sold = request.shares;
  receipt.gross_proceeds = quote.gross_proceeds;
  receipt.net_proceeds = fee.net_amount;
  receipt.fee = fee;
  receipt.realized_pnl = debit.realized_pnl;
  receipt.yes_price = committed.yes_price;
  receipt.no_price = committed.no_price;
  receipt.price_impact = quote.price_impact;
  receipt.liquidity = committed.market.liquidity;
  receipt.new_balance = credited.balance;
  receipt.remaining_shares = debit.remaining_shares;
  receipt.position_closed = debit.closed;
  receipt.attempts = attempt;

  std::cout << "[TradeCoordinator] " << trade_id << " SELL " << side_name
            << " market=" << market.id << " user=" << request.user_id
            << " shares=" << request.shares << " net=" << fee.net_amount
            << " pnl=" << debit.realized_pnl
            << " yes_price=" << committed.yes_price << "\n";

  return {receipt,
          settledEvent(TradeAction::Sell, trade_id, request.user_id, side,
                       quote.gross_proceeds, request.shares, fee.fee_charged,
                       committed, quote.price_impact)};
}

domain::Outcome TradeCoordinator::resolveSellSide(
    IPositionRepository& positions, const SellRequest& request,
    const std::string& market_id) const {
  if (request.side) {
    return *request.side;
  }

  std::vector<domain::Position> held =
      positions_.holdings(positions, request.user_id, market_id);
  if (held.empty()) {
    throw PositionNotFoundError("No position in this market",
                                {{"market_id", market_id}});
  }
  if (held.size() > 1) {
    throw InvalidRequestError(
        "Positions held on both sides; specify which side to sell",
        {{"market_id", market_id}});
  }
  return held.front().side;
}

// -----------------------------------------------------------------------------
// Fee bookkeeping and commit
// -----------------------------------------------------------------------------
void TradeCoordinator::bookFees(IUnitOfWork& uow, const std::string& user_id,
                                const std::optional<std::string>& referrer_id,
                                const FeeSplit& fee,
                                const std::string& trade_id) const {
  if (!fee.fee_charged.isPositive()) {
    return;
  }
  wallets_.recordFeePaid(uow.wallets(), user_id, fee.fee_charged);

  if (referrer_id && fee.referrer_share.isPositive()) {
    wallets_.credit(uow.wallets(), *referrer_id, fee.referrer_share,
                    domain::TransactionType::ReferralFeeEarned, trade_id,
                    "Referral fee from " + user_id);
    wallets_.recordFeeEarned(uow.wallets(), *referrer_id, fee.referrer_share);
  }
}

void TradeCoordinator::commit(IUnitOfWork& uow,
                              const std::string& subject) const {
  try {
    uow.commit();
  } catch (const TradeError&) {
    throw;
  } catch (const std::exception& e) {
    uow.rollback();
    std::cerr << "[TradeCoordinator] " << subject
              << " commit failed: " << e.what() << "\n";
    throw CommitFailedError(std::string("Commit failed: ") + e.what(),
                            {{"subject", subject}});
  }
}

// -----------------------------------------------------------------------------
// Read-only queries
// -----------------------------------------------------------------------------
domain::MarketState TradeCoordinator::getMarketState(
    const std::string& market_id) {
  auto uow = store_.begin();
  domain::MarketState state = markets_.state(uow->markets(), market_id);
  uow->rollback();
  return state;
}

domain::WalletAccount TradeCoordinator::wallet(const std::string& user_id) {
  auto uow = store_.begin();
  domain::WalletAccount account = wallets_.account(uow->wallets(), user_id);
  uow->rollback();
  return account;
}

std::vector<domain::Position> TradeCoordinator::holdings(
    const std::string& user_id, const std::string& market_id) {
  auto uow = store_.begin();
  auto result = positions_.holdings(uow->positions(), user_id, market_id);
  uow->rollback();
  return result;
}

std::vector<domain::Transaction> TradeCoordinator::transactions(
    const std::string& user_id) {
  auto uow = store_.begin();
  auto result = wallets_.transactions(uow->wallets(), user_id);
  uow->rollback();
  return result;
}

// -----------------------------------------------------------------------------
// Administrative writes
// -----------------------------------------------------------------------------
domain::Market TradeCoordinator::resolveMarket(const std::string& market_id,
                                               domain::Outcome outcome) {
  domain::Market market = withRetry("resolve", market_id, [&](int) {
    auto uow = store_.begin();
    domain::Market resolved =
        markets_.resolve(uow->markets(), market_id, outcome);
    commit(*uow, market_id);
    return resolved;
  });

  std::cout << "[TradeCoordinator] market " << market.id << " resolved "
            << domain::outcomeToString(outcome) << "\n";

  MarketResolvedEvent event;
  event.market_id = market.id;
  event.outcome = outcome;
  event.timestamp_ms = clock_.now_ms();
  event.sequence_id = event_seq_.next_id();
  publish(event);
  return market;
}

domain::WalletAccount TradeCoordinator::openAccount(
    const std::string& user_id, Decimal initial_balance,
    const std::optional<std::string>& referrer_id) {
  domain::WalletAccount account = withRetry("open_account", user_id, [&](int) {
    auto uow = store_.begin();
    domain::WalletAccount opened = wallets_.openAccount(
        uow->wallets(), user_id, initial_balance, referrer_id);
    commit(*uow, user_id);
    return opened;
  });

  std::cout << "[TradeCoordinator] account " << user_id
            << " opened, balance=" << account.balance << "\n";
  return account;
}

// -----------------------------------------------------------------------------
// Telemetry
// -----------------------------------------------------------------------------
void TradeCoordinator::publish(const Event& event) {
  if (bus_ == nullptr) {
    return;
  }
  // Subscribers run on this thread, after the trade committed.
  try {
    bus_->publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[TradeCoordinator] event subscriber failed: " << e.what()
              << "\n";
  }
}

TradeSettledEvent TradeCoordinator::settledEvent(
    TradeAction action, const std::string& trade_id,
    const std::string& user_id, domain::Outcome side, Decimal amount,
    Decimal shares, Decimal fee, const CommittedTrade& committed,
    Decimal impact) {
  TradeSettledEvent event;
  event.trade_id = trade_id;
  event.user_id = user_id;
  event.market_id = committed.market.id;
  event.action = action;
  event.side = side;
  event.amount = amount;
  event.shares = shares;
  event.fee = fee;
  event.yes_price = committed.yes_price;
  event.no_price = committed.no_price;
  event.yes_pool = committed.market.yes_pool;
  event.no_pool = committed.market.no_pool;
  event.liquidity = committed.market.liquidity;
  event.price_impact = impact;
  event.timestamp_ms = clock_.now_ms();
  event.sequence_id = event_seq_.next_id();
  return event;
}

void TradeCoordinator::publishRejected(TradeAction action,
                                       const std::string& trade_id,
                                       const std::string& user_id,
                                       const std::string& market_id,
                                       TradeStage stage,
                                       const TradeError& error) {
  std::cerr << "[TradeCoordinator] " << trade_id << " "
            << tradeActionToString(action) << " rejected at "
            << tradeStageToString(stage) << ": "
            << errorCodeToString(error.code()) << " (" << error.what()
            << ")\n";

  TradeRejectedEvent event;
  event.trade_id = trade_id;
  event.user_id = user_id;
  event.market_id = market_id;
  event.action = action;
  event.code = error.code();
  event.reason = error.what();
  event.stage = tradeStageToString(stage);
  event.timestamp_ms = clock_.now_ms();
  event.sequence_id = event_seq_.next_id();
  publish(event);
}

}  // namespace predict
