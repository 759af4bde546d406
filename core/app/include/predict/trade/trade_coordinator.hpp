#pragma once

#include "predict/concurrent/sequence_generator.hpp"
#include "predict/config/engine_config.hpp"
#include "predict/domain/market.hpp"
#include "predict/domain/position.hpp"
#include "predict/domain/trade_errors.hpp"
#include "predict/domain/wallet.hpp"
#include "predict/eventbus/event_bus.hpp"
#include "predict/ledger/market_ledger.hpp"
#include "predict/ledger/position_book.hpp"
#include "predict/ledger/wallet_ledger.hpp"
#include "predict/pricing/fee_calculator.hpp"
#include "predict/pricing/pricing_curve.hpp"
#include "predict/storage/i_unit_of_work.hpp"
#include "predict/time/i_time_provider.hpp"
#include "predict/trade/trade_receipt.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// TradeCoordinator — runs one trade end-to-end inside one unit of work
// -----------------------------------------------------------------------------
//
// @brief  Sequences the pure calculators and the three ledgers so that a
//         buy or sell either settles completely or leaves no trace.
//
// @details
// Buy:  Validating -> FeeSplit -> Pricing -> Committing -> Settled
//   1. Load the account and the tradable market; check the balance.
//   2. Split the gross amount into fee and net.
//   3. Quote the curve on the net amount.
//   4. Debit the gross amount, apply the quote to the market, credit the
//      position, book the fee and pay the referrer share. Commit.
//
// Sell: Validating -> Pricing -> FeeSplit -> Committing -> Settled
//   1. Load the account, the market and the position being sold.
//   2. Quote the curve on the share count.
//   3. Split the gross proceeds into fee and net.
//   4. Debit the position, apply the quote, credit the net proceeds, record
//      realised P&L, book the fee and pay the referrer share. Commit.
//
// Any TradeError before or during commit discards the unit of work. A
// ConcurrencyConflictError restarts the whole sequence against fresh state,
// up to RetryPolicy::max_attempts, after which TradeConflictError is thrown.
// A store failure during commit is rethrown as CommitFailedError.
//
// After a commit, and outside the retry loop, the coordinator publishes
// TradeSettledEvent on the bus; a rejected request publishes
// TradeRejectedEvent. A throwing subscriber cannot undo or fail a trade.
//
// Thread model:
//   Holds no per-trade state. Every public method may be called from many
//   worker threads at once; isolation comes from the store.
//
// Ownership:
//   Owned by TradingEngine. Borrows every collaborator by reference; the
//   bus pointer may be null.
// -----------------------------------------------------------------------------
class TradeCoordinator {
 public:
  TradeCoordinator(ITransactionalStore& store, const MarketLedger& markets,
                   const PositionBook& positions, const WalletLedger& wallets,
                   const PricingCurve& curve, const FeeCalculator& fees,
                   const ITimeProvider& clock, SequenceGenerator& trade_ids,
                   config::RetryPolicy retry, EventBus* bus = nullptr);

  TradeCoordinator(const TradeCoordinator&) = delete;
  TradeCoordinator& operator=(const TradeCoordinator&) = delete;

  // -------------------------------------------------------------------------
  // buy(request)
  // -------------------------------------------------------------------------
  // What: Spends request.amount (gross, fee included) on shares of
  // request.side, moving the market price toward that side.
  // Why: The only write path for opening or adding to a position; every
  // ledger touched by a buy is updated in one unit of work.
  // Thread-safety: Safe from any thread. Conflicting trades on the same
  // market or wallet are retried against fresh state.
  // Input: request — user, market (id or question number), side, amount.
  // Output: BuyReceipt with the committed prices, fee split and new balance.
  // The debit and any referral credit carry the receipt's trade_id.
  // Throws: any TradeError; nothing is written and TradeRejectedEvent is
  // published with the stage that failed.
  // -------------------------------------------------------------------------
  BuyReceipt buy(const BuyRequest& request);

  // -------------------------------------------------------------------------
  // sell(request)
  // -------------------------------------------------------------------------
  // What: Returns request.shares to the pool for cash, net of the sell fee.
  // When request.side is empty the side is taken from the single position
  // the user holds in the market.
  // Why: Closing or reducing a position before resolution.
  // Thread-safety: As buy().
  // Input: request — user, market, share count, optional side.
  // Output: SellReceipt with proceeds, realised P&L and what remains held.
  // Throws: PositionNotFoundError, InsufficientSharesError (oversized sell,
  // no state change), InvalidRequestError (both sides held, no side given),
  // plus the buy() errors.
  // -------------------------------------------------------------------------
  SellReceipt sell(const SellRequest& request);

  // Prices and pools of one market; a question never traded reports the
  // seed pools without creating a row.
  domain::MarketState getMarketState(const std::string& market_id);

  // Flags the market resolved and publishes MarketResolvedEvent. Further
  // trades fail with MarketResolvedError.
  domain::Market resolveMarket(const std::string& market_id,
                               domain::Outcome outcome);

  // -------------------------------------------------------------------------
  // openAccount(user_id, initial_balance, referrer_id)
  // -------------------------------------------------------------------------
  // What: Creates a wallet, recording the opening balance as a Deposit.
  // Input: referrer_id — must name an existing account other than user_id;
  // that account receives a share of this user's trading fees.
  // Output: The new account.
  // Throws: AccountExistsError, AccountNotFoundError (unknown referrer),
  // InvalidRequestError (self-referral or negative balance).
  // -------------------------------------------------------------------------
  domain::WalletAccount openAccount(const std::string& user_id,
                                    Decimal initial_balance,
                                    const std::optional<std::string>& referrer_id);

  domain::WalletAccount wallet(const std::string& user_id);

  // Open positions of user_id in market_id, at most one per side.
  std::vector<domain::Position> holdings(const std::string& user_id,
                                         const std::string& market_id);

  // Every transaction on the wallet, oldest first.
  std::vector<domain::Transaction> transactions(const std::string& user_id);

 private:
  // A committed trade and the event announcing it. Built inside the retried
  // attempt, published once withRetry() has returned.
  template <typename Receipt>
  struct Settlement {
    Receipt receipt;
    TradeSettledEvent event;
  };

  // Calls attempt(n) for n = 1, 2, ... until it returns without a
  // ConcurrencyConflictError or the retry budget is spent.
  template <typename Fn>
  std::invoke_result_t<Fn&, int> withRetry(const char* operation,
                                           const std::string& subject,
                                           Fn&& attempt);

  Settlement<BuyReceipt> attemptBuy(const BuyRequest& request,
                                    const std::string& trade_id, int attempt,
                                    TradeStage& stage);

  Settlement<SellReceipt> attemptSell(const SellRequest& request,
                                      const std::string& trade_id,
                                      int attempt, TradeStage& stage);

  domain::Outcome resolveSellSide(IPositionRepository& positions,
                                  const SellRequest& request,
                                  const std::string& market_id) const;

  void bookFees(IUnitOfWork& uow, const std::string& user_id,
                const std::optional<std::string>& referrer_id,
                const FeeSplit& fee, const std::string& trade_id) const;

  // Commits; non-domain failures are rolled back and become
  // CommitFailedError.
  void commit(IUnitOfWork& uow, const std::string& subject) const;

  // Offers the event to the bus, if any. Subscriber exceptions are logged.
  void publish(const Event& event);

  TradeSettledEvent settledEvent(TradeAction action,
                                 const std::string& trade_id,
                                 const std::string& user_id,
                                 domain::Outcome side, Decimal amount,
                                 Decimal shares, Decimal fee,
                                 const CommittedTrade& committed,
                                 Decimal impact);

  void publishRejected(TradeAction action, const std::string& trade_id,
                       const std::string& user_id,
                       const std::string& market_id, TradeStage stage,
                       const TradeError& error);

  ITransactionalStore& store_;
  const MarketLedger& markets_;
  const PositionBook& positions_;
  const WalletLedger& wallets_;
  const PricingCurve& curve_;
  const FeeCalculator& fees_;
  const ITimeProvider& clock_;
  SequenceGenerator& trade_ids_;
  const config::RetryPolicy retry_;
  EventBus* bus_;
  SequenceGenerator event_seq_;
};

}  // namespace predict
