#pragma once

#include "predict/domain/wallet.hpp"
#include "predict/storage/i_unit_of_work.hpp"
#include "predict/time/i_time_provider.hpp"

#include <optional>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// WalletLedger — balances, running totals and the transaction log
// -----------------------------------------------------------------------------
//
// @brief  The single place that writes WalletAccount rows and appends
//         Transactions.
//
// @details
// debit() and credit() are the only balance primitives. Each appends one
// immutable Transaction recording the signed amount and the balance before
// and after. debit() refuses to take a balance below zero.
//
// recordPnL(), recordFeePaid() and recordFeeEarned() only move the running
// totals; they never touch the balance.
//
// Every operation on an unknown user throws AccountNotFoundError.
//
// Thread model:
//   Stateless apart from the clock reference; safe from any worker.
// -----------------------------------------------------------------------------
class WalletLedger {
 public:
  explicit WalletLedger(const ITimeProvider& clock);

  // Creates the account and records the initial balance as a Deposit.
  // Throws AccountExistsError, AccountNotFoundError (unknown referrer) or
  // InvalidRequestError (negative balance, self-referral).
  domain::WalletAccount openAccount(IWalletRepository& wallets,
                                    const std::string& user_id,
                                    Decimal initial_balance,
                                    const std::optional<std::string>& referrer_id) const;

  domain::WalletAccount account(IWalletRepository& wallets,
                                const std::string& user_id) const;

  // -------------------------------------------------------------------------
  // debit(wallets, user_id, amount, type, reference_id, description)
  // -------------------------------------------------------------------------
  // What: Takes amount off the balance and appends one Transaction with the
  // negated amount and the balance before and after.
  // Why: Together with credit() the only way a balance ever changes, so the
  // transaction log always reconciles to the balance.
  // Thread-safety: Stateless; isolation comes from the caller's unit of
  // work, which stages the row until commit.
  // Input: reference_id — the trade (or user, for deposits) that caused the
  // change; description — free text for statements.
  // Output: The account as staged after the debit.
  // Throws: AccountNotFoundError, InsufficientFundsError when balance <
  // amount, InvalidTradeSizeError when amount is negative.
  // -------------------------------------------------------------------------
  domain::WalletAccount debit(IWalletRepository& wallets,
                              const std::string& user_id, Decimal amount,
                              domain::TransactionType type,
                              const std::string& reference_id,
                              const std::string& description) const;

  // Mirror of debit(); adds amount. Throws AccountNotFoundError or
  // InvalidTradeSizeError (negative amount).
  domain::WalletAccount credit(IWalletRepository& wallets,
                               const std::string& user_id, Decimal amount,
                               domain::TransactionType type,
                               const std::string& reference_id,
                               const std::string& description) const;

  // -------------------------------------------------------------------------
  // recordPnL() / recordFeePaid() / recordFeeEarned()
  // -------------------------------------------------------------------------
  // What: Add to lifetime_pnl, total_fees_paid and total_fees_earned.
  // Why: Statement totals kept next to the balance so reads need no scan of
  // the transaction log. None of them writes a Transaction.
  // Input: delta may be negative (a loss); fee and amount may not.
  // -------------------------------------------------------------------------
  void recordPnL(IWalletRepository& wallets, const std::string& user_id,
                 Decimal delta) const;

  void recordFeePaid(IWalletRepository& wallets, const std::string& user_id,
                     Decimal fee) const;

  void recordFeeEarned(IWalletRepository& wallets, const std::string& user_id,
                       Decimal amount) const;

  // Oldest first. Empty for an account with no history.
  std::vector<domain::Transaction> transactions(
      IWalletRepository& wallets, const std::string& user_id) const;

 private:
  domain::WalletAccount applyBalanceChange(IWalletRepository& wallets,
                                           domain::WalletAccount account,
                                           Decimal signed_amount,
                                           domain::TransactionType type,
                                           const std::string& reference_id,
                                           const std::string& description) const;

  const ITimeProvider& clock_;
};

}  // namespace predict
