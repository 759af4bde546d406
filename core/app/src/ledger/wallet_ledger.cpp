#include "predict/ledger/wallet_ledger.hpp"

#include "predict/domain/trade_errors.hpp"

#include <utility>

namespace predict {

namespace {

void requireNonNegative(Decimal amount, const std::string& user_id,
                        const char* what) {
  if (amount.isNegative()) {
    throw InvalidTradeSizeError(std::string(what) + " must not be negative",
                                {{"user_id", user_id},
                                 {"amount", amount.toString()}});
  }
}

}  // namespace

WalletLedger::WalletLedger(const ITimeProvider& clock) : clock_(clock) {}

// -----------------------------------------------------------------------------
// openAccount()
// -----------------------------------------------------------------------------
domain::WalletAccount WalletLedger::openAccount(
    IWalletRepository& wallets, const std::string& user_id,
    Decimal initial_balance,
    const std::optional<std::string>& referrer_id) const {
  if (user_id.empty()) {
    throw InvalidRequestError("user_id must not be empty");
  }
  if (initial_balance.isNegative()) {
    throw InvalidRequestError("Initial balance must not be negative",
                              {{"user_id", user_id},
                               {"balance", initial_balance.toString()}});
  }
  if (wallets.findAccount(user_id)) {
    throw AccountExistsError("Account already exists", {{"user_id", user_id}});
  }
  if (referrer_id) {
    if (*referrer_id == user_id) {
      throw InvalidRequestError("A user cannot refer themselves",
                                {{"user_id", user_id}});
    }
    if (!wallets.findAccount(*referrer_id)) {
      throw AccountNotFoundError("Referrer account not found",
                                 {{"referrer_id", *referrer_id}});
    }
  }

  domain::WalletAccount account;
  account.user_id = user_id;
  account.referrer_id = referrer_id;
  wallets.saveAccount(account);

  return applyBalanceChange(wallets, account, initial_balance,
                            domain::TransactionType::Deposit, user_id,
                            "Initial deposit");
}

domain::WalletAccount WalletLedger::account(IWalletRepository& wallets,
                                            const std::string& user_id) const {
  auto account = wallets.findAccount(user_id);
  if (!account) {
    throw AccountNotFoundError("Account not found", {{"user_id", user_id}});
  }
  return *account;
}

// -----------------------------------------------------------------------------
// debit() / credit()
// -----------------------------------------------------------------------------
domain::WalletAccount WalletLedger::debit(IWalletRepository& wallets,
                                          const std::string& user_id,
                                          Decimal amount,
                                          domain::TransactionType type,
                                          const std::string& reference_id,
                                          const std::string& description) const {
  requireNonNegative(amount, user_id, "Debit amount");
  domain::WalletAccount current = account(wallets, user_id);
  if (current.balance < amount) {
    throw InsufficientFundsError("Insufficient balance",
                                 {{"user_id", user_id},
                                  {"requested", amount.toString()},
                                  {"balance", current.balance.toString()}});
  }
  return applyBalanceChange(wallets, std::move(current), -amount, type,
                            reference_id, description);
}

domain::WalletAccount WalletLedger::credit(IWalletRepository& wallets,
                                           const std::string& user_id,
                                           Decimal amount,
                                           domain::TransactionType type,
                                           const std::string& reference_id,
                                           const std::string& description) const {
  requireNonNegative(amount, user_id, "Credit amount");
  return applyBalanceChange(wallets, account(wallets, user_id), amount, type,
                            reference_id, description);
}

domain::WalletAccount WalletLedger::applyBalanceChange(
    IWalletRepository& wallets, domain::WalletAccount account,
    Decimal signed_amount, domain::TransactionType type,
    const std::string& reference_id, const std::string& description) const {
  domain::Transaction tx;
  tx.user_id = account.user_id;
  tx.type = type;
  tx.amount = signed_amount;
  tx.balance_before = account.balance;
  tx.balance_after = account.balance + signed_amount;
  tx.reference_id = reference_id;
  tx.description = description;
  tx.timestamp_ms = clock_.now_ms();

  account.balance = tx.balance_after;
  wallets.saveAccount(account);
  wallets.appendTransaction(std::move(tx));
  return account;
}

// -----------------------------------------------------------------------------
// Running totals
// -----------------------------------------------------------------------------
void WalletLedger::recordPnL(IWalletRepository& wallets,
                             const std::string& user_id, Decimal delta) const {
  domain::WalletAccount current = account(wallets, user_id);
  current.lifetime_pnl += delta;
  wallets.saveAccount(current);
}

void WalletLedger::recordFeePaid(IWalletRepository& wallets,
                                 const std::string& user_id,
                                 Decimal fee) const {
  requireNonNegative(fee, user_id, "Fee");
  domain::WalletAccount current = account(wallets, user_id);
  current.total_fees_paid += fee;
  wallets.saveAccount(current);
}

void WalletLedger::recordFeeEarned(IWalletRepository& wallets,
                                   const std::string& user_id,
                                   Decimal amount) const {
  requireNonNegative(amount, user_id, "Earned fee");
  domain::WalletAccount current = account(wallets, user_id);
  current.total_fees_earned += amount;
  wallets.saveAccount(current);
}

std::vector<domain::Transaction> WalletLedger::transactions(
    IWalletRepository& wallets, const std::string& user_id) const {
  account(wallets, user_id);
  return wallets.transactions(user_id);
}

}  // namespace predict
