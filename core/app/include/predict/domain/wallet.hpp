#pragma once

#include "predict/domain/decimal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace predict {
namespace domain {

enum class TransactionType {
  Deposit,
  PredictionBuy,
  PredictionSell,
  ReferralFeeEarned,
};

inline const char* transactionTypeToString(TransactionType t) {
  switch (t) {
    case TransactionType::Deposit:           return "deposit";
    case TransactionType::PredictionBuy:     return "pred_buy";
    case TransactionType::PredictionSell:    return "pred_sell";
    case TransactionType::ReferralFeeEarned: return "referral_fee_earned";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// WalletAccount — a user's cash balance and running totals
// -----------------------------------------------------------------------------
// balance is never negative. It changes only through WalletLedger::debit()
// and WalletLedger::credit(), each of which appends a Transaction.
// -----------------------------------------------------------------------------
struct WalletAccount {
  std::string user_id;
  Decimal balance;
  Decimal lifetime_pnl;
  Decimal total_fees_paid;
  Decimal total_fees_earned;
  std::optional<std::string> referrer_id;
};

// Immutable record of one balance change. `amount` is signed: debits are
// negative. The id is assigned by the store when the unit of work commits.
struct Transaction {
  std::string id;
  std::string user_id;
  TransactionType type{TransactionType::Deposit};
  Decimal amount;
  Decimal balance_before;
  Decimal balance_after;
  std::string reference_id;
  std::string description;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace predict
