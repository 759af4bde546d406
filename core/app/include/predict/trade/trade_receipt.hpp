#pragma once

#include "predict/domain/decimal.hpp"
#include "predict/domain/outcome.hpp"
#include "predict/pricing/fee_calculator.hpp"

#include <optional>
#include <string>

namespace predict {

// Lifecycle of one request inside TradeCoordinator. Buys run FeeSplit
// before Pricing because the curve is quoted on the net amount.
enum class TradeStage {
  Validating,
  FeeSplit,
  Pricing,
  Committing,
  Settled,
};

inline const char* tradeStageToString(TradeStage s) {
  switch (s) {
    case TradeStage::Validating: return "Validating";
    case TradeStage::FeeSplit:   return "FeeSplit";
    case TradeStage::Pricing:    return "Pricing";
    case TradeStage::Committing: return "Committing";
    case TradeStage::Settled:    return "Settled";
  }
  return "Unknown";
}

struct BuyRequest {
  std::string user_id;
  std::string market_id;        // Market id or question number
  domain::Outcome side{domain::Outcome::Yes};
  Decimal amount;               // Gross cash, fee included
};

struct SellRequest {
  std::string user_id;
  std::string market_id;
  Decimal shares;
  std::optional<domain::Outcome> side;  // Inferred when only one side is held
};

struct BuyReceipt {
  std::string trade_id;
  std::string market_id;
  domain::Outcome side{domain::Outcome::Yes};
  Decimal shares_bought;
  Decimal avg_price;
  FeeSplit fee;
  Decimal yes_price;
  Decimal no_price;
  Decimal price_impact;
  Decimal liquidity;
  Decimal new_balance;
  Decimal position_shares;      // Holding on this side after the trade
  int attempts{1};
};

struct SellReceipt {
  std::string trade_id;
  std::string market_id;
  domain::Outcome side{domain::Outcome::Yes};
  Decimal shares_sold;
  Decimal gross_proceeds;
  Decimal net_proceeds;
  FeeSplit fee;
  Decimal realized_pnl;
  Decimal yes_price;
  Decimal no_price;
  Decimal price_impact;
  Decimal liquidity;
  Decimal new_balance;
  Decimal remaining_shares;
  bool position_closed{false};
  int attempts{1};
};

}  // namespace predict
