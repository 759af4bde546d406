#pragma once

#include "predict/config/engine_config.hpp"
#include "predict/domain/decimal.hpp"

namespace predict {

enum class FeeType { PredictionBuy, PredictionSell };

inline const char* feeTypeToString(FeeType t) {
  switch (t) {
    case FeeType::PredictionBuy:  return "prediction_buy";
    case FeeType::PredictionSell: return "prediction_sell";
  }
  return "unknown";
}

struct FeeSplit {
  Decimal fee_charged;
  Decimal net_amount;       // gross - fee_charged
  Decimal referrer_share;   // Zero when the trader has no referrer
  Decimal platform_share;   // fee_charged - referrer_share
};

// -----------------------------------------------------------------------------
// FeeCalculator — splits a gross trade amount into fee and net
// -----------------------------------------------------------------------------
//
// @brief  Pure function of the configured FeeSchedule. No persistence; the
//         coordinator books the result through WalletLedger.
//
// @details
//   fee_charged    = gross * rate(type), rounded UP to precision_digits,
//                    waived (0) when below min_fee_amount, never above gross
//   referrer_share = fee_charged * referrer_share_rate, rounded DOWN
//   platform_share = fee_charged - referrer_share
//
// Thread model: immutable; safe to share between worker threads.
// -----------------------------------------------------------------------------
class FeeCalculator {
 public:
  explicit FeeCalculator(config::FeeSchedule schedule);

  // Throws InvalidTradeSizeError when gross is negative.
  FeeSplit computeFee(Decimal gross, FeeType type, bool has_referrer) const;

  Decimal rate(FeeType type) const;

 private:
  config::FeeSchedule schedule_;
};

}  // namespace predict
