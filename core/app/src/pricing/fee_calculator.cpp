#include "predict/pricing/fee_calculator.hpp"

#include "predict/domain/trade_errors.hpp"

#include <stdexcept>

namespace predict {

FeeCalculator::FeeCalculator(config::FeeSchedule schedule)
    : schedule_(schedule) {
  if (schedule_.precision_digits < 0 ||
      schedule_.precision_digits > Decimal::kScaleDigits) {
    throw std::invalid_argument("FeeCalculator: precision out of range");
  }
}

Decimal FeeCalculator::rate(FeeType type) const {
  return type == FeeType::PredictionBuy ? schedule_.buy_rate
                                        : schedule_.sell_rate;
}

FeeSplit FeeCalculator::computeFee(Decimal gross, FeeType type,
                                   bool has_referrer) const {
  if (gross.isNegative()) {
    throw InvalidTradeSizeError("Fee base must not be negative",
                                {{"gross", gross.toString()},
                                 {"fee_type", feeTypeToString(type)}});
  }

  const int digits = schedule_.precision_digits;

  Decimal fee = gross.mul(rate(type), Decimal::Rounding::Ceiling)
                    .roundTo(digits, Decimal::Rounding::Ceiling);
  if (fee < schedule_.min_fee_amount) {
    fee = Decimal::zero();
  }
  // Rounding up a tiny trade can overshoot the amount itself.
  fee = min(fee, gross);

  FeeSplit split;
  split.fee_charged = fee;
  split.net_amount = gross - fee;
  if (has_referrer && fee.isPositive()) {
    split.referrer_share =
        fee.mul(schedule_.referrer_share, Decimal::Rounding::Floor)
            .roundTo(digits, Decimal::Rounding::Floor);
  }
  split.platform_share = fee - split.referrer_share;
  return split;
}

}  // namespace predict
