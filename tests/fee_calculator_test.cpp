// =============================================================================
// fee_calculator_test.cpp
// =============================================================================
// Unit tests for predict::FeeCalculator.
//
// Validates:
//   - fee + net == gross for every split
//   - Fees round up to the configured precision
//   - Referrer share rounds down; the platform keeps the remainder
//   - Minimum-fee waiver and the cap at the gross amount
//   - Separate buy and sell rates
// =============================================================================

#include "predict/domain/trade_errors.hpp"
#include "predict/pricing/fee_calculator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using predict::Decimal;
using predict::FeeCalculator;
using predict::FeeSplit;
using predict::FeeType;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

predict::config::FeeSchedule twoPercent() {
  predict::config::FeeSchedule s;
  s.buy_rate = D("0.02");
  s.sell_rate = D("0.01");
  s.referrer_share = D("0.5");
  s.precision_digits = 2;
  s.min_fee_amount = Decimal::zero();
  return s;
}

}  // namespace

class FeeCalculatorTest : public ::testing::Test {
 protected:
  FeeCalculator fees{twoPercent()};
};

// -----------------------------------------------------------------------------
// 1. $100 at 2%: fee 2, net 98.
// -----------------------------------------------------------------------------
TEST_F(FeeCalculatorTest, SimpleSplit) {
  FeeSplit split = fees.computeFee(D("100"), FeeType::PredictionBuy, false);

  EXPECT_EQ(split.fee_charged, D("2"));
  EXPECT_EQ(split.net_amount, D("98"));
  EXPECT_TRUE(split.referrer_share.isZero());
  EXPECT_EQ(split.platform_share, D("2"));
}

// -----------------------------------------------------------------------------
// 2. 10.01 * 2% = 0.2002, charged as 0.21.
// -----------------------------------------------------------------------------
TEST_F(FeeCalculatorTest, FeeRoundsUpToPrecision) {
  FeeSplit split = fees.computeFee(D("10.01"), FeeType::PredictionBuy, false);

  EXPECT_EQ(split.fee_charged, D("0.21"));
  EXPECT_EQ(split.net_amount, D("9.8"));
  EXPECT_EQ(split.fee_charged + split.net_amount, D("10.01"));
}

// -----------------------------------------------------------------------------
// 3. Referral split: half of 0.21 is 0.105, paid out as 0.10.
// -----------------------------------------------------------------------------
TEST_F(FeeCalculatorTest, ReferrerShareRoundsDown) {
  FeeSplit even = fees.computeFee(D("100"), FeeType::PredictionBuy, true);
  EXPECT_EQ(even.referrer_share, D("1"));
  EXPECT_EQ(even.platform_share, D("1"));

  FeeSplit odd = fees.computeFee(D("10.01"), FeeType::PredictionBuy, true);
  EXPECT_EQ(odd.referrer_share, D("0.1"));
  EXPECT_EQ(odd.platform_share, D("0.11"));
  EXPECT_EQ(odd.referrer_share + odd.platform_share, odd.fee_charged);
}

// -----------------------------------------------------------------------------
// 4. Buy and sell use their own rates.
// -----------------------------------------------------------------------------
TEST_F(FeeCalculatorTest, SellRateIsSeparate) {
  EXPECT_EQ(fees.rate(FeeType::PredictionBuy), D("0.02"));
  EXPECT_EQ(fees.rate(FeeType::PredictionSell), D("0.01"));

  FeeSplit split = fees.computeFee(D("100"), FeeType::PredictionSell, false);
  EXPECT_EQ(split.fee_charged, D("1"));
  EXPECT_EQ(split.net_amount, D("99"));
}

// -----------------------------------------------------------------------------
// 5. Fees below the minimum are waived entirely.
// -----------------------------------------------------------------------------
TEST(FeeCalculatorScheduleTest, FeeBelowMinimumIsWaived) {
  auto schedule = twoPercent();
  schedule.min_fee_amount = D("0.5");
  FeeCalculator fees(schedule);

  FeeSplit small = fees.computeFee(D("10"), FeeType::PredictionBuy, true);
  EXPECT_TRUE(small.fee_charged.isZero());
  EXPECT_EQ(small.net_amount, D("10"));
  EXPECT_TRUE(small.referrer_share.isZero());

  FeeSplit large = fees.computeFee(D("50"), FeeType::PredictionBuy, false);
  EXPECT_EQ(large.fee_charged, D("1"));
}

// -----------------------------------------------------------------------------
// 6. Rounding up a tiny amount can never charge more than the amount.
// -----------------------------------------------------------------------------
TEST_F(FeeCalculatorTest, FeeIsCappedAtGross) {
  FeeSplit split = fees.computeFee(D("0.001"), FeeType::PredictionBuy, false);

  EXPECT_EQ(split.fee_charged, D("0.001"));
  EXPECT_TRUE(split.net_amount.isZero());
}

TEST_F(FeeCalculatorTest, ZeroAndNegativeGross) {
  FeeSplit zero = fees.computeFee(Decimal::zero(), FeeType::PredictionBuy, true);
  EXPECT_TRUE(zero.fee_charged.isZero());
  EXPECT_TRUE(zero.net_amount.isZero());

  EXPECT_THROW(fees.computeFee(D("-1"), FeeType::PredictionBuy, false),
               predict::InvalidTradeSizeError);
}

TEST(FeeCalculatorScheduleTest, PrecisionOutOfRangeIsRejected) {
  auto schedule = twoPercent();
  schedule.precision_digits = 9;
  EXPECT_THROW(FeeCalculator{schedule}, std::invalid_argument);
}
