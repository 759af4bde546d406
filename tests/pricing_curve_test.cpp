// =============================================================================
// pricing_curve_test.cpp
// =============================================================================
// Unit tests for predict::PricingCurve.
//
// Validates:
//   - Spot price of each side and exact complement
//   - Buy quote on a fresh 500/500 pool
//   - Pool conservation on buys and sells
//   - Monotonicity: larger trades move the price further
//   - Buy-then-sell never returns more cash than went in
//   - Price band and size range rejections
//   - Zero-size and negative-size inputs
// =============================================================================

#include "predict/domain/trade_errors.hpp"
#include "predict/pricing/pricing_curve.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

using predict::BuyQuote;
using predict::CurveLimits;
using predict::Decimal;
using predict::PricingCurve;
using predict::SellQuote;
using predict::domain::Outcome;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

CurveLimits defaultLimits() { return CurveLimits{D("0.0001"), D("0.9999")}; }

}  // namespace

class PricingCurveTest : public ::testing::Test {
 protected:
  PricingCurve curve{defaultLimits()};
  const Decimal yes_pool = D("500");
  const Decimal no_pool = D("500");
};

// -----------------------------------------------------------------------------
// 1. Spot prices.
// -----------------------------------------------------------------------------
TEST_F(PricingCurveTest, SpotPriceAndComplement) {
  EXPECT_EQ(PricingCurve::price(yes_pool, no_pool, Outcome::Yes), D("0.5"));
  EXPECT_EQ(PricingCurve::price(yes_pool, no_pool, Outcome::No), D("0.5"));

  EXPECT_EQ(PricingCurve::price(D("1"), D("3"), Outcome::Yes), D("0.25"));
  EXPECT_EQ(PricingCurve::price(D("1"), D("3"), Outcome::No), D("0.75"));

  // 1/3 is not representable; the two sides still sum to exactly one.
  Decimal yes = PricingCurve::price(D("1"), D("2"), Outcome::Yes);
  Decimal no = PricingCurve::price(D("1"), D("2"), Outcome::No);
  EXPECT_EQ(yes, D("0.33333333"));
  EXPECT_EQ(yes + no, Decimal::one());

  EXPECT_THROW(PricingCurve::price(Decimal::zero(), no_pool, Outcome::Yes),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. 98 of net cash into a fresh 500/500 market on YES.
//    shares = 98 * 1098 / 598, rounded down.
// -----------------------------------------------------------------------------
TEST_F(PricingCurveTest, BuyOnFreshMarket) {
  BuyQuote q = curve.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("98"));

  EXPECT_EQ(q.shares_bought.raw(), 17'993'979'933);
  EXPECT_EQ(q.new_yes_pool, D("598"));
  EXPECT_EQ(q.new_no_pool, D("500"));
  EXPECT_EQ(q.price_before, D("0.5"));
  EXPECT_GT(q.price_after, D("0.5"));
  EXPECT_LT(q.price_after, Decimal::one());
  EXPECT_EQ(q.price_after, D("598").div(D("1098"), Decimal::Rounding::HalfUp));
  EXPECT_GT(q.price_impact, Decimal::zero());

  // Every share is filled at the post-trade price.
  EXPECT_GT(q.avg_price, q.price_before);
  EXPECT_LE(q.avg_price, q.price_after);
}

// -----------------------------------------------------------------------------
// 3. Conservation: pools grow by exactly the net cash on a buy and shrink by
//    exactly the gross proceeds on a sell.
// -----------------------------------------------------------------------------
TEST_F(PricingCurveTest, TradesConservePoolTotal) {
  BuyQuote buy = curve.quoteBuy(yes_pool, no_pool, Outcome::No, D("37.5"));
  EXPECT_EQ(buy.new_yes_pool + buy.new_no_pool,
            yes_pool + no_pool + D("37.5"));

  SellQuote sell = curve.quoteSell(buy.new_yes_pool, buy.new_no_pool,
                                   Outcome::No, D("20"));
  EXPECT_EQ(sell.new_yes_pool + sell.new_no_pool,
            buy.new_yes_pool + buy.new_no_pool - sell.gross_proceeds);
  EXPECT_TRUE(sell.new_yes_pool.isPositive());
  EXPECT_TRUE(sell.new_no_pool.isPositive());
  EXPECT_LT(sell.price_after, sell.price_before);
}

// -----------------------------------------------------------------------------
// 4. A larger buy yields more shares but at a worse average price.
// -----------------------------------------------------------------------------
TEST_F(PricingCurveTest, LargerBuysMoveThePriceFurther) {
  BuyQuote small = curve.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("10"));
  BuyQuote large = curve.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("100"));

  EXPECT_GT(large.shares_bought, small.shares_bought);
  EXPECT_GT(large.avg_price, small.avg_price);
  EXPECT_GT(large.price_after, small.price_after);
  EXPECT_GT(large.price_impact, small.price_impact);
}

// -----------------------------------------------------------------------------
// 5. Selling straight back what was just bought returns less than was paid.
// Why: a round trip that paid out more than it took in would drain the pool.
// -----------------------------------------------------------------------------
TEST_F(PricingCurveTest, RoundTripNeverProfits) {
  BuyQuote buy = curve.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("98"));
  SellQuote sell = curve.quoteSell(buy.new_yes_pool, buy.new_no_pool,
                                   Outcome::Yes, buy.shares_bought);

  EXPECT_LT(sell.gross_proceeds, D("98"));
  EXPECT_GT(sell.gross_proceeds, D("90"));
  EXPECT_EQ(sell.avg_price,
            sell.gross_proceeds.div(buy.shares_bought,
                                    Decimal::Rounding::HalfUp));
}

// -----------------------------------------------------------------------------
// 6. Trades that push either side outside the band are rejected.
// -----------------------------------------------------------------------------
TEST_F(PricingCurveTest, PriceBandIsEnforced) {
  PricingCurve narrow{CurveLimits{D("0.05"), D("0.95")}};

  // YES would end at 10500 / 11000 ~ 0.9545.
  EXPECT_THROW(narrow.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("10000")),
               predict::PriceOutOfBoundsError);

  // The complement side is checked too: NO ends below 0.05.
  try {
    narrow.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("10000"));
    FAIL() << "expected PriceOutOfBoundsError";
  } catch (const predict::TradeError& e) {
    EXPECT_EQ(e.code(), predict::ErrorCode::PriceOutOfBounds);
    EXPECT_EQ(e.contextValue("side"), std::optional<std::string>("YES"));
    EXPECT_TRUE(e.contextValue("price_after").has_value());
  }

  EXPECT_NO_THROW(narrow.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("100")));
}

TEST_F(PricingCurveTest, OversizedTradeIsRejected) {
  const Decimal huge = Decimal::fromUnits(20'000'000'000);
  EXPECT_THROW(curve.quoteBuy(yes_pool, no_pool, Outcome::Yes, huge),
               predict::InvalidTradeSizeError);
  EXPECT_THROW(curve.quoteSell(yes_pool, no_pool, Outcome::Yes, huge),
               predict::InvalidTradeSizeError);
}

// -----------------------------------------------------------------------------
// 7. Degenerate sizes.
// -----------------------------------------------------------------------------
TEST_F(PricingCurveTest, ZeroSizeIsANoOpQuote) {
  BuyQuote buy = curve.quoteBuy(yes_pool, no_pool, Outcome::Yes, Decimal::zero());
  EXPECT_TRUE(buy.shares_bought.isZero());
  EXPECT_EQ(buy.new_yes_pool, yes_pool);
  EXPECT_EQ(buy.price_after, buy.price_before);
  EXPECT_TRUE(buy.price_impact.isZero());

  SellQuote sell =
      curve.quoteSell(yes_pool, no_pool, Outcome::No, Decimal::zero());
  EXPECT_TRUE(sell.gross_proceeds.isZero());
  EXPECT_EQ(sell.new_no_pool, no_pool);
}

TEST_F(PricingCurveTest, NegativeSizeIsRejected) {
  EXPECT_THROW(curve.quoteBuy(yes_pool, no_pool, Outcome::Yes, D("-1")),
               predict::InvalidTradeSizeError);
  EXPECT_THROW(curve.quoteSell(yes_pool, no_pool, Outcome::Yes, D("-1")),
               predict::InvalidTradeSizeError);
}

TEST_F(PricingCurveTest, DustSellIsRejected) {
  EXPECT_THROW(
      curve.quoteSell(yes_pool, no_pool, Outcome::Yes, D("0.00000001")),
      predict::InvalidTradeSizeError);
}

TEST(PricingCurveLimitsTest, InvalidBandIsRejected) {
  EXPECT_THROW(PricingCurve(CurveLimits{D("0"), D("0.9")}),
               std::invalid_argument);
  EXPECT_THROW(PricingCurve(CurveLimits{D("0.1"), D("1")}),
               std::invalid_argument);
  EXPECT_THROW(PricingCurve(CurveLimits{D("0.6"), D("0.4")}),
               std::invalid_argument);
}
