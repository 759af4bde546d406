// =============================================================================
// decimal_test.cpp
// =============================================================================
// Unit tests for predict::Decimal and the wide:: helpers.
//
// Validates:
//   - Parsing: accepted and rejected forms, sign, fractional digit limit
//   - Formatting: shortest form and fixed digits
//   - Each rounding mode on positive and negative values
//   - 128-bit intermediates in mul/div
//   - Overflow detection
//   - Integer square root (floor and ceiling)
// =============================================================================

#include "predict/domain/decimal.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

using predict::Decimal;
using Rounding = predict::Decimal::Rounding;

static Decimal D(const char* text) { return Decimal::parse(text); }

// -----------------------------------------------------------------------------
// 1. Parsing accepts plain decimal text only.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ParseAcceptedForms) {
  EXPECT_EQ(D("1").raw(), Decimal::kScale);
  EXPECT_EQ(D("-0.5").raw(), -50'000'000);
  EXPECT_EQ(D("+42.00000001").raw(), 4'200'000'001);
  EXPECT_EQ(D(".25").raw(), 25'000'000);
  EXPECT_EQ(D("7.").raw(), 7 * Decimal::kScale);
}

TEST(DecimalTest, ParseRejectedForms) {
  EXPECT_FALSE(Decimal::tryParse("").has_value());
  EXPECT_FALSE(Decimal::tryParse("-").has_value());
  EXPECT_FALSE(Decimal::tryParse(".").has_value());
  EXPECT_FALSE(Decimal::tryParse("1e5").has_value());
  EXPECT_FALSE(Decimal::tryParse(" 1").has_value());
  EXPECT_FALSE(Decimal::tryParse("1.000000001").has_value());  // 9 digits
  EXPECT_FALSE(Decimal::tryParse("99999999999999999999").has_value());
  EXPECT_THROW(Decimal::parse("abc"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. Formatting.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ToStringIsShortestExactForm) {
  EXPECT_EQ(D("98").toString(), "98");
  EXPECT_EQ(D("0.50").toString(), "0.5");
  EXPECT_EQ(D("-12.00000001").toString(), "-12.00000001");
  EXPECT_EQ(Decimal::zero().toString(), "0");
}

TEST(DecimalTest, ToFixedRoundsHalfUp) {
  EXPECT_EQ(D("0.545").toFixed(2), "0.55");
  EXPECT_EQ(D("0.544").toFixed(2), "0.54");
  EXPECT_EQ(D("-0.545").toFixed(2), "-0.55");
  EXPECT_EQ(D("3").toFixed(0), "3");
  EXPECT_EQ(D("1.5").toFixed(3), "1.500");
}

// -----------------------------------------------------------------------------
// 3. Rounding modes.
// Why: ledger code depends on Floor/Ceiling going toward -inf/+inf, not
//      toward zero, for negative P&L values.
// -----------------------------------------------------------------------------
TEST(DecimalTest, RoundToModes) {
  EXPECT_EQ(D("1.234").roundTo(2, Rounding::Floor), D("1.23"));
  EXPECT_EQ(D("1.231").roundTo(2, Rounding::Ceiling), D("1.24"));
  EXPECT_EQ(D("1.235").roundTo(2, Rounding::HalfUp), D("1.24"));
  EXPECT_EQ(D("1.2349").roundTo(2, Rounding::HalfUp), D("1.23"));

  EXPECT_EQ(D("-1.231").roundTo(2, Rounding::Floor), D("-1.24"));
  EXPECT_EQ(D("-1.239").roundTo(2, Rounding::Ceiling), D("-1.23"));
  EXPECT_EQ(D("-1.235").roundTo(2, Rounding::HalfUp), D("-1.24"));

  EXPECT_EQ(D("2.5").roundTo(8, Rounding::Floor), D("2.5"));
  EXPECT_THROW(D("1").roundTo(9, Rounding::Floor), std::invalid_argument);
}

TEST(DecimalTest, DivisionRounding) {
  const Decimal one = Decimal::one();
  const Decimal three = Decimal::fromUnits(3);

  EXPECT_EQ(one.div(three, Rounding::Floor).raw(), 33'333'333);
  EXPECT_EQ(one.div(three, Rounding::Ceiling).raw(), 33'333'334);
  EXPECT_EQ(D("2").div(three, Rounding::HalfUp).raw(), 66'666'667);
  EXPECT_EQ((-one).div(three, Rounding::Floor).raw(), -33'333'334);

  EXPECT_THROW(one.div(Decimal::zero(), Rounding::HalfUp), std::domain_error);
}

// -----------------------------------------------------------------------------
// 4. mul/div widen to 128 bits before rounding.
// -----------------------------------------------------------------------------
TEST(DecimalTest, WideIntermediatesDoNotOverflow) {
  // The raw product of 1e5 * 1e5 is 1e26, far outside int64.
  const Decimal big = Decimal::fromUnits(100'000);
  EXPECT_EQ(big.mul(big, Rounding::HalfUp).div(big, Rounding::HalfUp), big);

  EXPECT_EQ(D("0.001").mul(D("100"), Rounding::Ceiling), D("0.1"));
  EXPECT_EQ(D("0.00000001").mul(D("0.5"), Rounding::Ceiling).raw(), 1);
  EXPECT_EQ(D("0.00000001").mul(D("0.5"), Rounding::Floor).raw(), 0);
}

TEST(DecimalTest, OverflowIsDetected) {
  const Decimal max = Decimal::fromRaw(std::numeric_limits<std::int64_t>::max());
  EXPECT_THROW(max + Decimal::fromRaw(1), std::overflow_error);
  EXPECT_THROW(-max - Decimal::fromRaw(2), std::overflow_error);
  EXPECT_THROW(Decimal::fromUnits(1'000'000'000'000), std::overflow_error);
  EXPECT_THROW(max.mul(D("2"), Rounding::Floor), std::overflow_error);
}

// -----------------------------------------------------------------------------
// 5. Square roots.
// -----------------------------------------------------------------------------
TEST(DecimalTest, IntegerSquareRoot) {
  namespace wide = predict::wide;
  auto root = [](wide::Int128 v, Rounding mode) {
    return static_cast<std::int64_t>(wide::isqrt(v, mode));
  };
  EXPECT_EQ(root(0, Rounding::Floor), 0);
  EXPECT_EQ(root(1, Rounding::Ceiling), 1);
  EXPECT_EQ(root(15, Rounding::Floor), 3);
  EXPECT_EQ(root(15, Rounding::Ceiling), 4);
  EXPECT_EQ(root(16, Rounding::Ceiling), 4);

  const wide::Int128 big = wide::Int128{1'000'000'007} * 1'000'000'007;
  EXPECT_EQ(root(big, Rounding::Floor), 1'000'000'007);
  EXPECT_EQ(root(big + 1, Rounding::Ceiling), 1'000'000'008);

  EXPECT_THROW(wide::isqrt(-1, Rounding::Floor), std::domain_error);
}

TEST(DecimalTest, ComparisonsAndHelpers) {
  EXPECT_LT(D("0.1"), D("0.2"));
  EXPECT_EQ(predict::min(D("3"), D("2")), D("2"));
  EXPECT_EQ(D("-4.5").abs(), D("4.5"));
  EXPECT_TRUE(Decimal::zero().isZero());
  EXPECT_TRUE(D("-0.00000001").isNegative());
}
