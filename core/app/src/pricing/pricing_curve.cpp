#include "predict/pricing/pricing_curve.hpp"

#include "predict/domain/trade_errors.hpp"

#include <stdexcept>

namespace predict {

namespace {

using domain::Outcome;
using wide::Int128;

constexpr auto kFloor = Decimal::Rounding::Floor;
constexpr auto kCeiling = Decimal::Rounding::Ceiling;
constexpr auto kHalfUp = Decimal::Rounding::HalfUp;

// Totals above this many raw units would overflow the squared terms of the
// sell formula (about 10 billion whole units).
constexpr Int128 kMaxTotalRaw = Int128{1'000'000'000'000'000'000};

void requirePositivePools(Decimal yes_pool, Decimal no_pool) {
  if (!yes_pool.isPositive() || !no_pool.isPositive()) {
    throw std::invalid_argument("PricingCurve: pools must be positive");
  }
}

void requireWithinRange(Int128 total_raw) {
  if (total_raw > kMaxTotalRaw) {
    throw InvalidTradeSizeError("Trade size out of range",
                                {{"limit_units", "10000000000"}});
  }
}

}  // namespace

PricingCurve::PricingCurve(CurveLimits limits) : limits_(limits) {
  if (!limits_.min_price.isPositive() || limits_.max_price >= Decimal::one() ||
      limits_.min_price >= limits_.max_price) {
    throw std::invalid_argument("PricingCurve: invalid price band");
  }
}

// -----------------------------------------------------------------------------
// price(): YES = yes / (yes + no); NO is the exact complement
// -----------------------------------------------------------------------------
Decimal PricingCurve::price(Decimal yes_pool, Decimal no_pool, Outcome side) {
  requirePositivePools(yes_pool, no_pool);
  Decimal yes_price = yes_pool.div(yes_pool + no_pool, kHalfUp);
  return side == Outcome::Yes ? yes_price : Decimal::one() - yes_price;
}

// -----------------------------------------------------------------------------
// quoteBuy(): shares = n * (T + n) / (S + n), rounded down
// -----------------------------------------------------------------------------
BuyQuote PricingCurve::quoteBuy(Decimal yes_pool, Decimal no_pool,
                                Outcome side, Decimal amount) const {
  requirePositivePools(yes_pool, no_pool);
  if (amount.isNegative()) {
    throw InvalidTradeSizeError("Trade amount must not be negative",
                                {{"amount", amount.toString()}});
  }

  BuyQuote quote;
  quote.price_before = price(yes_pool, no_pool, side);
  quote.new_yes_pool = yes_pool;
  quote.new_no_pool = no_pool;
  quote.price_after = quote.price_before;
  if (amount.isZero()) {
    return quote;
  }

  const Int128 n = amount.raw();
  const Int128 side_pool = (side == Outcome::Yes ? yes_pool : no_pool).raw();
  const Int128 total = Int128{yes_pool.raw()} + no_pool.raw();
  requireWithinRange(total + n);

  // Raw units cancel: n_raw * (T_raw + n_raw) / (S_raw + n_raw) is already
  // scaled by 10^8.
  quote.shares_bought =
      wide::narrow(wide::divRound(n * (total + n), side_pool + n, kFloor));
  quote.avg_price = amount.div(quote.shares_bought, kHalfUp);

  Decimal new_side_pool = wide::narrow(side_pool + n);
  if (side == Outcome::Yes) {
    quote.new_yes_pool = new_side_pool;
  } else {
    quote.new_no_pool = new_side_pool;
  }

  quote.price_after = price(quote.new_yes_pool, quote.new_no_pool, side);
  checkBand(quote.new_yes_pool, quote.new_no_pool, side, amount);
  quote.price_impact = impactPercent(quote.price_before, quote.price_after);
  return quote;
}

// -----------------------------------------------------------------------------
// quoteSell(): smaller root of g^2 - (T + s) g + s S = 0, rounded down
// -----------------------------------------------------------------------------
SellQuote PricingCurve::quoteSell(Decimal yes_pool, Decimal no_pool,
                                  Outcome side, Decimal shares) const {
  requirePositivePools(yes_pool, no_pool);
  if (shares.isNegative()) {
    throw InvalidTradeSizeError("Share count must not be negative",
                                {{"shares", shares.toString()}});
  }

  SellQuote quote;
  quote.price_before = price(yes_pool, no_pool, side);
  quote.new_yes_pool = yes_pool;
  quote.new_no_pool = no_pool;
  quote.price_after = quote.price_before;
  if (shares.isZero()) {
    return quote;
  }

  const Int128 s = shares.raw();
  const Int128 side_pool = (side == Outcome::Yes ? yes_pool : no_pool).raw();
  const Int128 total = Int128{yes_pool.raw()} + no_pool.raw();
  const Int128 b = total + s;
  requireWithinRange(b);

  // Discriminant (T + s)^2 - 4 s S is strictly positive because S < T.
  // Taking the ceiling of its root and flooring the halved difference keeps
  // g at or below the exact root.
  const Int128 root = wide::isqrt(b * b - 4 * s * side_pool, kCeiling);
  const Int128 gross = wide::divRound(b - root, 2, kFloor);
  if (gross <= 0) {
    throw InvalidTradeSizeError("Trade amount too low",
                                {{"shares", shares.toString()}});
  }

  quote.gross_proceeds = wide::narrow(gross);
  quote.avg_price = quote.gross_proceeds.div(shares, kHalfUp);

  Decimal new_side_pool = wide::narrow(side_pool - gross);
  if (side == Outcome::Yes) {
    quote.new_yes_pool = new_side_pool;
  } else {
    quote.new_no_pool = new_side_pool;
  }

  quote.price_after = price(quote.new_yes_pool, quote.new_no_pool, side);
  checkBand(quote.new_yes_pool, quote.new_no_pool, side, shares);
  quote.price_impact = impactPercent(quote.price_before, quote.price_after);
  return quote;
}

// -----------------------------------------------------------------------------
// checkBand(): both sides must stay inside [min_price, max_price]
// -----------------------------------------------------------------------------
void PricingCurve::checkBand(Decimal yes_pool, Decimal no_pool, Outcome side,
                             Decimal size) const {
  Decimal yes_price = price(yes_pool, no_pool, Outcome::Yes);
  Decimal no_price = Decimal::one() - yes_price;
  if (yes_price < limits_.min_price || yes_price > limits_.max_price ||
      no_price < limits_.min_price || no_price > limits_.max_price) {
    throw PriceOutOfBoundsError(
        "Trade would move the price outside the allowed band",
        {{"side", domain::outcomeToString(side)},
         {"size", size.toString()},
         {"price_after", price(yes_pool, no_pool, side).toString()},
         {"min_price", limits_.min_price.toString()},
         {"max_price", limits_.max_price.toString()}});
  }
}

Decimal PricingCurve::impactPercent(Decimal before, Decimal after) {
  return (after - before).abs().mul(Decimal::fromUnits(100), kHalfUp)
      .div(before, kHalfUp);
}

}  // namespace predict
