#pragma once

#include "predict/domain/decimal.hpp"
#include "predict/domain/outcome.hpp"

namespace predict {

// Price band every post-trade price must stay inside.
struct CurveLimits {
  Decimal min_price;
  Decimal max_price;
};

struct BuyQuote {
  Decimal shares_bought;
  Decimal avg_price;      // amount / shares_bought
  Decimal new_yes_pool;
  Decimal new_no_pool;
  Decimal price_before;   // Price of the traded side
  Decimal price_after;
  Decimal price_impact;   // Percent of price_before, display only
};

struct SellQuote {
  Decimal gross_proceeds;
  Decimal avg_price;      // gross_proceeds / shares
  Decimal new_yes_pool;
  Decimal new_no_pool;
  Decimal price_before;
  Decimal price_after;
  Decimal price_impact;
};

// -----------------------------------------------------------------------------
// PricingCurve — post-trade fill bonding curve for a YES/NO pool pair
// -----------------------------------------------------------------------------
//
// @brief  Turns a trade size into share movement, new pools and prices.
//         Pure: no state beyond the configured price band.
//
// @details
// Notation: S is the pool of the traded side, T = yes_pool + no_pool.
//
//   Buy of net cash n:
//     S' = S + n, other pool unchanged
//     shares = n * (T + n) / (S + n)
//   Every share is filled at the side's post-trade price (S + n) / (T + n).
//
//   Sell of s shares:
//     proceeds g is the smaller root of  g^2 - (T + s) g + s S = 0,
//     i.e. g = s * (S - g) / (T - g), the post-trade price times s.
//     S' = S - g, other pool unchanged.
//
// Conservation holds exactly: pools grow by n on a buy and shrink by g on a
// sell. Since S < T the sell root is always below S, so pools stay positive.
// A round trip (buy n, sell everything back) returns strictly less than n.
//
// Rounding favours the pool: shares and proceeds are rounded down. Display
// values (prices, averages, impact) are rounded half-up.
//
// The resulting price of both sides must lie in [min_price, max_price];
// otherwise the quote fails with PriceOutOfBounds. Zero-size trades are a
// no-op quote; negative sizes fail with InvalidTradeSize.
//
// Thread model:
//   Immutable after construction; const methods are safe from any thread.
// -----------------------------------------------------------------------------
class PricingCurve {
 public:
  explicit PricingCurve(CurveLimits limits);

  // Price of `side` for the given pools. Both pools must be positive.
  static Decimal price(Decimal yes_pool, Decimal no_pool, domain::Outcome side);

  // `amount` is the net cash entering the pool (after fees).
  BuyQuote quoteBuy(Decimal yes_pool, Decimal no_pool, domain::Outcome side,
                    Decimal amount) const;

  SellQuote quoteSell(Decimal yes_pool, Decimal no_pool, domain::Outcome side,
                      Decimal shares) const;

  const CurveLimits& limits() const { return limits_; }

 private:
  void checkBand(Decimal yes_pool, Decimal no_pool, domain::Outcome side,
                 Decimal size) const;

  static Decimal impactPercent(Decimal before, Decimal after);

  CurveLimits limits_;
};

}  // namespace predict
