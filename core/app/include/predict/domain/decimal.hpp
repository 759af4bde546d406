#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace predict {

// -----------------------------------------------------------------------------
// Decimal — signed fixed-point number with 8 fractional digits
// -----------------------------------------------------------------------------
//
// @brief  Value type used for every monetary amount, share count, and price
//         in the trading core. Never binary floating point.
//
// @details
// The value is stored as a signed 64-bit integer scaled by 10^8
// (kScale). 1.0 is raw 100'000'000; the smallest representable step is
// 0.00000001. The integer range gives roughly +/- 92 billion units, which
// comfortably covers pool reserves and wallet balances.
//
// Addition and subtraction are exact and throw std::overflow_error when the
// result leaves the int64 range. Multiplication and division widen to a
// 128-bit intermediate, so a*b/c style expressions never lose precision
// before the final rounding step. Every rounding decision is explicit:
//
//   Rounding::Floor    toward negative infinity
//   Rounding::Ceiling  toward positive infinity
//   Rounding::HalfUp   to nearest, ties away from zero
//
// Ledger code picks Floor or Ceiling so rounding never favours the trader;
// display values (prices, impact) use HalfUp.
//
// Thread model:
//   Immutable value semantics. Safe to copy between threads.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  static constexpr int kScaleDigits = 8;
  static constexpr std::int64_t kScale = 100'000'000;

  enum class Rounding { Floor, Ceiling, HalfUp };

  constexpr Decimal() = default;

  // Construct from the raw scaled integer (raw 150'000'000 == 1.5).
  static constexpr Decimal fromRaw(std::int64_t raw) { return Decimal(raw); }

  // Construct from a whole number of units. Throws std::overflow_error.
  static Decimal fromUnits(std::int64_t units);

  // Parses "123", "-0.5", "+42.00000001". At most kScaleDigits fractional
  // digits; exponents and whitespace are rejected.
  static std::optional<Decimal> tryParse(std::string_view text);

  // Same as tryParse() but throws std::invalid_argument on bad input.
  static Decimal parse(std::string_view text);

  static constexpr Decimal zero() { return Decimal(0); }
  static constexpr Decimal one() { return Decimal(kScale); }

  constexpr std::int64_t raw() const { return raw_; }

  constexpr bool isZero() const { return raw_ == 0; }
  constexpr bool isNegative() const { return raw_ < 0; }
  constexpr bool isPositive() const { return raw_ > 0; }

  Decimal abs() const;

  // a * b rounded to kScaleDigits with the requested mode.
  Decimal mul(Decimal other, Rounding mode) const;

  // a / b rounded to kScaleDigits. Throws std::domain_error on b == 0.
  Decimal div(Decimal other, Rounding mode) const;

  // Rounds to `digits` fractional digits (0..kScaleDigits).
  Decimal roundTo(int digits, Rounding mode) const;

  // Shortest exact text form: "98", "0.5", "-12.00000001".
  std::string toString() const;

  // Fixed number of fractional digits, rounded HalfUp ("0.54" for 2).
  std::string toFixed(int digits) const;

  Decimal operator+(Decimal other) const;
  Decimal operator-(Decimal other) const;
  Decimal operator-() const;
  Decimal& operator+=(Decimal other);
  Decimal& operator-=(Decimal other);

  constexpr bool operator==(Decimal o) const { return raw_ == o.raw_; }
  constexpr bool operator!=(Decimal o) const { return raw_ != o.raw_; }
  constexpr bool operator<(Decimal o) const { return raw_ < o.raw_; }
  constexpr bool operator<=(Decimal o) const { return raw_ <= o.raw_; }
  constexpr bool operator>(Decimal o) const { return raw_ > o.raw_; }
  constexpr bool operator>=(Decimal o) const { return raw_ >= o.raw_; }

 private:
  constexpr explicit Decimal(std::int64_t raw) : raw_(raw) {}

  std::int64_t raw_{0};
};

std::ostream& operator<<(std::ostream& os, Decimal value);

inline Decimal min(Decimal a, Decimal b) { return b < a ? b : a; }

// -----------------------------------------------------------------------------
// wide — 128-bit helpers shared by Decimal and PricingCurve
// -----------------------------------------------------------------------------
// The pricing formulas multiply two pool-sized quantities before dividing by
// a third. Doing that on raw scaled values needs more than 64 bits, so the
// curve works on __int128 intermediates and narrows the final result.
// -----------------------------------------------------------------------------
namespace wide {

using Int128 = __int128;

// num / den with the requested rounding. den must be non-zero.
Int128 divRound(Int128 num, Int128 den, Decimal::Rounding mode);

// floor(sqrt(v)) or ceil(sqrt(v)) for v >= 0 (Floor/HalfUp both floor).
Int128 isqrt(Int128 v, Decimal::Rounding mode);

// Narrows to a Decimal. Throws std::overflow_error outside the int64 range.
Decimal narrow(Int128 raw);

}  // namespace wide

}  // namespace predict
