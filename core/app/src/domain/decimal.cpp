#include "predict/domain/decimal.hpp"

#include <limits>
#include <stdexcept>

namespace predict {

namespace {

constexpr std::int64_t kInt64Max = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kInt64Min = std::numeric_limits<std::int64_t>::min();

// 10^n for n in [0, 8].
constexpr std::int64_t pow10(int n) {
  std::int64_t v = 1;
  for (int i = 0; i < n; ++i) {
    v *= 10;
  }
  return v;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Renders the fractional part of a non-negative raw value as exactly
// kScaleDigits characters, left-padded with zeros.
std::string paddedFraction(std::int64_t frac) {
  std::string digits = std::to_string(frac);
  return std::string(Decimal::kScaleDigits - digits.size(), '0') + digits;
}

}  // namespace

// -----------------------------------------------------------------------------
// wide helpers
// -----------------------------------------------------------------------------
namespace wide {

Int128 divRound(Int128 num, Int128 den, Decimal::Rounding mode) {
  if (den == 0) {
    throw std::domain_error("Decimal: division by zero");
  }
  if (den < 0) {
    num = -num;
    den = -den;
  }

  // C++ integer division truncates toward zero; the remainder carries the
  // sign of the numerator.
  Int128 q = num / den;
  Int128 r = num % den;
  if (r == 0) {
    return q;
  }

  switch (mode) {
    case Decimal::Rounding::Floor:
      if (r < 0) {
        q -= 1;
      }
      break;
    case Decimal::Rounding::Ceiling:
      if (r > 0) {
        q += 1;
      }
      break;
    case Decimal::Rounding::HalfUp: {
      Int128 twice = (r < 0 ? -r : r) * 2;
      if (twice >= den) {
        q += (r < 0) ? -1 : 1;
      }
      break;
    }
  }
  return q;
}

Int128 isqrt(Int128 v, Decimal::Rounding mode) {
  if (v < 0) {
    throw std::domain_error("Decimal: square root of a negative value");
  }
  if (v < 2) {
    return v;
  }

  // Initial guess 2^ceil(bits/2) is never below the root, so Newton's
  // iteration decreases monotonically onto floor(sqrt(v)).
  int bits = 0;
  for (Int128 t = v; t > 0; t >>= 1) {
    ++bits;
  }
  Int128 x = Int128{1} << ((bits + 1) / 2);
  while (true) {
    Int128 y = (x + v / x) / 2;
    if (y >= x) {
      break;
    }
    x = y;
  }

  if (mode == Decimal::Rounding::Ceiling && x * x < v) {
    ++x;
  }
  return x;
}

Decimal narrow(Int128 raw) {
  if (raw > kInt64Max || raw < kInt64Min) {
    throw std::overflow_error("Decimal: value out of range");
  }
  return Decimal::fromRaw(static_cast<std::int64_t>(raw));
}

}  // namespace wide

// -----------------------------------------------------------------------------
// Construction and parsing
// -----------------------------------------------------------------------------
Decimal Decimal::fromUnits(std::int64_t units) {
  return wide::narrow(static_cast<wide::Int128>(units) * kScale);
}

std::optional<Decimal> Decimal::tryParse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t i = 0;
  bool negative = false;
  if (text[0] == '+' || text[0] == '-') {
    negative = (text[0] == '-');
    ++i;
  }

  wide::Int128 int_part = 0;
  int int_digits = 0;
  while (i < text.size() && isDigit(text[i])) {
    int_part = int_part * 10 + (text[i] - '0');
    if (int_part > kInt64Max) {
      return std::nullopt;
    }
    ++int_digits;
    ++i;
  }

  wide::Int128 frac = 0;
  int frac_digits = 0;
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && isDigit(text[i])) {
      if (frac_digits == kScaleDigits) {
        return std::nullopt;
      }
      frac = frac * 10 + (text[i] - '0');
      ++frac_digits;
      ++i;
    }
  }

  if (i != text.size() || (int_digits == 0 && frac_digits == 0)) {
    return std::nullopt;
  }

  frac *= pow10(kScaleDigits - frac_digits);
  wide::Int128 raw = int_part * kScale + frac;
  if (negative) {
    raw = -raw;
  }
  if (raw > kInt64Max || raw < kInt64Min) {
    return std::nullopt;
  }
  return Decimal(static_cast<std::int64_t>(raw));
}

Decimal Decimal::parse(std::string_view text) {
  auto value = tryParse(text);
  if (!value) {
    throw std::invalid_argument("Decimal: cannot parse '" +
                                std::string(text) + "'");
  }
  return *value;
}

// -----------------------------------------------------------------------------
// Arithmetic
// -----------------------------------------------------------------------------
Decimal Decimal::abs() const {
  return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::mul(Decimal other, Rounding mode) const {
  wide::Int128 product =
      static_cast<wide::Int128>(raw_) * static_cast<wide::Int128>(other.raw_);
  return wide::narrow(wide::divRound(product, kScale, mode));
}

Decimal Decimal::div(Decimal other, Rounding mode) const {
  if (other.raw_ == 0) {
    throw std::domain_error("Decimal: division by zero");
  }
  wide::Int128 num = static_cast<wide::Int128>(raw_) * kScale;
  return wide::narrow(wide::divRound(num, other.raw_, mode));
}

Decimal Decimal::roundTo(int digits, Rounding mode) const {
  if (digits < 0 || digits > kScaleDigits) {
    throw std::invalid_argument("Decimal: rounding digits out of range");
  }
  std::int64_t factor = pow10(kScaleDigits - digits);
  return wide::narrow(wide::divRound(raw_, factor, mode) * factor);
}

Decimal Decimal::operator+(Decimal other) const {
  return wide::narrow(static_cast<wide::Int128>(raw_) + other.raw_);
}

Decimal Decimal::operator-(Decimal other) const {
  return wide::narrow(static_cast<wide::Int128>(raw_) - other.raw_);
}

Decimal Decimal::operator-() const {
  return wide::narrow(-static_cast<wide::Int128>(raw_));
}

Decimal& Decimal::operator+=(Decimal other) {
  *this = *this + other;
  return *this;
}

Decimal& Decimal::operator-=(Decimal other) {
  *this = *this - other;
  return *this;
}

// -----------------------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------------------
std::string Decimal::toString() const {
  wide::Int128 magnitude = raw_;
  if (magnitude < 0) {
    magnitude = -magnitude;
  }
  auto int_part = static_cast<std::int64_t>(magnitude / kScale);
  auto frac = static_cast<std::int64_t>(magnitude % kScale);

  std::string out = (raw_ < 0) ? "-" : "";
  out += std::to_string(int_part);
  if (frac != 0) {
    std::string digits = paddedFraction(frac);
    digits.erase(digits.find_last_not_of('0') + 1);
    out += '.';
    out += digits;
  }
  return out;
}

std::string Decimal::toFixed(int digits) const {
  Decimal rounded = roundTo(digits, Rounding::HalfUp);
  wide::Int128 magnitude = rounded.raw_;
  if (magnitude < 0) {
    magnitude = -magnitude;
  }
  auto int_part = static_cast<std::int64_t>(magnitude / kScale);
  auto frac = static_cast<std::int64_t>(magnitude % kScale);

  std::string out = (rounded.raw_ < 0) ? "-" : "";
  out += std::to_string(int_part);
  if (digits > 0) {
    out += '.';
    out += paddedFraction(frac).substr(0, static_cast<std::size_t>(digits));
  }
  return out;
}

std::ostream& operator<<(std::ostream& os, Decimal value) {
  return os << value.toString();
}

}  // namespace predict
