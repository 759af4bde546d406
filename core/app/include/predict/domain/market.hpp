#pragma once

#include "predict/domain/decimal.hpp"
#include "predict/domain/outcome.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace predict {
namespace domain {

// -----------------------------------------------------------------------------
// Market — the pool state of one binary question
// -----------------------------------------------------------------------------
//
// @brief  One row per tradable question. Written only by MarketLedger.
//
// @details
// The YES price is yes_pool / (yes_pool + no_pool); the NO price is its
// complement. Both pools stay strictly positive, and liquidity always equals
// yes_pool + no_pool: the seed plus net cash that entered through buys minus
// gross proceeds that left through sells.
//
// A market stops accepting trades once it is resolved or once the clock
// reaches end_time_ms. A market without end_time_ms never expires.
// -----------------------------------------------------------------------------
struct Market {
  std::string id;
  std::string question;
  Decimal yes_pool;
  Decimal no_pool;
  Decimal liquidity;
  bool resolved{false};
  std::optional<Outcome> resolution;
  std::optional<std::int64_t> end_time_ms;
  std::int64_t created_at_ms{0};

  bool isExpiredAt(std::int64_t now_ms) const {
    return end_time_ms.has_value() && now_ms >= *end_time_ms;
  }
};

// -----------------------------------------------------------------------------
// MarketState — read-only view returned by getMarketState()
// -----------------------------------------------------------------------------
// `materialized` is false when the question is known to the catalog but no
// trade has created its market row yet; the pools then show the seed split.
// -----------------------------------------------------------------------------
struct MarketState {
  std::string market_id;
  Decimal yes_price;
  Decimal no_price;
  Decimal yes_pool;
  Decimal no_pool;
  Decimal liquidity;
  bool resolved{false};
  std::optional<Outcome> resolution;
  std::optional<std::int64_t> end_time_ms;
  bool materialized{true};
};

}  // namespace domain
}  // namespace predict
