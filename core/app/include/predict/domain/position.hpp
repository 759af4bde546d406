#pragma once

#include "predict/domain/decimal.hpp"
#include "predict/domain/outcome.hpp"

#include <string>
#include <tuple>

namespace predict {
namespace domain {

// One holding per (user, market, side). Written only by PositionBook.
struct Position {
  std::string user_id;
  std::string market_id;
  Outcome side{Outcome::Yes};
  Decimal shares;      // Always above the dust threshold while the row exists
  Decimal avg_price;   // Weighted average fill price of the shares held
};

struct PositionKey {
  std::string user_id;
  std::string market_id;
  Outcome side{Outcome::Yes};

  bool operator==(const PositionKey& o) const {
    return user_id == o.user_id && market_id == o.market_id && side == o.side;
  }
  bool operator<(const PositionKey& o) const {
    return std::tie(user_id, market_id, side) <
           std::tie(o.user_id, o.market_id, o.side);
  }
};

inline PositionKey keyOf(const Position& p) {
  return PositionKey{p.user_id, p.market_id, p.side};
}

}  // namespace domain
}  // namespace predict
