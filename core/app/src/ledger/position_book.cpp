#include "predict/ledger/position_book.hpp"

#include "predict/domain/trade_errors.hpp"

namespace predict {

domain::Position PositionBook::credit(IPositionRepository& positions,
                                      const std::string& user_id,
                                      const std::string& market_id,
                                      domain::Outcome side, Decimal shares,
                                      Decimal fill_price) const {
  if (!shares.isPositive()) {
    throw InvalidTradeSizeError("Credited shares must be positive",
                                {{"market_id", market_id},
                                 {"shares", shares.toString()}});
  }

  domain::PositionKey key{user_id, market_id, side};
  domain::Position pos;

  if (auto existing = positions.find(key)) {
    pos = *existing;
    Decimal new_total = pos.shares + shares;
    Decimal cost = pos.avg_price.mul(pos.shares, Decimal::Rounding::HalfUp) +
                   fill_price.mul(shares, Decimal::Rounding::HalfUp);
    pos.avg_price = cost.div(new_total, Decimal::Rounding::HalfUp);
    pos.shares = new_total;
  } else {
    pos.user_id = user_id;
    pos.market_id = market_id;
    pos.side = side;
    pos.shares = shares;
    pos.avg_price = fill_price;
  }

  positions.save(pos);
  return pos;
}

PositionDebit PositionBook::debit(IPositionRepository& positions,
                                  const std::string& user_id,
                                  const std::string& market_id,
                                  domain::Outcome side, Decimal shares,
                                  Decimal fill_price) const {
  if (!shares.isPositive()) {
    throw InvalidTradeSizeError("Debited shares must be positive",
                                {{"market_id", market_id},
                                 {"shares", shares.toString()}});
  }

  domain::PositionKey key{user_id, market_id, side};
  auto existing = positions.find(key);
  if (!existing) {
    throw PositionNotFoundError(
        "No position in this market",
        {{"market_id", market_id}, {"side", domain::outcomeToString(side)}});
  }
  if (shares > existing->shares) {
    throw InsufficientSharesError(
        "Not enough shares to sell",
        {{"market_id", market_id},
         {"side", domain::outcomeToString(side)},
         {"requested", shares.toString()},
         {"held", existing->shares.toString()}});
  }

  PositionDebit result;
  result.avg_price = existing->avg_price;
  result.realized_pnl =
      (fill_price - existing->avg_price).mul(shares, Decimal::Rounding::HalfUp);

  Decimal remaining = existing->shares - shares;
  if (remaining < kDustShares) {
    positions.remove(key);
    result.closed = true;
  } else {
    domain::Position updated = *existing;
    updated.shares = remaining;
    positions.save(updated);
    result.remaining_shares = remaining;
  }
  return result;
}

std::optional<domain::Position> PositionBook::find(
    IPositionRepository& positions, const std::string& user_id,
    const std::string& market_id, domain::Outcome side) const {
  return positions.find(domain::PositionKey{user_id, market_id, side});
}

std::vector<domain::Position> PositionBook::holdings(
    IPositionRepository& positions, const std::string& user_id,
    const std::string& market_id) const {
  return positions.listForMarket(user_id, market_id);
}

}  // namespace predict
