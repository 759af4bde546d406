#pragma once

#include "predict/domain/position.hpp"
#include "predict/storage/i_unit_of_work.hpp"

#include <optional>
#include <string>
#include <vector>

namespace predict {

struct PositionDebit {
  Decimal realized_pnl;       // (fill_price - avg_price) * shares
  Decimal remaining_shares;   // Zero when the row was closed
  bool closed{false};
  Decimal avg_price;          // Cost basis the P&L was measured against
};

// -----------------------------------------------------------------------------
// PositionBook — the single place that writes Position rows
// -----------------------------------------------------------------------------
//
// @brief  Maintains one holding per (user, market, side) with a weighted
//         average entry price.
//
// @details
// credit() merges a new fill into the holding:
//   new_avg = (old_avg * old_shares + fill * shares) / (old_shares + shares)
//
// debit() removes shares at the given fill price and reports the realised
// profit or loss against the average entry price. The average price of the
// remaining shares is unchanged. When fewer than kDustShares remain the row
// is deleted; there are no zero-share rows.
//
// Thread model:
//   Stateless; safe to call from any worker with that worker's repository.
// -----------------------------------------------------------------------------
class PositionBook {
 public:
  static constexpr Decimal kDustShares = Decimal::fromRaw(100);  // 0.000001

  // -------------------------------------------------------------------------
  // credit(positions, user_id, market_id, side, shares, fill_price)
  // -------------------------------------------------------------------------
  // What: Adds shares bought at fill_price to the holding, creating the row
  // on first fill and re-weighting avg_price otherwise.
  // Thread-safety: Stateless; writes are staged in the caller's unit of work.
  // Input: fill_price — average price paid per share in this fill.
  // Output: The holding after the fill.
  // Throws: InvalidTradeSizeError when shares <= 0.
  // -------------------------------------------------------------------------
  domain::Position credit(IPositionRepository& positions,
                          const std::string& user_id,
                          const std::string& market_id, domain::Outcome side,
                          Decimal shares, Decimal fill_price) const;

  // -------------------------------------------------------------------------
  // debit(positions, user_id, market_id, side, shares, fill_price)
  // -------------------------------------------------------------------------
  // What: Removes shares sold at fill_price and measures realised P&L
  // against the holding's average entry price.
  // Why: avg_price of what remains must not move on a sale, otherwise a
  // later sale would report P&L against the wrong basis.
  // Input: fill_price — net proceeds per share, after the sell fee.
  // Output: PositionDebit; closed is set when the row fell below
  // kDustShares and was deleted.
  // Throws: PositionNotFoundError, InsufficientSharesError (nothing
  // written) or InvalidTradeSizeError.
  // -------------------------------------------------------------------------
  PositionDebit debit(IPositionRepository& positions,
                      const std::string& user_id,
                      const std::string& market_id, domain::Outcome side,
                      Decimal shares, Decimal fill_price) const;

  std::optional<domain::Position> find(IPositionRepository& positions,
                                       const std::string& user_id,
                                       const std::string& market_id,
                                       domain::Outcome side) const;

  // Both sides of one market for one user; zero, one or two rows.
  std::vector<domain::Position> holdings(IPositionRepository& positions,
                                         const std::string& user_id,
                                         const std::string& market_id) const;
};

}  // namespace predict
