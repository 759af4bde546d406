#pragma once

#include "predict/domain/decimal.hpp"
#include "predict/domain/outcome.hpp"
#include "predict/domain/trade_errors.hpp"

#include <cstdint>
#include <string>

namespace predict {

enum class TradeAction { Buy, Sell };

inline const char* tradeActionToString(TradeAction a) {
  switch (a) {
    case TradeAction::Buy:  return "buy";
    case TradeAction::Sell: return "sell";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// TradeSettledEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a market right after a trade committed.
//
// @details
// Published by TradeCoordinator after the unit of work commits, never
// before, so subscribers only ever see durable state. For a buy `amount` is
// the gross cash paid; for a sell it is the gross proceeds. The trade server
// forwards these on its PUB socket as "trade_settled" messages, which is how
// clients follow live prices.
//
// Thread model:
//   Published on the worker thread that ran the trade. Plain data; safe to
//   copy across threads inside the Event variant.
// -----------------------------------------------------------------------------
struct TradeSettledEvent {
  std::string trade_id;
  std::string user_id;
  std::string market_id;
  TradeAction action{TradeAction::Buy};
  domain::Outcome side{domain::Outcome::Yes};
  Decimal amount;
  Decimal shares;
  Decimal fee;
  Decimal yes_price;
  Decimal no_price;
  Decimal yes_pool;
  Decimal no_pool;
  Decimal liquidity;
  Decimal price_impact;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

// A request that ended in a TradeError other than an internal conflict.
struct TradeRejectedEvent {
  std::string trade_id;
  std::string user_id;
  std::string market_id;
  TradeAction action{TradeAction::Buy};
  ErrorCode code{ErrorCode::InvalidRequest};
  std::string reason;
  std::string stage;       // TradeStage at which the request failed
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct MarketResolvedEvent {
  std::string market_id;
  domain::Outcome outcome{domain::Outcome::Yes};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace predict
