#pragma once

#include "predict/domain/decimal.hpp"
#include "predict/domain/market.hpp"
#include "predict/domain/outcome.hpp"
#include "predict/domain/position.hpp"
#include "predict/domain/trade_errors.hpp"
#include "predict/domain/wallet.hpp"
#include "predict/events/event.hpp"
#include "predict/trade/trade_receipt.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace predict {
namespace protocol {

// -----------------------------------------------------------------------------
// Commands accepted on the REP socket
// -----------------------------------------------------------------------------
// Every request is one JSON object with an "op" field. Decimal fields are
// JSON strings ("100.5"); plain JSON numbers are accepted too.
//
//   {"op":"ping"}
//   {"op":"buy","user_id":"u1","market_id":"q-1","side":"YES","amount":"100"}
//   {"op":"sell","user_id":"u1","market_id":"q-1","shares":"10","side":"NO"}
//   {"op":"market_state","market_id":"q-1"}
//   {"op":"open_account","user_id":"u2","balance":"1000","referrer_id":"u1"}
//   {"op":"wallet","user_id":"u1"}
//   {"op":"holdings","user_id":"u1","market_id":"q-1"}
//   {"op":"resolve","market_id":"q-1","outcome":"YES"}
// -----------------------------------------------------------------------------
struct PingCommand {};

struct BuyCommand {
  BuyRequest request;
};

struct SellCommand {
  SellRequest request;
};

struct MarketStateCommand {
  std::string market_id;
};

struct OpenAccountCommand {
  std::string user_id;
  Decimal balance;
  std::optional<std::string> referrer_id;
};

struct WalletCommand {
  std::string user_id;
};

struct HoldingsCommand {
  std::string user_id;
  std::string market_id;
};

struct ResolveCommand {
  std::string market_id;
  domain::Outcome outcome{domain::Outcome::Yes};
};

using Command = std::variant<PingCommand, BuyCommand, SellCommand,
                             MarketStateCommand, OpenAccountCommand,
                             WalletCommand, HoldingsCommand, ResolveCommand>;

// Throws InvalidRequestError on malformed JSON, unknown ops, missing or
// mistyped fields.
Command parseCommand(const std::string& text);

// Name of the op, for logging.
const char* commandName(const Command& command);

// -----------------------------------------------------------------------------
// Replies
// -----------------------------------------------------------------------------
// Success: {"status":"ok","result":{...}}
// Failure: {"status":"error","error":{"code":"InsufficientFunds",
//           "message":"...","context":{"balance":"40",...}}}
// Timeout: {"status":"timeout","message":"..."}; the request keeps running.
// -----------------------------------------------------------------------------
std::string encodePong();
std::string encodeBuyReceipt(const BuyReceipt& receipt);
std::string encodeSellReceipt(const SellReceipt& receipt);
std::string encodeMarketState(const domain::MarketState& state);
std::string encodeWallet(const domain::WalletAccount& account);
std::string encodeHoldings(const std::string& user_id,
                           const std::string& market_id,
                           const std::vector<domain::Position>& positions);
std::string encodeMarket(const domain::Market& market);
std::string encodeError(const TradeError& error);
std::string encodeInternalError(const std::string& message);
std::string encodeTimeout(const std::string& op, int timeout_ms);

// JSON for the PUB socket. Every Event alternative has a message type:
// "trade_settled", "trade_rejected", "market_resolved".
std::string encodeTelemetry(const Event& event);

}  // namespace protocol
}  // namespace predict
