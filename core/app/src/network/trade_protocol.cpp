#include "predict/network/trade_protocol.hpp"

#include <nlohmann/json.hpp>

namespace predict {
namespace protocol {

namespace {

using nlohmann::json;

// --- request field readers ---------------------------------------------------

std::string requireString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
    throw InvalidRequestError(std::string("Missing or empty field '") + key +
                                  "'",
                              {{"field", key}});
  }
  return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw InvalidRequestError(std::string("Field '") + key +
                                  "' must be a string",
                              {{"field", key}});
  }
  return it->get<std::string>();
}

// Strings are parsed as-is; numbers go through their JSON text so a binary
// double never reaches Decimal.
Decimal requireDecimal(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !(it->is_string() || it->is_number())) {
    throw InvalidRequestError(std::string("Missing decimal field '") + key +
                                  "'",
                              {{"field", key}});
  }
  std::string text = it->is_string() ? it->get<std::string>() : it->dump();
  auto value = Decimal::tryParse(text);
  if (!value) {
    throw InvalidRequestError(std::string("Field '") + key +
                                  "' is not a decimal",
                              {{"field", key}, {"value", text}});
  }
  return *value;
}

domain::Outcome requireOutcome(const json& j, const char* key) {
  std::string text = requireString(j, key);
  auto side = domain::parseOutcome(text);
  if (!side) {
    throw InvalidRequestError(std::string("Field '") + key +
                                  "' must be YES or NO",
                              {{"field", key}, {"value", text}});
  }
  return *side;
}

// --- reply helpers -----------------------------------------------------------

std::string str(Decimal d) { return d.toString(); }

json feeJson(const FeeSplit& fee) {
  return json{{"fee_charged", str(fee.fee_charged)},
              {"net_amount", str(fee.net_amount)},
              {"referrer_share", str(fee.referrer_share)},
              {"platform_share", str(fee.platform_share)}};
}

json positionJson(const domain::Position& p) {
  return json{{"user_id", p.user_id},
              {"market_id", p.market_id},
              {"side", domain::outcomeToString(p.side)},
              {"shares", str(p.shares)},
              {"avg_price", str(p.avg_price)}};
}

json optionalOutcome(const std::optional<domain::Outcome>& o) {
  return o ? json(domain::outcomeToString(*o)) : json(nullptr);
}

json optionalTime(const std::optional<std::int64_t>& t) {
  return t ? json(*t) : json(nullptr);
}

std::string ok(json result) {
  json reply;
  reply["status"] = "ok";
  reply["result"] = std::move(result);
  return reply.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// parseCommand()
// -----------------------------------------------------------------------------
Command parseCommand(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw InvalidRequestError(std::string("Malformed JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw InvalidRequestError("Request must be a JSON object");
  }

  const std::string op = requireString(j, "op");

  if (op == "ping") {
    return PingCommand{};
  }
  if (op == "buy") {
    BuyRequest r;
    r.user_id = requireString(j, "user_id");
    r.market_id = requireString(j, "market_id");
    r.side = requireOutcome(j, "side");
    r.amount = requireDecimal(j, "amount");
    return BuyCommand{std::move(r)};
  }
  if (op == "sell") {
    SellRequest r;
    r.user_id = requireString(j, "user_id");
    r.market_id = requireString(j, "market_id");
    r.shares = requireDecimal(j, "shares");
    if (optionalString(j, "side")) {
      r.side = requireOutcome(j, "side");
    }
    return SellCommand{std::move(r)};
  }
  if (op == "market_state") {
    return MarketStateCommand{requireString(j, "market_id")};
  }
  if (op == "open_account") {
    OpenAccountCommand c;
    c.user_id = requireString(j, "user_id");
    c.balance = requireDecimal(j, "balance");
    c.referrer_id = optionalString(j, "referrer_id");
    return c;
  }
  if (op == "wallet") {
    return WalletCommand{requireString(j, "user_id")};
  }
  if (op == "holdings") {
    return HoldingsCommand{requireString(j, "user_id"),
                           requireString(j, "market_id")};
  }
  if (op == "resolve") {
    return ResolveCommand{requireString(j, "market_id"),
                          requireOutcome(j, "outcome")};
  }

  throw InvalidRequestError("Unknown op '" + op + "'", {{"op", op}});
}

const char* commandName(const Command& command) {
  struct Namer {
    const char* operator()(const PingCommand&) const { return "ping"; }
    const char* operator()(const BuyCommand&) const { return "buy"; }
    const char* operator()(const SellCommand&) const { return "sell"; }
    const char* operator()(const MarketStateCommand&) const {
      return "market_state";
    }
    const char* operator()(const OpenAccountCommand&) const {
      return "open_account";
    }
    const char* operator()(const WalletCommand&) const { return "wallet"; }
    const char* operator()(const HoldingsCommand&) const { return "holdings"; }
    const char* operator()(const ResolveCommand&) const { return "resolve"; }
  };
  return std::visit(Namer{}, command);
}

// -----------------------------------------------------------------------------
// Replies
// -----------------------------------------------------------------------------
std::string encodePong() { return ok(json{{"response", "PONG"}}); }

std::string encodeBuyReceipt(const BuyReceipt& r) {
  return ok(json{{"trade_id", r.trade_id},
                 {"market_id", r.market_id},
                 {"side", domain::outcomeToString(r.side)},
                 {"shares_bought", str(r.shares_bought)},
                 {"avg_price", str(r.avg_price)},
                 {"fee", feeJson(r.fee)},
                 {"yes_price", str(r.yes_price)},
                 {"no_price", str(r.no_price)},
                 {"price_impact", str(r.price_impact)},
                 {"liquidity", str(r.liquidity)},
                 {"new_balance", str(r.new_balance)},
                 {"position_shares", str(r.position_shares)},
                 {"attempts", r.attempts}});
}

std::string encodeSellReceipt(const SellReceipt& r) {
  return ok(json{{"trade_id", r.trade_id},
                 {"market_id", r.market_id},
                 {"side", domain::outcomeToString(r.side)},
                 {"shares_sold", str(r.shares_sold)},
                 {"gross_proceeds", str(r.gross_proceeds)},
                 {"net_proceeds", str(r.net_proceeds)},
                 {"fee", feeJson(r.fee)},
                 {"realized_pnl", str(r.realized_pnl)},
                 {"yes_price", str(r.yes_price)},
                 {"no_price", str(r.no_price)},
                 {"price_impact", str(r.price_impact)},
                 {"liquidity", str(r.liquidity)},
                 {"new_balance", str(r.new_balance)},
                 {"remaining_shares", str(r.remaining_shares)},
                 {"position_closed", r.position_closed},
                 {"attempts", r.attempts}});
}

std::string encodeMarketState(const domain::MarketState& s) {
  return ok(json{{"market_id", s.market_id},
                 {"yes_price", str(s.yes_price)},
                 {"no_price", str(s.no_price)},
                 {"yes_pool", str(s.yes_pool)},
                 {"no_pool", str(s.no_pool)},
                 {"liquidity", str(s.liquidity)},
                 {"resolved", s.resolved},
                 {"resolution", optionalOutcome(s.resolution)},
                 {"end_time_ms", optionalTime(s.end_time_ms)},
                 {"materialized", s.materialized}});
}

std::string encodeWallet(const domain::WalletAccount& a) {
  return ok(json{{"user_id", a.user_id},
                 {"balance", str(a.balance)},
                 {"lifetime_pnl", str(a.lifetime_pnl)},
                 {"total_fees_paid", str(a.total_fees_paid)},
                 {"total_fees_earned", str(a.total_fees_earned)},
                 {"referrer_id",
                  a.referrer_id ? json(*a.referrer_id) : json(nullptr)}});
}

std::string encodeHoldings(const std::string& user_id,
                           const std::string& market_id,
                           const std::vector<domain::Position>& positions) {
  json rows = json::array();
  for (const auto& p : positions) {
    rows.push_back(positionJson(p));
  }
  return ok(json{{"user_id", user_id},
                 {"market_id", market_id},
                 {"positions", std::move(rows)}});
}

std::string encodeMarket(const domain::Market& m) {
  return ok(json{{"market_id", m.id},
                 {"question", m.question},
                 {"yes_pool", str(m.yes_pool)},
                 {"no_pool", str(m.no_pool)},
                 {"liquidity", str(m.liquidity)},
                 {"resolved", m.resolved},
                 {"resolution", optionalOutcome(m.resolution)},
                 {"end_time_ms", optionalTime(m.end_time_ms)}});
}

std::string encodeError(const TradeError& error) {
  json context = json::object();
  for (const auto& [key, value] : error.context()) {
    context[key] = value;
  }
  json reply;
  reply["status"] = "error";
  reply["error"] = json{{"code", errorCodeToString(error.code())},
                        {"message", error.what()},
                        {"context", std::move(context)}};
  return reply.dump();
}

std::string encodeInternalError(const std::string& message) {
  json reply;
  reply["status"] = "error";
  reply["error"] = json{{"code", "Internal"},
                        {"message", message},
                        {"context", json::object()}};
  return reply.dump();
}

std::string encodeTimeout(const std::string& op, int timeout_ms) {
  json reply;
  reply["status"] = "timeout";
  reply["message"] = "No result within " + std::to_string(timeout_ms) +
                     " ms; the request is still being processed";
  reply["op"] = op;
  return reply.dump();
}

// -----------------------------------------------------------------------------
// encodeTelemetry()
// -----------------------------------------------------------------------------
std::string encodeTelemetry(const Event& event) {
  struct Encoder {
    json operator()(const TradeSettledEvent& e) const {
      return json{{"type", "trade_settled"},
                  {"trade_id", e.trade_id},
                  {"user_id", e.user_id},
                  {"market_id", e.market_id},
                  {"action", tradeActionToString(e.action)},
                  {"side", domain::outcomeToString(e.side)},
                  {"amount", str(e.amount)},
                  {"shares", str(e.shares)},
                  {"fee", str(e.fee)},
                  {"yes_price", str(e.yes_price)},
                  {"no_price", str(e.no_price)},
                  {"yes_pool", str(e.yes_pool)},
                  {"no_pool", str(e.no_pool)},
                  {"liquidity", str(e.liquidity)},
                  {"price_impact", str(e.price_impact)},
                  {"timestamp_ms", e.timestamp_ms},
                  {"sequence_id", e.sequence_id}};
    }
    json operator()(const TradeRejectedEvent& e) const {
      return json{{"type", "trade_rejected"},
                  {"trade_id", e.trade_id},
                  {"user_id", e.user_id},
                  {"market_id", e.market_id},
                  {"action", tradeActionToString(e.action)},
                  {"code", errorCodeToString(e.code)},
                  {"reason", e.reason},
                  {"stage", e.stage},
                  {"timestamp_ms", e.timestamp_ms},
                  {"sequence_id", e.sequence_id}};
    }
    json operator()(const MarketResolvedEvent& e) const {
      return json{{"type", "market_resolved"},
                  {"market_id", e.market_id},
                  {"outcome", domain::outcomeToString(e.outcome)},
                  {"timestamp_ms", e.timestamp_ms},
                  {"sequence_id", e.sequence_id}};
    }
  };
  return std::visit(Encoder{}, event).dump();
}

}  // namespace protocol
}  // namespace predict
