#include "predict/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace predict {
namespace config {

namespace {

using nlohmann::json;

// Decimals may arrive as "0.001" or 0.001. Numbers go through their JSON
// text so no binary floating point value is ever converted directly.
Decimal readDecimal(const json& section, const char* key, Decimal fallback) {
  auto it = section.find(key);
  if (it == section.end()) {
    return fallback;
  }
  std::string text = it->is_string() ? it->get<std::string>() : it->dump();
  auto value = Decimal::tryParse(text);
  if (!value) {
    throw std::invalid_argument(std::string("config: '") + key +
                                "' is not a decimal: " + text);
  }
  return *value;
}

template <typename T>
T readValue(const json& section, const char* key, T fallback) {
  auto it = section.find(key);
  if (it == section.end()) {
    return fallback;
  }
  return it->get<T>();
}

const json& sectionOf(const json& root, const char* name) {
  static const json kEmpty = json::object();
  auto it = root.find(name);
  if (it == root.end()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw std::invalid_argument(std::string("config: '") + name +
                                "' must be an object");
  }
  return *it;
}

domain::QuestionStatus parseStatus(const std::string& text) {
  if (text == "active") {
    return domain::QuestionStatus::Active;
  }
  if (text == "resolved") {
    return domain::QuestionStatus::Resolved;
  }
  if (text == "cancelled") {
    return domain::QuestionStatus::Cancelled;
  }
  throw std::invalid_argument("config: unknown question status '" + text +
                              "'");
}

domain::Question parseQuestion(const json& j) {
  domain::Question q;
  q.id = j.at("id").get<std::string>();
  q.number = readValue<std::int64_t>(j, "number", 0);
  q.text = readValue<std::string>(j, "text", "");
  q.status = parseStatus(readValue<std::string>(j, "status", "active"));
  if (auto it = j.find("resolution_time_ms");
      it != j.end() && !it->is_null()) {
    q.resolution_time_ms = it->get<std::int64_t>();
  }
  return q;
}

}  // namespace

void validateEngineConfig(const EngineConfig& config) {
  const auto one = Decimal::one();
  const auto& fees = config.fees;
  if (fees.buy_rate.isNegative() || fees.buy_rate >= one) {
    throw std::invalid_argument("config: fees.buy_rate must be in [0, 1)");
  }
  if (fees.sell_rate.isNegative() || fees.sell_rate >= one) {
    throw std::invalid_argument("config: fees.sell_rate must be in [0, 1)");
  }
  if (fees.referrer_share.isNegative() || fees.referrer_share > one) {
    throw std::invalid_argument(
        "config: fees.referrer_share must be in [0, 1]");
  }
  if (fees.precision_digits < 0 ||
      fees.precision_digits > Decimal::kScaleDigits) {
    throw std::invalid_argument(
        "config: fees.precision_digits must be in [0, 8]");
  }
  if (fees.min_fee_amount.isNegative()) {
    throw std::invalid_argument("config: fees.min_fee_amount is negative");
  }

  const auto& markets = config.markets;
  // Each half of the seed must be a positive amount.
  if (markets.seed_liquidity.raw() < 2) {
    throw std::invalid_argument("config: markets.seed_liquidity too small");
  }
  if (!markets.min_price.isPositive() || markets.max_price >= one ||
      markets.min_price >= markets.max_price) {
    throw std::invalid_argument(
        "config: markets price band must satisfy 0 < min < max < 1");
  }

  if (config.retry.max_attempts < 1) {
    throw std::invalid_argument("config: retry.max_attempts must be >= 1");
  }
  if (config.retry.backoff_ms < 0) {
    throw std::invalid_argument("config: retry.backoff_ms is negative");
  }
  if (config.server.worker_threads == 0) {
    throw std::invalid_argument("config: server.worker_threads must be >= 1");
  }
  if (config.server.request_timeout_ms <= 0) {
    throw std::invalid_argument(
        "config: server.request_timeout_ms must be positive");
  }
}

EngineConfig parseEngineConfig(const std::string& json_text) {
  EngineConfig config;

  try {
    json root = json::parse(json_text);
    if (!root.is_object()) {
      throw std::invalid_argument("config: top level must be an object");
    }

    // --- fees ---------------------------------------------------------------
    const json& fees = sectionOf(root, "fees");
    config.fees.buy_rate = readDecimal(fees, "buy_rate", config.fees.buy_rate);
    config.fees.sell_rate =
        readDecimal(fees, "sell_rate", config.fees.sell_rate);
    config.fees.referrer_share =
        readDecimal(fees, "referrer_share", config.fees.referrer_share);
    config.fees.precision_digits =
        readValue<int>(fees, "precision_digits", config.fees.precision_digits);
    config.fees.min_fee_amount =
        readDecimal(fees, "min_fee_amount", config.fees.min_fee_amount);

    // --- markets ------------------------------------------------------------
    const json& markets = sectionOf(root, "markets");
    config.markets.seed_liquidity =
        readDecimal(markets, "seed_liquidity", config.markets.seed_liquidity);
    config.markets.min_price =
        readDecimal(markets, "min_price", config.markets.min_price);
    config.markets.max_price =
        readDecimal(markets, "max_price", config.markets.max_price);

    // --- retry --------------------------------------------------------------
    const json& retry = sectionOf(root, "retry");
    config.retry.max_attempts =
        readValue<int>(retry, "max_attempts", config.retry.max_attempts);
    config.retry.backoff_ms =
        readValue<int>(retry, "backoff_ms", config.retry.backoff_ms);

    // --- server -------------------------------------------------------------
    const json& server = sectionOf(root, "server");
    config.server.command_endpoint = readValue<std::string>(
        server, "command_endpoint", config.server.command_endpoint);
    config.server.telemetry_endpoint = readValue<std::string>(
        server, "telemetry_endpoint", config.server.telemetry_endpoint);
    config.server.worker_threads = readValue<std::size_t>(
        server, "worker_threads", config.server.worker_threads);
    config.server.request_timeout_ms = readValue<int>(
        server, "request_timeout_ms", config.server.request_timeout_ms);

    // --- questions ----------------------------------------------------------
    if (auto it = root.find("questions"); it != root.end()) {
      if (!it->is_array()) {
        throw std::invalid_argument("config: 'questions' must be an array");
      }
      for (const auto& q : *it) {
        config.questions.push_back(parseQuestion(q));
      }
    }
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("config: ") + e.what());
  }

  validateEngineConfig(config);
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseEngineConfig(buffer.str());
}

}  // namespace config
}  // namespace predict
