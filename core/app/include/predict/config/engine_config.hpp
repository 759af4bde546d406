#pragma once

#include "predict/domain/decimal.hpp"
#include "predict/domain/question.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace predict {
namespace config {

// -----------------------------------------------------------------------------
// FeeSchedule — trading fee parameters
// -----------------------------------------------------------------------------
// Rates are fractions of the gross trade amount (0.001 == 0.1%). The fee is
// rounded up to `precision_digits` decimals and waived when it comes out
// below `min_fee_amount`. `referrer_share` is the fraction of the fee
// credited to the trader's referrer, if they have one.
// -----------------------------------------------------------------------------
struct FeeSchedule {
  Decimal buy_rate{Decimal::fromRaw(100'000)};        // 0.001
  Decimal sell_rate{Decimal::fromRaw(100'000)};       // 0.001
  Decimal referrer_share{Decimal::fromRaw(50'000'000)};  // 0.5
  int precision_digits{2};
  Decimal min_fee_amount{Decimal::zero()};
};

// Seed and price-band parameters applied when a market is materialised.
struct MarketDefaults {
  Decimal seed_liquidity{Decimal::fromRaw(1000 * Decimal::kScale)};
  Decimal min_price{Decimal::fromRaw(10'000)};        // 0.0001
  Decimal max_price{Decimal::fromRaw(99'990'000)};    // 0.9999
};

// Optimistic-concurrency retry budget for one request.
struct RetryPolicy {
  int max_attempts{5};
  int backoff_ms{1};   // Multiplied by the attempt number between retries
};

// Endpoints and threading for the command/telemetry server. An empty
// endpoint disables the server (tests drive the engine directly).
struct ServerConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string telemetry_endpoint{"tcp://127.0.0.1:5557"};
  std::size_t worker_threads{4};
  int request_timeout_ms{2000};
};

// -----------------------------------------------------------------------------
// EngineConfig — everything the engine reads at startup
// -----------------------------------------------------------------------------
//
// @brief  Plain aggregate of the sections above plus the question catalog
//         bootstrap list. Every field has a usable default.
//
// @details
// JSON layout (every section and key optional; decimals as strings or
// numbers):
//
//   {
//     "fees":    { "buy_rate": "0.001", "sell_rate": "0.001",
//                  "referrer_share": "0.5", "precision_digits": 2,
//                  "min_fee_amount": "0" },
//     "markets": { "seed_liquidity": "1000", "min_price": "0.0001",
//                  "max_price": "0.9999" },
//     "retry":   { "max_attempts": 5, "backoff_ms": 1 },
//     "server":  { "command_endpoint": "tcp://127.0.0.1:5556",
//                  "telemetry_endpoint": "tcp://127.0.0.1:5557",
//                  "worker_threads": 4, "request_timeout_ms": 2000 },
//     "questions": [ { "id": "q-1", "number": 1, "text": "...",
//                      "status": "active",
//                      "resolution_time_ms": 1767225600000 } ]
//   }
// -----------------------------------------------------------------------------
struct EngineConfig {
  FeeSchedule fees;
  MarketDefaults markets;
  RetryPolicy retry;
  ServerConfig server;
  std::vector<domain::Question> questions;
};

// Parses the JSON text above. Throws std::invalid_argument on malformed JSON,
// wrong field types, or values outside their valid range.
EngineConfig parseEngineConfig(const std::string& json_text);

// Reads and parses a config file. Throws std::runtime_error if the file
// cannot be opened, std::invalid_argument as parseEngineConfig().
EngineConfig loadEngineConfig(const std::string& path);

// Range checks shared by the parser and by code that builds configs by hand.
// Throws std::invalid_argument naming the offending field.
void validateEngineConfig(const EngineConfig& config);

}  // namespace config
}  // namespace predict
