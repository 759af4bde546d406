// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for predict::config (EngineConfig parsing and validation).
//
// Validates:
//   - An empty object yields the documented defaults
//   - Every section is read; decimals as strings or JSON numbers
//   - Question bootstrap entries, including optional fields
//   - Out-of-range values and wrong types raise std::invalid_argument
//   - loadEngineConfig() on a missing file raises std::runtime_error
// =============================================================================

#include "predict/config/engine_config.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

using predict::Decimal;
using predict::config::EngineConfig;
using predict::config::parseEngineConfig;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

}  // namespace

// -----------------------------------------------------------------------------
// 1. Defaults
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, EmptyObjectGivesDefaults) {
  EngineConfig c = parseEngineConfig("{}");

  EXPECT_EQ(c.fees.buy_rate, D("0.001"));
  EXPECT_EQ(c.fees.sell_rate, D("0.001"));
  EXPECT_EQ(c.fees.referrer_share, D("0.5"));
  EXPECT_EQ(c.fees.precision_digits, 2);
  EXPECT_TRUE(c.fees.min_fee_amount.isZero());
  EXPECT_EQ(c.markets.seed_liquidity, D("1000"));
  EXPECT_EQ(c.markets.min_price, D("0.0001"));
  EXPECT_EQ(c.markets.max_price, D("0.9999"));
  EXPECT_EQ(c.retry.max_attempts, 5);
  EXPECT_EQ(c.server.worker_threads, 4u);
  EXPECT_FALSE(c.server.command_endpoint.empty());
  EXPECT_TRUE(c.questions.empty());
}

// -----------------------------------------------------------------------------
// 2. A full document
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, ParsesEverySection) {
  EngineConfig c = parseEngineConfig(R"({
    "fees":    { "buy_rate": "0.02", "sell_rate": 0.015,
                 "referrer_share": "0.25", "precision_digits": 4,
                 "min_fee_amount": "0.01" },
    "markets": { "seed_liquidity": 2000, "min_price": "0.01",
                 "max_price": "0.99" },
    "retry":   { "max_attempts": 9, "backoff_ms": 0 },
    "server":  { "command_endpoint": "", "telemetry_endpoint": "",
                 "worker_threads": 2, "request_timeout_ms": 500 },
    "questions": [
      { "id": "q-1", "number": 1, "text": "Rain?", "status": "active",
        "resolution_time_ms": 1767225600000 },
      { "id": "q-2", "status": "cancelled", "resolution_time_ms": null }
    ]
  })");

  EXPECT_EQ(c.fees.buy_rate, D("0.02"));
  EXPECT_EQ(c.fees.sell_rate, D("0.015"));
  EXPECT_EQ(c.fees.referrer_share, D("0.25"));
  EXPECT_EQ(c.fees.precision_digits, 4);
  EXPECT_EQ(c.fees.min_fee_amount, D("0.01"));
  EXPECT_EQ(c.markets.seed_liquidity, D("2000"));
  EXPECT_EQ(c.markets.min_price, D("0.01"));
  EXPECT_EQ(c.retry.max_attempts, 9);
  EXPECT_EQ(c.retry.backoff_ms, 0);
  EXPECT_TRUE(c.server.command_endpoint.empty());
  EXPECT_EQ(c.server.worker_threads, 2u);
  EXPECT_EQ(c.server.request_timeout_ms, 500);

  ASSERT_EQ(c.questions.size(), 2u);
  EXPECT_EQ(c.questions[0].id, "q-1");
  EXPECT_EQ(c.questions[0].number, 1);
  EXPECT_EQ(c.questions[0].resolution_time_ms,
            std::optional<std::int64_t>(1767225600000));
  EXPECT_EQ(c.questions[1].status, predict::domain::QuestionStatus::Cancelled);
  EXPECT_EQ(c.questions[1].number, 0);
  EXPECT_FALSE(c.questions[1].resolution_time_ms.has_value());
}

// -----------------------------------------------------------------------------
// 3. Rejections
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, RejectsMalformedDocuments) {
  EXPECT_THROW(parseEngineConfig("{"), std::invalid_argument);
  EXPECT_THROW(parseEngineConfig("[]"), std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"fees": 3})"), std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"fees": {"buy_rate": "cheap"}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"retry": {"max_attempts": "many"}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"questions": {}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"questions": [{"number": 1}]})"),
               std::invalid_argument);
  EXPECT_THROW(
      parseEngineConfig(R"({"questions": [{"id": "q", "status": "paused"}]})"),
      std::invalid_argument);
}

TEST(EngineConfigTest, RejectsOutOfRangeValues) {
  EXPECT_THROW(parseEngineConfig(R"({"fees": {"buy_rate": "1"}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"fees": {"sell_rate": "-0.01"}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"fees": {"referrer_share": "1.5"}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"fees": {"precision_digits": 9}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"markets": {"min_price": "0.6",
                                                  "max_price": "0.4"}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"markets": {"seed_liquidity": "0"}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"retry": {"max_attempts": 0}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"server": {"worker_threads": 0}})"),
               std::invalid_argument);
  EXPECT_THROW(parseEngineConfig(R"({"server": {"request_timeout_ms": 0}})"),
               std::invalid_argument);
}

// A config assembled in code goes through the same checks.
TEST(EngineConfigTest, ValidateHandBuiltConfig) {
  EngineConfig c;
  EXPECT_NO_THROW(predict::config::validateEngineConfig(c));

  c.retry.backoff_ms = -1;
  EXPECT_THROW(predict::config::validateEngineConfig(c), std::invalid_argument);
}

TEST(EngineConfigTest, MissingFileIsRuntimeError) {
  EXPECT_THROW(predict::config::loadEngineConfig(
                   "/nonexistent/predict_engine_config.json"),
               std::runtime_error);
}
