// =============================================================================
// trade_coordinator_concurrency_test.cpp
// =============================================================================
// Stress tests for TradeCoordinator under concurrent callers.
//
// Validates:
//   - Many threads buying on one fresh market: every trade either settles or
//     is rejected cleanly, never both and never half-applied
//   - No wallet balance goes below zero
//   - Market liquidity always equals yes_pool + no_pool
//   - Cash is conserved: balances + pool growth + fees = deposits
//
// Retries are generous so that conflicts resolve instead of surfacing as
// TradeConflictError; the test is about isolation, not back-pressure.
// =============================================================================

#include "predict/catalog/in_memory_question_catalog.hpp"
#include "predict/domain/trade_errors.hpp"
#include "predict/storage/in_memory_store.hpp"
#include "predict/time/simulation_time_provider.hpp"
#include "predict/trade/trade_coordinator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using predict::BuyRequest;
using predict::Decimal;
using predict::SellRequest;
using predict::domain::Outcome;
using predict::domain::Question;
using predict::domain::QuestionStatus;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

constexpr int kUsers = 8;
constexpr int kBuysPerUser = 15;

predict::config::FeeSchedule twoPercent() {
  predict::config::FeeSchedule s;
  s.buy_rate = D("0.02");
  s.sell_rate = D("0.02");
  return s;
}

}  // namespace

class TradeCoordinatorConcurrencyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (int u = 0; u < kUsers; ++u) {
      coordinator.openAccount(userName(u), D("100"), std::nullopt);
    }
  }

  static std::string userName(int u) { return "user-" + std::to_string(u); }

  predict::SimulationTimeProvider clock{1'000};
  predict::InMemoryQuestionCatalog catalog{std::vector<Question>{
      Question{"q-1", 1, "Will it rain?", QuestionStatus::Active,
               std::nullopt}}};
  predict::InMemoryStore store;
  predict::PricingCurve curve{predict::CurveLimits{D("0.0001"), D("0.9999")}};
  predict::FeeCalculator fees{twoPercent()};
  predict::MarketLedger market_ledger{catalog, clock,
                                      predict::config::MarketDefaults{}};
  predict::PositionBook position_book;
  predict::WalletLedger wallet_ledger{clock};
  predict::SequenceGenerator trade_ids{"T-"};
  predict::TradeCoordinator coordinator{
      store,         market_ledger, position_book,
      wallet_ledger, curve,         fees,
      clock,         trade_ids,     predict::config::RetryPolicy{10'000, 0}};
};

// -----------------------------------------------------------------------------
// 1. 8 users x 15 buys of $10 against a $100 balance: exactly 10 settle per
//    user, 5 are rejected for funds, and the books balance.
// Why: every user races the others for the same market row, starting from
//      a market that does not exist yet.
// -----------------------------------------------------------------------------
TEST_F(TradeCoordinatorConcurrencyTest, ConcurrentBuysKeepBooksBalanced) {
  std::atomic<int> settled{0};
  std::atomic<int> underfunded{0};
  std::atomic<int> unexpected{0};

  std::vector<std::thread> threads;
  for (int u = 0; u < kUsers; ++u) {
    threads.emplace_back([&, u] {
      const Outcome side = (u % 2 == 0) ? Outcome::Yes : Outcome::No;
      for (int i = 0; i < kBuysPerUser; ++i) {
        try {
          coordinator.buy(BuyRequest{userName(u), "q-1", side, D("10")});
          ++settled;
        } catch (const predict::InsufficientFundsError&) {
          ++underfunded;
        } catch (const predict::TradeError&) {
          ++unexpected;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(settled.load(), kUsers * 10);
  EXPECT_EQ(underfunded.load(), kUsers * 5);
  EXPECT_EQ(unexpected.load(), 0);

  for (int u = 0; u < kUsers; ++u) {
    auto account = store.account(userName(u));
    ASSERT_TRUE(account.has_value());
    EXPECT_TRUE(account->balance.isZero()) << userName(u);
    EXPECT_EQ(account->total_fees_paid, D("2"));
    // Deposit plus one transaction per settled buy.
    EXPECT_EQ(store.transactions(userName(u)).size(), 11u);
  }

  // 80 buys of $10 put 80 x 9.80 into the pools.
  auto market = store.market("q-1");
  ASSERT_TRUE(market.has_value());
  EXPECT_EQ(market->liquidity, D("1784"));
  EXPECT_EQ(market->liquidity, market->yes_pool + market->no_pool);
  EXPECT_EQ(market->yes_pool, D("892"));
  EXPECT_EQ(market->no_pool, D("892"));
}

// -----------------------------------------------------------------------------
// 2. Buyers and sellers interleave on both sides; the pool invariant and
//    non-negative balances hold throughout.
// -----------------------------------------------------------------------------
TEST_F(TradeCoordinatorConcurrencyTest, MixedBuysAndSellsKeepInvariants) {
  std::atomic<int> unexpected{0};

  std::vector<std::thread> threads;
  for (int u = 0; u < kUsers; ++u) {
    threads.emplace_back([&, u] {
      const Outcome side = (u % 2 == 0) ? Outcome::Yes : Outcome::No;
      for (int i = 0; i < 5; ++i) {
        try {
          auto bought =
              coordinator.buy(BuyRequest{userName(u), "q-1", side, D("10")});
          coordinator.sell(SellRequest{userName(u), "q-1",
                                       bought.shares_bought, side});
        } catch (const predict::TradeError&) {
          ++unexpected;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(unexpected.load(), 0);

  auto market = store.market("q-1");
  ASSERT_TRUE(market.has_value());
  EXPECT_EQ(market->liquidity, market->yes_pool + market->no_pool);

  for (int u = 0; u < kUsers; ++u) {
    auto account = store.account(userName(u));
    ASSERT_TRUE(account.has_value());
    EXPECT_FALSE(account->balance.isNegative());
  }
  EXPECT_TRUE(store.positions().empty());
}
