// =============================================================================
// position_book_test.cpp
// =============================================================================
// Unit tests for predict::PositionBook.
//
// Validates:
//   - credit() opens a position, then merges at a weighted average price
//   - debit() measures realised P&L against the average price
//   - Partial debits keep the average; full debits and dust close the row
//   - PositionNotFound / InsufficientShares / non-positive sizes
// =============================================================================

#include "predict/domain/trade_errors.hpp"
#include "predict/ledger/position_book.hpp"
#include "predict/storage/in_memory_store.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

using predict::Decimal;
using predict::PositionBook;
using predict::PositionDebit;
using predict::domain::Outcome;
using predict::domain::Position;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

}  // namespace

class PositionBookTest : public ::testing::Test {
 protected:
  void SetUp() override { uow = store.begin(); }

  predict::IPositionRepository& repo() { return uow->positions(); }

  predict::InMemoryStore store;
  std::unique_ptr<predict::IUnitOfWork> uow;
  PositionBook book;
};

// -----------------------------------------------------------------------------
// 1. Weighted average: 100 @ 0.40 + 50 @ 0.70 = 150 @ 0.50.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, CreditMergesAtWeightedAverage) {
  Position first =
      book.credit(repo(), "alice", "q-1", Outcome::Yes, D("100"), D("0.4"));
  EXPECT_EQ(first.shares, D("100"));
  EXPECT_EQ(first.avg_price, D("0.4"));

  Position merged =
      book.credit(repo(), "alice", "q-1", Outcome::Yes, D("50"), D("0.7"));
  EXPECT_EQ(merged.shares, D("150"));
  EXPECT_EQ(merged.avg_price, D("0.5"));

  // The other side is a separate holding.
  book.credit(repo(), "alice", "q-1", Outcome::No, D("10"), D("0.6"));
  EXPECT_EQ(book.holdings(repo(), "alice", "q-1").size(), 2u);
  EXPECT_TRUE(book.holdings(repo(), "bob", "q-1").empty());
}

// -----------------------------------------------------------------------------
// 2. Selling 40 of 100 @ 0.50 at 0.65 realises 40 * 0.15 = 6.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, PartialDebitRealisesPnL) {
  book.credit(repo(), "alice", "q-1", Outcome::Yes, D("100"), D("0.5"));

  PositionDebit debit =
      book.debit(repo(), "alice", "q-1", Outcome::Yes, D("40"), D("0.65"));

  EXPECT_EQ(debit.realized_pnl, D("6"));
  EXPECT_EQ(debit.remaining_shares, D("60"));
  EXPECT_FALSE(debit.closed);
  EXPECT_EQ(debit.avg_price, D("0.5"));

  auto held = book.find(repo(), "alice", "q-1", Outcome::Yes);
  ASSERT_TRUE(held.has_value());
  EXPECT_EQ(held->shares, D("60"));
  EXPECT_EQ(held->avg_price, D("0.5"));  // Unchanged by a sale.
}

TEST_F(PositionBookTest, LossIsNegativePnL) {
  book.credit(repo(), "alice", "q-1", Outcome::No, D("10"), D("0.6"));
  PositionDebit debit =
      book.debit(repo(), "alice", "q-1", Outcome::No, D("10"), D("0.45"));
  EXPECT_EQ(debit.realized_pnl, D("-1.5"));
}

// -----------------------------------------------------------------------------
// 3. Selling everything, or leaving only dust, removes the row.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, FullDebitClosesPosition) {
  book.credit(repo(), "alice", "q-1", Outcome::Yes, D("10"), D("0.5"));

  PositionDebit debit =
      book.debit(repo(), "alice", "q-1", Outcome::Yes, D("10"), D("0.5"));

  EXPECT_TRUE(debit.closed);
  EXPECT_TRUE(debit.remaining_shares.isZero());
  EXPECT_FALSE(book.find(repo(), "alice", "q-1", Outcome::Yes).has_value());
}

TEST_F(PositionBookTest, DustRemainderClosesPosition) {
  book.credit(repo(), "alice", "q-1", Outcome::Yes, D("10"), D("0.5"));

  PositionDebit debit = book.debit(repo(), "alice", "q-1", Outcome::Yes,
                                   D("9.99999999"), D("0.5"));

  EXPECT_TRUE(debit.closed);
  EXPECT_FALSE(book.find(repo(), "alice", "q-1", Outcome::Yes).has_value());
}

// -----------------------------------------------------------------------------
// 4. Rejections.
// -----------------------------------------------------------------------------
TEST_F(PositionBookTest, DebitErrors) {
  EXPECT_THROW(
      book.debit(repo(), "alice", "q-1", Outcome::Yes, D("1"), D("0.5")),
      predict::PositionNotFoundError);

  book.credit(repo(), "alice", "q-1", Outcome::Yes, D("5"), D("0.5"));
  try {
    book.debit(repo(), "alice", "q-1", Outcome::Yes, D("6"), D("0.5"));
    FAIL() << "expected InsufficientSharesError";
  } catch (const predict::InsufficientSharesError& e) {
    EXPECT_EQ(e.contextValue("held"), std::optional<std::string>("5"));
    EXPECT_EQ(e.contextValue("requested"), std::optional<std::string>("6"));
  }

  EXPECT_THROW(
      book.debit(repo(), "alice", "q-1", Outcome::Yes, D("0"), D("0.5")),
      predict::InvalidTradeSizeError);
  EXPECT_THROW(
      book.credit(repo(), "alice", "q-1", Outcome::Yes, D("-1"), D("0.5")),
      predict::InvalidTradeSizeError);
}
