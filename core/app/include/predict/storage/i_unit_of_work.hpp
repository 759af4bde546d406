#pragma once

#include "predict/domain/market.hpp"
#include "predict/domain/position.hpp"
#include "predict/domain/wallet.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// Repository interfaces
// -----------------------------------------------------------------------------
// Each repository is a view onto one table, scoped to the unit of work that
// handed it out. Reads see the unit's own staged writes first. Writes are
// staged and only become visible to other units on commit().
// -----------------------------------------------------------------------------
class IMarketRepository {
 public:
  virtual ~IMarketRepository() = default;

  virtual std::optional<domain::Market> find(const std::string& market_id) = 0;

  virtual void save(const domain::Market& market) = 0;
};

class IPositionRepository {
 public:
  virtual ~IPositionRepository() = default;

  virtual std::optional<domain::Position> find(const domain::PositionKey& key) = 0;

  // Every side the user holds in the market (zero, one or two rows).
  virtual std::vector<domain::Position> listForMarket(
      const std::string& user_id, const std::string& market_id) = 0;

  virtual void save(const domain::Position& position) = 0;

  virtual void remove(const domain::PositionKey& key) = 0;
};

class IWalletRepository {
 public:
  virtual ~IWalletRepository() = default;

  virtual std::optional<domain::WalletAccount> findAccount(
      const std::string& user_id) = 0;

  virtual void saveAccount(const domain::WalletAccount& account) = 0;

  // Staged until commit; the store assigns the transaction id then.
  virtual void appendTransaction(domain::Transaction transaction) = 0;

  // Committed history followed by this unit's staged entries, oldest first.
  virtual std::vector<domain::Transaction> transactions(
      const std::string& user_id) = 0;
};

// -----------------------------------------------------------------------------
// IUnitOfWork — one atomic, isolated batch of reads and writes
// -----------------------------------------------------------------------------
//
// @brief  Obtained from ITransactionalStore::begin(). Either commit() applies
//         every staged write or none of them become visible.
//
// @details
// commit() throws ConcurrencyConflictError when another unit committed a
// change to a row this unit read. Any other exception from commit() means
// the store itself failed. In both cases nothing was applied and the unit
// is closed.
//
// A unit that is destroyed without commit() rolls back. rollback() is
// idempotent. Using a repository after the unit closed throws
// std::logic_error.
//
// Thread model:
//   A unit belongs to the thread that began it. Different units may run on
//   different threads concurrently.
// -----------------------------------------------------------------------------
class IUnitOfWork {
 public:
  virtual ~IUnitOfWork() = default;

  virtual IMarketRepository& markets() = 0;
  virtual IPositionRepository& positions() = 0;
  virtual IWalletRepository& wallets() = 0;

  virtual void commit() = 0;
  virtual void rollback() = 0;
};

class ITransactionalStore {
 public:
  virtual ~ITransactionalStore() = default;

  virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

}  // namespace predict
