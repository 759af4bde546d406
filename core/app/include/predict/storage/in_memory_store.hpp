#pragma once

#include "predict/storage/i_unit_of_work.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace predict {

class InMemoryUnitOfWork;

// -----------------------------------------------------------------------------
// InMemoryStore — versioned row store with optimistic units of work
// -----------------------------------------------------------------------------
//
// @brief  Reference ITransactionalStore used by the engine and the tests.
//         Holds markets, positions, wallet accounts and the transaction log.
//
// @details
// Every committed row carries the store-wide commit number that last wrote
// it. A unit of work remembers the version of each row it read (0 for a row
// that did not exist) and stages its writes privately. commit() takes the
// exclusive lock, checks every remembered version against the current one,
// and then either applies all staged writes under a fresh commit number or
// throws ConcurrencyConflictError without touching anything.
//
// Versions never repeat: a deleted row that is recreated gets a new commit
// number, so a stale reader cannot mistake it for the row it saw.
//
// Thread model:
//   Reads take a shared lock for the duration of one row lookup. Commits
//   take the exclusive lock for validation and apply only. Nothing else
//   (pricing, logging) runs under either lock.
//
// Ownership:
//   Owned by TradingEngine. Must outlive every unit of work it hands out.
// -----------------------------------------------------------------------------
class InMemoryStore final : public ITransactionalStore {
 public:
  InMemoryStore() = default;

  InMemoryStore(const InMemoryStore&) = delete;
  InMemoryStore& operator=(const InMemoryStore&) = delete;
  InMemoryStore(InMemoryStore&&) = delete;
  InMemoryStore& operator=(InMemoryStore&&) = delete;

  std::unique_ptr<IUnitOfWork> begin() override;

  // --- Committed snapshots ---------------------------------------------------
  std::optional<domain::Market> market(const std::string& market_id) const;
  std::optional<domain::WalletAccount> account(const std::string& user_id) const;
  std::vector<domain::Position> positions() const;
  std::vector<domain::Transaction> transactions(const std::string& user_id) const;

  // Number of successful commits so far.
  std::uint64_t commitCount() const;

 private:
  friend class InMemoryUnitOfWork;

  template <typename Row>
  struct Versioned {
    Row row;
    std::uint64_t version{0};
  };

  mutable std::shared_mutex mutex_;

  std::map<std::string, Versioned<domain::Market>> markets_;
  std::map<domain::PositionKey, Versioned<domain::Position>> positions_;
  std::map<std::string, Versioned<domain::WalletAccount>> accounts_;
  std::vector<domain::Transaction> transactions_;

  std::uint64_t commit_seq_{0};
  std::uint64_t next_tx_id_{1};
};

}  // namespace predict
