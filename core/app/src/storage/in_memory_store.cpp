#include "predict/storage/in_memory_store.hpp"

#include "predict/domain/trade_errors.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace predict {

namespace {

std::string describeKey(const std::string& key) { return key; }

std::string describeKey(const domain::PositionKey& key) {
  return key.user_id + "/" + key.market_id + "/" +
         domain::outcomeToString(key.side);
}

}  // namespace

// -----------------------------------------------------------------------------
// InMemoryUnitOfWork
// -----------------------------------------------------------------------------
// Staged state per table: the first version seen for every key read, and
// the pending value for every key written (nullopt marks a delete).
// -----------------------------------------------------------------------------
class InMemoryUnitOfWork final : public IUnitOfWork {
 public:
  explicit InMemoryUnitOfWork(InMemoryStore& store)
      : store_(store), markets_(*this), positions_(*this), wallets_(*this) {}

  ~InMemoryUnitOfWork() override { rollback(); }

  InMemoryUnitOfWork(const InMemoryUnitOfWork&) = delete;
  InMemoryUnitOfWork& operator=(const InMemoryUnitOfWork&) = delete;

  IMarketRepository& markets() override { return markets_; }
  IPositionRepository& positions() override { return positions_; }
  IWalletRepository& wallets() override { return wallets_; }

  void commit() override;
  void rollback() override;

 private:
  template <typename Key, typename Row>
  struct Table {
    std::map<Key, std::uint64_t> read_versions;
    std::map<Key, std::optional<Row>> writes;
  };

  // --- Repository views ------------------------------------------------------
  class MarketRepo final : public IMarketRepository {
   public:
    explicit MarketRepo(InMemoryUnitOfWork& uow) : uow_(uow) {}

    std::optional<domain::Market> find(const std::string& market_id) override {
      return uow_.readMarket(market_id);
    }
    void save(const domain::Market& market) override {
      uow_.requireOpen();
      uow_.market_table_.writes[market.id] = market;
    }

   private:
    InMemoryUnitOfWork& uow_;
  };

  class PositionRepo final : public IPositionRepository {
   public:
    explicit PositionRepo(InMemoryUnitOfWork& uow) : uow_(uow) {}

    std::optional<domain::Position> find(
        const domain::PositionKey& key) override {
      return uow_.readPosition(key);
    }
    std::vector<domain::Position> listForMarket(
        const std::string& user_id, const std::string& market_id) override {
      std::vector<domain::Position> result;
      for (auto side : {domain::Outcome::Yes, domain::Outcome::No}) {
        if (auto p = uow_.readPosition({user_id, market_id, side})) {
          result.push_back(std::move(*p));
        }
      }
      return result;
    }
    void save(const domain::Position& position) override {
      uow_.requireOpen();
      uow_.position_table_.writes[domain::keyOf(position)] = position;
    }
    void remove(const domain::PositionKey& key) override {
      uow_.requireOpen();
      uow_.position_table_.writes[key] = std::nullopt;
    }

   private:
    InMemoryUnitOfWork& uow_;
  };

  class WalletRepo final : public IWalletRepository {
   public:
    explicit WalletRepo(InMemoryUnitOfWork& uow) : uow_(uow) {}

    std::optional<domain::WalletAccount> findAccount(
        const std::string& user_id) override {
      return uow_.readAccount(user_id);
    }
    void saveAccount(const domain::WalletAccount& account) override {
      uow_.requireOpen();
      uow_.account_table_.writes[account.user_id] = account;
    }
    void appendTransaction(domain::Transaction transaction) override {
      uow_.requireOpen();
      uow_.staged_transactions_.push_back(std::move(transaction));
    }
    std::vector<domain::Transaction> transactions(
        const std::string& user_id) override {
      return uow_.readTransactions(user_id);
    }

   private:
    InMemoryUnitOfWork& uow_;
  };

  void requireOpen() const {
    if (!open_) {
      throw std::logic_error("InMemoryUnitOfWork: unit of work is closed");
    }
  }

  // Staged value first, then the committed row under a shared lock. The
  // first committed version seen for a key is the one validated at commit.
  template <typename Key, typename Row, typename Committed>
  std::optional<Row> readRow(Table<Key, Row>& table, const Committed& committed,
                             const Key& key) {
    requireOpen();
    if (auto w = table.writes.find(key); w != table.writes.end()) {
      return w->second;
    }

    std::shared_lock lock(store_.mutex_);
    auto it = committed.find(key);
    std::uint64_t version = (it == committed.end()) ? 0 : it->second.version;
    table.read_versions.emplace(key, version);
    if (it == committed.end()) {
      return std::nullopt;
    }
    return it->second.row;
  }

  std::optional<domain::Market> readMarket(const std::string& id) {
    return readRow(market_table_, store_.markets_, id);
  }
  std::optional<domain::Position> readPosition(const domain::PositionKey& key) {
    return readRow(position_table_, store_.positions_, key);
  }
  std::optional<domain::WalletAccount> readAccount(const std::string& id) {
    return readRow(account_table_, store_.accounts_, id);
  }

  std::vector<domain::Transaction> readTransactions(const std::string& user_id) {
    requireOpen();
    std::vector<domain::Transaction> result = store_.transactions(user_id);
    for (const auto& tx : staged_transactions_) {
      if (tx.user_id == user_id) {
        result.push_back(tx);
      }
    }
    return result;
  }

  // Returns the first key whose committed version moved since it was read.
  // Caller holds the exclusive lock.
  template <typename Key, typename Row, typename Committed>
  static std::optional<std::string> findStale(const Table<Key, Row>& table,
                                              const Committed& committed) {
    for (const auto& [key, seen] : table.read_versions) {
      auto it = committed.find(key);
      std::uint64_t current = (it == committed.end()) ? 0 : it->second.version;
      if (current != seen) {
        return describeKey(key);
      }
    }
    return std::nullopt;
  }

  // Caller holds the exclusive lock.
  template <typename Key, typename Row, typename Committed>
  static void applyWrites(Table<Key, Row>& table, Committed& committed,
                          std::uint64_t version) {
    for (auto& [key, value] : table.writes) {
      if (value.has_value()) {
        committed[key] = {std::move(*value), version};
      } else {
        committed.erase(key);
      }
    }
  }

  void clear() {
    market_table_ = {};
    position_table_ = {};
    account_table_ = {};
    staged_transactions_.clear();
  }

  InMemoryStore& store_;
  MarketRepo markets_;
  PositionRepo positions_;
  WalletRepo wallets_;

  Table<std::string, domain::Market> market_table_;
  Table<domain::PositionKey, domain::Position> position_table_;
  Table<std::string, domain::WalletAccount> account_table_;
  std::vector<domain::Transaction> staged_transactions_;

  bool open_{true};
};

// -----------------------------------------------------------------------------
// commit(): validate read versions, then apply everything or nothing
// -----------------------------------------------------------------------------
void InMemoryUnitOfWork::commit() {
  requireOpen();
  open_ = false;

  std::optional<std::string> stale;
  {
    std::unique_lock lock(store_.mutex_);

    stale = findStale(market_table_, store_.markets_);
    if (!stale) {
      stale = findStale(position_table_, store_.positions_);
    }
    if (!stale) {
      stale = findStale(account_table_, store_.accounts_);
    }

    if (!stale) {
      const std::uint64_t version = ++store_.commit_seq_;
      applyWrites(market_table_, store_.markets_, version);
      applyWrites(position_table_, store_.positions_, version);
      applyWrites(account_table_, store_.accounts_, version);
      for (auto& tx : staged_transactions_) {
        tx.id = "TX-" + std::to_string(store_.next_tx_id_++);
        store_.transactions_.push_back(std::move(tx));
      }
    }
  }

  clear();
  if (stale) {
    throw ConcurrencyConflictError("Row changed by a concurrent commit",
                                   {{"row", *stale}});
  }
}

void InMemoryUnitOfWork::rollback() {
  if (!open_) {
    return;
  }
  open_ = false;
  clear();
}

// -----------------------------------------------------------------------------
// InMemoryStore
// -----------------------------------------------------------------------------
std::unique_ptr<IUnitOfWork> InMemoryStore::begin() {
  return std::make_unique<InMemoryUnitOfWork>(*this);
}

std::optional<domain::Market> InMemoryStore::market(
    const std::string& market_id) const {
  std::shared_lock lock(mutex_);
  auto it = markets_.find(market_id);
  if (it == markets_.end()) {
    return std::nullopt;
  }
  return it->second.row;
}

std::optional<domain::WalletAccount> InMemoryStore::account(
    const std::string& user_id) const {
  std::shared_lock lock(mutex_);
  auto it = accounts_.find(user_id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second.row;
}

std::vector<domain::Position> InMemoryStore::positions() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [key, entry] : positions_) {
    result.push_back(entry.row);
  }
  return result;
}

std::vector<domain::Transaction> InMemoryStore::transactions(
    const std::string& user_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Transaction> result;
  for (const auto& tx : transactions_) {
    if (tx.user_id == user_id) {
      result.push_back(tx);
    }
  }
  return result;
}

std::uint64_t InMemoryStore::commitCount() const {
  std::shared_lock lock(mutex_);
  return commit_seq_;
}

}  // namespace predict
