#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace predict {

// -----------------------------------------------------------------------------
// SequenceGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids to concurrent trade workers. Used for trade
//         ids ("T-1", "T-2", ...) and telemetry sequence numbers.
//
// @details
// Starts at 1; 0 is never issued so it can mean "unset". fetch_add with
// relaxed ordering is enough because only uniqueness is required, not
// ordering against other memory.
//
// Ownership:
//   Owned by TradingEngine as a value member and passed by reference.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  explicit SequenceGenerator(std::string prefix = "")
      : prefix_(std::move(prefix)) {}

  // Non-copyable, non-movable: a copy would issue duplicate ids.
  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // next_id() rendered with the prefix, e.g. "T-17".
  std::string next_label() { return prefix_ + std::to_string(next_id()); }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace predict
