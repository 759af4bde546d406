#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace predict {

enum class ErrorCode {
  InsufficientFunds,
  InsufficientShares,
  MarketResolved,
  MarketExpired,
  MarketNotFound,
  PositionNotFound,
  InvalidTradeSize,
  PriceOutOfBounds,
  ConcurrencyConflict,
  TradeConflict,
  AccountNotFound,
  AccountExists,
  CommitFailed,
  InvalidRequest,
};

const char* errorCodeToString(ErrorCode code);

// Ordered key/value pairs describing the failing request, e.g.
// {"market_id", "m-1"}, {"requested", "100"}, {"balance", "40"}.
using ErrorContext = std::vector<std::pair<std::string, std::string>>;

// -----------------------------------------------------------------------------
// TradeError — base of every domain failure raised by the trading core
// -----------------------------------------------------------------------------
//
// @brief  A std::runtime_error that also carries a machine-readable code and
//         the context needed to explain the rejection to a client.
//
// @details
// Callers that only care about the category catch TradeError and switch on
// code(). Callers that care about one failure catch the concrete alias
// (InsufficientFundsError, ConcurrencyConflictError, ...).
//
// ConcurrencyConflict is internal: TradeCoordinator retries on it and turns
// exhaustion into TradeConflict. It never reaches a client.
// -----------------------------------------------------------------------------
class TradeError : public std::runtime_error {
 public:
  TradeError(ErrorCode code, const std::string& message,
             ErrorContext context = {});

  ErrorCode code() const noexcept { return code_; }
  const ErrorContext& context() const noexcept { return context_; }

  // First value recorded under `key`, if any.
  std::optional<std::string> contextValue(std::string_view key) const;

 private:
  ErrorCode code_;
  ErrorContext context_;
};

template <ErrorCode Code>
class CodedTradeError : public TradeError {
 public:
  explicit CodedTradeError(const std::string& message,
                           ErrorContext context = {})
      : TradeError(Code, message, std::move(context)) {}
};

using InsufficientFundsError = CodedTradeError<ErrorCode::InsufficientFunds>;
using InsufficientSharesError = CodedTradeError<ErrorCode::InsufficientShares>;
using MarketResolvedError = CodedTradeError<ErrorCode::MarketResolved>;
using MarketExpiredError = CodedTradeError<ErrorCode::MarketExpired>;
using MarketNotFoundError = CodedTradeError<ErrorCode::MarketNotFound>;
using PositionNotFoundError = CodedTradeError<ErrorCode::PositionNotFound>;
using InvalidTradeSizeError = CodedTradeError<ErrorCode::InvalidTradeSize>;
using PriceOutOfBoundsError = CodedTradeError<ErrorCode::PriceOutOfBounds>;
using ConcurrencyConflictError =
    CodedTradeError<ErrorCode::ConcurrencyConflict>;
using TradeConflictError = CodedTradeError<ErrorCode::TradeConflict>;
using AccountNotFoundError = CodedTradeError<ErrorCode::AccountNotFound>;
using AccountExistsError = CodedTradeError<ErrorCode::AccountExists>;
using CommitFailedError = CodedTradeError<ErrorCode::CommitFailed>;
using InvalidRequestError = CodedTradeError<ErrorCode::InvalidRequest>;

}  // namespace predict
