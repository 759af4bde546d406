#include "predict/domain/trade_errors.hpp"

namespace predict {

const char* errorCodeToString(ErrorCode code) {
  using C = ErrorCode;
  switch (code) {
    case C::InsufficientFunds:   return "InsufficientFunds";
    case C::InsufficientShares:  return "InsufficientShares";
    case C::MarketResolved:      return "MarketResolved";
    case C::MarketExpired:       return "MarketExpired";
    case C::MarketNotFound:      return "MarketNotFound";
    case C::PositionNotFound:    return "PositionNotFound";
    case C::InvalidTradeSize:    return "InvalidTradeSize";
    case C::PriceOutOfBounds:    return "PriceOutOfBounds";
    case C::ConcurrencyConflict: return "ConcurrencyConflict";
    case C::TradeConflict:       return "TradeConflict";
    case C::AccountNotFound:     return "AccountNotFound";
    case C::AccountExists:       return "AccountExists";
    case C::CommitFailed:        return "CommitFailed";
    case C::InvalidRequest:      return "InvalidRequest";
  }
  return "Unknown";
}

TradeError::TradeError(ErrorCode code, const std::string& message,
                       ErrorContext context)
    : std::runtime_error(message),
      code_(code),
      context_(std::move(context)) {}

std::optional<std::string> TradeError::contextValue(
    std::string_view key) const {
  for (const auto& [k, v] : context_) {
    if (k == key) {
      return v;
    }
  }
  return std::nullopt;
}

}  // namespace predict
