#pragma once

#include "predict/events/trade_events.hpp"

#include <variant>

namespace predict {

// Closed set of telemetry events carried by the EventBus. std::visit or
// std::get_if dispatch on the concrete type.
using Event = std::variant<
    TradeSettledEvent,
    TradeRejectedEvent,
    MarketResolvedEvent>;

}  // namespace predict
