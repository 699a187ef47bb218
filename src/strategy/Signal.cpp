#include "hunt/strategy/Signal.hpp"

namespace hunt {

const char* actionName(SignalAction a) {
  switch (a) {
    case SignalAction::Buy:        return "buy";
    case SignalAction::Sell:       return "sell";
    case SignalAction::MarketMake: return "market_make";
  }
  return "buy";
}

const char* orderTypeName(OrderType t) {
  return t == OrderType::Market ? "market" : "limit";
}

} // namespace hunt
