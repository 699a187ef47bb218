#pragma once

#include "hunt/Time.hpp"

#include <cstdint>
#include <string>

namespace hunt {

enum class SignalAction : uint8_t { Buy, Sell, MarketMake };
enum class OrderType : uint8_t { Market, Limit };

const char* actionName(SignalAction a);
const char* orderTypeName(OrderType t);

// A trade proposal. Created by one tactic, consumed once by the risk gate.
struct Signal {
  std::string  strategy;
  std::string  instrument;
  SignalAction action = SignalAction::Buy;
  OrderType    type   = OrderType::Market;
  double       price  = 0.0;        // reference / limit price (bid leg for MarketMake)
  double       size   = 0.0;
  double       confidence = 0.0;    // [0, 1]
  std::string  reason;
  double       counterPrice = 0.0;  // ask leg for MarketMake
  TimePoint    created{};

  double notional() const { return price * size; }
};

} // namespace hunt
