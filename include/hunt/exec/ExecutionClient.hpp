#pragma once

#include "hunt/Result.hpp"
#include "hunt/strategy/Signal.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hunt {

enum class OrderSide : uint8_t { Buy, Sell };

inline const char* orderSideName(OrderSide s) { return s == OrderSide::Buy ? "buy" : "sell"; }

struct OrderRequest {
  std::string instrument;
  OrderSide   side = OrderSide::Buy;
  OrderType   type = OrderType::Market;
  double      size = 0.0;
  std::optional<double> price;   // required for limit orders
  std::string tag;               // originating strategy
};

struct Balance {
  double total     = 0.0;
  double available = 0.0;
};

struct Position {
  std::string instrument;
  double size          = 0.0;   // signed contracts
  double notional      = 0.0;   // absolute quote value
  double avgPrice      = 0.0;
  double unrealizedPnl = 0.0;
};

// REST side of the exchange. The core calls it only after risk approval
// and treats every error as "not executed".
class ExecutionClient {
public:
  virtual ~ExecutionClient() = default;

  virtual Result<std::string> placeOrder(const OrderRequest& req) = 0;   // order id
  virtual Result<size_t> cancelAll(const std::string& instrument) = 0;   // orders cancelled
  virtual Result<Balance> balance() = 0;
  virtual Result<std::vector<Position>> positions() = 0;

  // Rolling request round-trip average; 0 before the first request.
  virtual double averageLatencyMs() const = 0;
};

} // namespace hunt
