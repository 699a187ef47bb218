#pragma once

#include "hunt/exec/ExecutionClient.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hunt {

// Paper execution: logs every call, never touches the network. Orders rest
// until cancelled; balance is whatever was configured or set.
class DryRunExecutionClient final : public ExecutionClient {
public:
  explicit DryRunExecutionClient(double balance = 10000.0);

  Result<std::string> placeOrder(const OrderRequest& req) override;
  Result<size_t> cancelAll(const std::string& instrument) override;
  Result<Balance> balance() override;
  Result<std::vector<Position>> positions() override;
  double averageLatencyMs() const override;

  void setBalance(double total, double available);
  void setPosition(const Position& p);
  void setLatencyMs(double ms);

  size_t openOrders(const std::string& instrument) const;
  uint64_t placed() const { return placed_.load(std::memory_order_relaxed); }
  uint64_t cancelCalls() const { return cancelCalls_.load(std::memory_order_relaxed); }

private:
  mutable std::mutex mx_;
  Balance bal_;
  std::map<std::string, Position> positions_;
  std::map<std::string, std::vector<OrderRequest>> open_;
  double latencyMs_ = 0.0;

  std::atomic<uint64_t> nextId_{1};
  std::atomic<uint64_t> placed_{0};
  std::atomic<uint64_t> cancelCalls_{0};
};

} // namespace hunt
