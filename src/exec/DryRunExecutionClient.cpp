#include "hunt/exec/DryRunExecutionClient.hpp"
#include "hunt/util/Logger.hpp"

namespace hunt {

using util::LogLevel;
using util::logger;

DryRunExecutionClient::DryRunExecutionClient(double balance) {
  bal_.total = balance;
  bal_.available = balance;
}

Result<std::string> DryRunExecutionClient::placeOrder(const OrderRequest& req) {
  if (req.size <= 0.0) return Error{ "order size must be positive", req.instrument };
  if (req.type == OrderType::Limit && !req.price) {
    return Error{ "limit order without price", req.instrument };
  }

  const std::string id = "dry-" + std::to_string(nextId_.fetch_add(1, std::memory_order_relaxed));
  {
    std::lock_guard<std::mutex> lk(mx_);
    open_[req.instrument].push_back(req);
  }
  placed_.fetch_add(1, std::memory_order_relaxed);

  logger().log(LogLevel::Info, "exec.dry_run.place",
               { {"id", id}, {"inst", req.instrument}, {"side", orderSideName(req.side)},
                 {"type", orderTypeName(req.type)}, {"size", util::fmt(req.size)},
                 {"price", req.price ? util::fmt(*req.price) : std::string("mkt")},
                 {"tag", req.tag} });
  return id;
}

Result<size_t> DryRunExecutionClient::cancelAll(const std::string& instrument) {
  cancelCalls_.fetch_add(1, std::memory_order_relaxed);
  size_t n = 0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = open_.find(instrument);
    if (it != open_.end()) {
      n = it->second.size();
      open_.erase(it);
    }
  }
  logger().log(LogLevel::Info, "exec.dry_run.cancel_all",
               { {"inst", instrument}, {"cancelled", std::to_string(n)} });
  return n;
}

Result<Balance> DryRunExecutionClient::balance() {
  std::lock_guard<std::mutex> lk(mx_);
  return bal_;
}

Result<std::vector<Position>> DryRunExecutionClient::positions() {
  std::vector<Position> out;
  std::lock_guard<std::mutex> lk(mx_);
  for (const auto& kv : positions_) out.push_back(kv.second);
  return out;
}

double DryRunExecutionClient::averageLatencyMs() const {
  std::lock_guard<std::mutex> lk(mx_);
  return latencyMs_;
}

void DryRunExecutionClient::setBalance(double total, double available) {
  std::lock_guard<std::mutex> lk(mx_);
  bal_.total = total;
  bal_.available = available;
}

void DryRunExecutionClient::setPosition(const Position& p) {
  std::lock_guard<std::mutex> lk(mx_);
  if (p.size == 0.0) positions_.erase(p.instrument);
  else               positions_[p.instrument] = p;
}

void DryRunExecutionClient::setLatencyMs(double ms) {
  std::lock_guard<std::mutex> lk(mx_);
  latencyMs_ = ms;
}

size_t DryRunExecutionClient::openOrders(const std::string& instrument) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto it = open_.find(instrument);
  return it == open_.end() ? 0 : it->second.size();
}

} // namespace hunt
