#pragma once

#include "hunt/util/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hunt::rt {

class ShutdownCoordinator {
public:
  // Lower order runs earlier; higher order runs later.
  void registerStep(std::string name, int order, std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mx_);
    steps_.push_back({std::move(name), order, std::move(fn)});
    sorted_ = false;
  }

  // Idempotent stop: each step executed once, in ascending order. A failing
  // step is logged and the remaining steps still run.
  void stop() {
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return; // already stopping
    }
    std::vector<Step> run;
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (!sorted_) {
        std::stable_sort(steps_.begin(), steps_.end(), [](const Step& a, const Step& b){
          return a.order < b.order;
        });
        sorted_ = true;
      }
      run = steps_;
    }
    for (auto& s : run) {
      try {
        s.fn();
        util::logger().log(util::LogLevel::Debug, "shutdown.step", { {"step", s.name} });
      } catch (const std::exception& ex) {
        util::logger().log(util::LogLevel::Error, "shutdown.step_failed",
                           { {"step", s.name}, {"err", ex.what()} });
      }
    }
  }

  bool stopping() const { return stopping_.load(std::memory_order_acquire); }

  std::vector<std::string> stepNames() const {
    std::lock_guard<std::mutex> lk(mx_);
    std::vector<Step> copy = steps_;
    std::stable_sort(copy.begin(), copy.end(), [](const Step& a, const Step& b){ return a.order < b.order; });
    std::vector<std::string> out;
    for (const auto& s : copy) out.push_back(s.name);
    return out;
  }

private:
  struct Step { std::string name; int order; std::function<void()> fn; };
  std::vector<Step> steps_;
  std::atomic<bool> stopping_{false};
  mutable std::mutex mx_;
  bool sorted_{false};
};

} // namespace hunt::rt
