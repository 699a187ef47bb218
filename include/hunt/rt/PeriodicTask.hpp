#pragma once

#include "hunt/rt/IStoppable.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace hunt::rt {

// Runs fn every period on its own thread until stopped. A throwing fn is
// logged and the loop keeps going. stop() interrupts the wait.
class PeriodicTask final : public IStoppable {
public:
  PeriodicTask(std::string name, std::chrono::milliseconds period, std::function<void()> fn);
  ~PeriodicTask() override;

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void start();
  void stop() override;

  bool running() const { return running_.load(std::memory_order_acquire); }
  uint64_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
  uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }

private:
  void loop();

  std::string _name;
  std::chrono::milliseconds _period;
  std::function<void()> _fn;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> failures_{0};
  std::mutex mx_;
  std::condition_variable cv_;
  std::thread t_;
};

} // namespace hunt::rt
