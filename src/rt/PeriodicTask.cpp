#include "hunt/rt/PeriodicTask.hpp"
#include "hunt/util/Logger.hpp"

#include <exception>

namespace hunt::rt {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds period, std::function<void()> fn)
  : _name(std::move(name)), _period(period), _fn(std::move(fn))
{}

PeriodicTask::~PeriodicTask() {
  stop();
}

void PeriodicTask::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return;
  t_ = std::thread([this] { loop(); });
}

void PeriodicTask::loop() {
  util::Logger::Scoped ctx({ {"task", _name} });
  std::unique_lock<std::mutex> lk(mx_);
  while (running_.load(std::memory_order_acquire)) {
    if (cv_.wait_for(lk, _period, [this] { return !running_.load(std::memory_order_acquire); })) break;
    lk.unlock();
    try {
      if (_fn) _fn();
      ticks_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception& ex) {
      failures_.fetch_add(1, std::memory_order_relaxed);
      util::logger().log(util::LogLevel::Error, "periodic.tick_failed", { {"err", ex.what()} });
    }
    lk.lock();
  }
}

void PeriodicTask::stop() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    running_.store(false, std::memory_order_release);
  }
  cv_.notify_all();
  if (!t_.joinable()) return;
  if (t_.get_id() == std::this_thread::get_id()) t_.detach();   // stopped from inside fn
  else t_.join();
}

} // namespace hunt::rt
