#include "hunt/util/Metrics.hpp"
#include "hunt/util/Logger.hpp"

#include <chrono>
#include <map>
#include <sstream>
#include <vector>

namespace hunt {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  // If already running, restart with new interval.
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  running_.store(false, std::memory_order_release);
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricRegistry::gauge(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  using namespace std::chrono;
  const auto period = seconds(intervalSeconds > 0 ? intervalSeconds : 10);
  const auto step   = milliseconds(100);

  auto next = steady_clock::now() + period;
  while (running_.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(step);
    if (steady_clock::now() < next) continue;
    next += period;

    // Sorted copies so consecutive reports line up.
    std::map<std::string, double> c;
    std::map<std::string, double> g;
    {
      std::lock_guard<std::mutex> lk(mu_);
      c.insert(counters_.begin(), counters_.end());
      g.insert(gauges_.begin(), gauges_.end());
    }
    if (c.empty() && g.empty()) continue;

    std::vector<Field> fields;
    fields.reserve(c.size() + g.size());
    for (auto& kv : c) fields.push_back({kv.first, fmt(kv.second)});
    for (auto& kv : g) fields.push_back({kv.first, fmt(kv.second)});
    logger().log(LogLevel::Info, "metrics", fields);
  }
}

} // namespace util
} // namespace hunt
